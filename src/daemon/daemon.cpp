#include "hermit/daemon/daemon.hpp"

#include "hermit/common/json_util.hpp"
#include "hermit/gateway/client.hpp"
#include "hermit/health/health.hpp"
#include "hermit/observability/global.hpp"
#include "hermit/runtime/app.hpp"
#include "hermit/sandbox/policy.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace hermit::daemon {

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int /*sig*/) { g_stop_requested = true; }

} // namespace

Daemon::Daemon(const config::Config &config, sandbox::IProcessRunner *runner)
    : config_(config), runner_(runner) {
  if (runner_ == nullptr) {
    owned_runner_ = std::make_unique<sandbox::PosixProcessRunner>();
    runner_ = owned_runner_.get();
  }
}

Daemon::~Daemon() { stop(); }

common::Status Daemon::start(const DaemonOptions &options) {
  if (running_) {
    return common::Status::error("daemon already running");
  }

  runtime::RuntimeContext context(config_);
  auto layout = context.ensure_layout();
  if (!layout.ok()) {
    return layout;
  }

  health::mark_component_starting("store");
  auto opened = context.open_store();
  if (!opened.ok()) {
    health::mark_component_error("store", opened.error());
    return common::Status::error("store unavailable: " + opened.error());
  }
  store_ = std::move(opened.value());
  health::mark_component_ok("store");

  // A live socket means a live daemon, whatever the pid file says.
  if (gateway::IpcClient(config_.daemon.socket_path).daemon_reachable()) {
    teardown();
    return common::Status::error("another hermit daemon is listening on " +
                                 config_.daemon.socket_path);
  }

  pid_file_ = std::make_unique<PidFile>(config_.daemon.pid_path);
  auto pid_status = pid_file_->acquire(options.force);
  if (!pid_status.ok()) {
    teardown();
    return pid_status;
  }

  invoker_ = std::make_unique<agent::AgentInvoker>(config_, *runner_);
  session_runner_ =
      std::make_unique<agent::SessionRunner>(config_, *store_, locks_, *invoker_);
  handler_ = std::make_unique<gateway::RequestHandler>(config_, *store_, *session_runner_,
                                                       *invoker_);
  server_ = std::make_unique<gateway::IpcServer>(*handler_);
  auto listening =
      server_->start(gateway::IpcServerOptions{.socket_path = config_.daemon.socket_path});
  if (!listening.ok()) {
    teardown();
    return listening;
  }

  auto seeded = sandbox::seed_agent_config(config_);
  if (!seeded.ok()) {
    std::cerr << "[daemon] agent config not seeded: " << seeded.error() << "\n";
    observability::record_error("daemon", seeded.error());
  }

  auto busy_policy = agent::parse_busy_policy(config_.daemon.scheduled_busy_policy);
  scheduler_ = std::make_unique<scheduler::Scheduler>(
      *store_, *session_runner_,
      scheduler::SchedulerConfig{
          .poll_interval = std::chrono::milliseconds(config_.daemon.scheduler_poll_secs * 1000),
          .busy_policy = busy_policy.ok() ? busy_policy.value() : agent::BusyPolicy::Reject});
  if (options.run_scheduler) {
    scheduler_->start();
  }

  state_writer_ = std::make_unique<StateWriter>(
      config_.daemon.state_path, std::chrono::seconds(config_.daemon.state_write_secs),
      [this]() {
        return "\"socket\":" + common::json_quote(config_.daemon.socket_path) +
               ",\"active_invocations\":" + std::to_string(invoker_->active_invocations()) +
               ",\"in_flight_requests\":" + std::to_string(server_->in_flight());
      });
  state_writer_->start();

  running_ = true;
  std::cerr << "[daemon] listening on " << config_.daemon.socket_path << "\n";
  return common::Status::success();
}

void Daemon::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  std::cerr << "[daemon] shutting down\n";
  teardown();
}

void Daemon::teardown() {
  // Stop intake first, then let in-flight work drain before the store goes away.
  if (server_ != nullptr) {
    server_->stop();
  }
  if (scheduler_ != nullptr) {
    scheduler_->stop();
  }
  if (state_writer_ != nullptr) {
    state_writer_->stop();
  }
  state_writer_.reset();
  scheduler_.reset();
  server_.reset();
  handler_.reset();
  session_runner_.reset();
  invoker_.reset();
  if (pid_file_ != nullptr) {
    pid_file_->release();
  }
  pid_file_.reset();
  store_.reset();
  health::reset_component("scheduler");
  health::reset_component("store");
}

bool Daemon::is_running() const { return running_; }

int run_daemon(const config::Config &config, const DaemonOptions &options) {
  g_stop_requested = false;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);
  std::signal(SIGPIPE, SIG_IGN);

  Daemon daemon(config);
  auto started = daemon.start(options);
  if (!started.ok()) {
    std::cerr << "[daemon] failed to start: " << started.error() << "\n";
    return 1;
  }
  while (!g_stop_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  daemon.stop();
  return 0;
}

} // namespace hermit::daemon

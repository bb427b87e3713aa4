#pragma once

#include "hermit/agent/invoker.hpp"
#include "hermit/agent/locks.hpp"
#include "hermit/agent/session_runner.hpp"
#include "hermit/common/result.hpp"
#include "hermit/config/schema.hpp"
#include "hermit/daemon/pid_file.hpp"
#include "hermit/daemon/state_writer.hpp"
#include "hermit/gateway/handler.hpp"
#include "hermit/gateway/server.hpp"
#include "hermit/sandbox/process.hpp"
#include "hermit/scheduler/scheduler.hpp"
#include "hermit/store/store.hpp"

#include <atomic>
#include <memory>

namespace hermit::daemon {

struct DaemonOptions {
  /// Take over a pid file that names a live, unrelated process.
  bool force = false;
  /// Run the scheduler loop. Tests drive `scheduler()->tick()` directly.
  bool run_scheduler = true;
};

/// Owns every long-lived component: the store, the execution locks, the
/// invoker stack, the scheduler and the IPC endpoint.
class Daemon {
public:
  /// `runner` replaces the fork/exec runner when given; it must outlive the daemon.
  explicit Daemon(const config::Config &config, sandbox::IProcessRunner *runner = nullptr);
  ~Daemon();

  Daemon(const Daemon &) = delete;
  Daemon &operator=(const Daemon &) = delete;

  [[nodiscard]] common::Status start(const DaemonOptions &options = {});
  void stop();
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] store::Store *store() { return store_.get(); }
  [[nodiscard]] scheduler::Scheduler *scheduler() { return scheduler_.get(); }

private:
  void teardown();

  const config::Config &config_;
  std::unique_ptr<sandbox::IProcessRunner> owned_runner_;
  sandbox::IProcessRunner *runner_ = nullptr;

  std::unique_ptr<store::Store> store_;
  agent::WorkspaceLocks locks_;
  std::unique_ptr<agent::AgentInvoker> invoker_;
  std::unique_ptr<agent::SessionRunner> session_runner_;
  std::unique_ptr<scheduler::Scheduler> scheduler_;
  std::unique_ptr<gateway::RequestHandler> handler_;
  std::unique_ptr<gateway::IpcServer> server_;
  std::unique_ptr<PidFile> pid_file_;
  std::unique_ptr<StateWriter> state_writer_;
  std::atomic<bool> running_{false};
};

/// Foreground daemon: starts, then blocks until SIGINT or SIGTERM.
/// Returns the process exit code.
[[nodiscard]] int run_daemon(const config::Config &config, const DaemonOptions &options);

} // namespace hermit::daemon

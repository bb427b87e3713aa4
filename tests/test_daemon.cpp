#include "test_framework.hpp"

#include "hermit/common/json_util.hpp"
#include "hermit/daemon/daemon.hpp"
#include "hermit/daemon/pid_file.hpp"
#include "hermit/daemon/state_writer.hpp"
#include "hermit/gateway/client.hpp"
#include "hermit/gateway/socket_io.hpp"
#include "hermit/health/health.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

std::string read_file(const std::filesystem::path &path) {
  std::ifstream in(path);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/// Leaves a socket file behind with nobody listening on it.
void make_stale_socket(const std::string &path) {
  const int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  hermit::tests::require(fd >= 0, "socket()");
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
  const int bound = bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  close(fd);
  hermit::tests::require(bound == 0, "bind stale socket");
}

} // namespace

void register_daemon_tests(std::vector<hermit::tests::TestCase> &tests) {
  using hermit::tests::require;
  namespace dm = hermit::daemon;
  namespace hl = hermit::health;
  using hermit::testing::agent_json;
  using hermit::testing::FakeReply;
  using namespace std::chrono_literals;

  tests.push_back({"daemon_pid_file_prevents_double_start", [] {
                     hermit::testing::TempWorkspace ws;
                     const auto pid_path = ws.path() / "run" / "hermit.pid";
                     dm::PidFile first(pid_path);
                     require(first.acquire().ok(), "first acquire");
                     require(std::filesystem::exists(pid_path), "pid file created");
                     require(read_file(pid_path) == std::to_string(getpid()) + "\n",
                             "pid file holds our pid");

                     dm::PidFile second(pid_path);
                     auto refused = second.acquire();
                     require(!refused.ok(), "live pid refuses a second holder");
                     require(refused.error().find("--force") != std::string::npos,
                             "error mentions --force");

                     first.release();
                     require(!std::filesystem::exists(pid_path), "release removes the file");
                     require(second.acquire().ok(), "acquire after release");
                   }});

  tests.push_back({"daemon_pid_file_stale_and_forced", [] {
                     hermit::testing::TempWorkspace ws;
                     const auto pid_path = ws.path() / "hermit.pid";
                     ws.create_file("hermit.pid", "999999999\n");
                     dm::PidFile stale(pid_path);
                     require(stale.acquire().ok(), "dead pid is taken over");
                     stale.release();

                     dm::PidFile holder(pid_path);
                     require(holder.acquire().ok(), "holder");
                     dm::PidFile forced(pid_path);
                     require(forced.acquire(true).ok(), "force overrides a live pid");
                     require(dm::PidFile::is_process_running(getpid()), "we are running");
                     require(!dm::PidFile::is_process_running(0), "pid 0 is not a process");
                   }});

  tests.push_back({"daemon_state_writer_writes_and_removes_file", [] {
                     hermit::testing::TempWorkspace ws;
                     hl::clear();
                     hl::mark_component_ok("ipc");
                     const auto state_path = ws.path() / "daemon_state.json";
                     dm::StateWriter writer(state_path, 1s,
                                            [] { return std::string("\"socket\":\"/x.sock\""); });
                     writer.start();
                     require(writer.is_running(), "running");
                     for (int i = 0; i < 50 && !std::filesystem::exists(state_path); ++i) {
                       std::this_thread::sleep_for(20ms);
                     }
                     require(std::filesystem::exists(state_path), "state file written");

                     const auto json = read_file(state_path);
                     require(hermit::common::json_is_object(json), "state is a JSON object");
                     const auto fields = hermit::common::json_parse_flat(json);
                     require(fields.at("pid") == std::to_string(getpid()), "pid field");
                     require(fields.at("socket") == "/x.sock", "extra field");
                     require(fields.contains("written_at") && fields.contains("uptime_seconds"),
                             "timestamps");
                     require(fields.at("components").find("\"ipc\"") != std::string::npos,
                             "components included");

                     writer.stop();
                     require(!writer.is_running(), "stopped");
                     require(!std::filesystem::exists(state_path), "stop removes the file");
                     hl::clear();
                   }});

  tests.push_back({"daemon_start_stop_lifecycle", [] {
                     hermit::testing::TempWorkspace ws;
                     EnvGuard home("HOME", (ws.path() / "user").string());
                     const auto config = hermit::testing::temp_config(ws);
                     hermit::testing::FakeProcessRunner runner;
                     runner.set_default_reply(FakeReply{.stdout_text = agent_json("hi", "s-1")});

                     dm::Daemon daemon(config, &runner);
                     auto started = daemon.start(dm::DaemonOptions{.run_scheduler = false});
                     require(started.ok(), started.error());
                     require(daemon.is_running(), "running");
                     require(daemon.store() != nullptr && daemon.scheduler() != nullptr,
                             "components exposed");
                     require(std::filesystem::exists(config.daemon.pid_path), "pid file");
                     require(std::filesystem::exists(config.daemon.socket_path), "socket");
                     require(!daemon.start().ok(), "double start refused");

                     struct stat info {};
                     require(stat(config.daemon.socket_path.c_str(), &info) == 0, "stat socket");
                     require((info.st_mode & 0777) == 0600, "socket is owner-only");

                     hermit::gateway::IpcClient client(config.daemon.socket_path, 5s);
                     auto reply = client.call(hermit::gateway::DaemonStatus{});
                     require(reply.ok(), reply.error());
                     require(reply.value().ok && reply.value().field("message") == "pong", "pong");
                     require(hl::get_component("ipc").has_value() &&
                                 hl::get_component("ipc")->status == "ok",
                             "ipc healthy");

                     daemon.stop();
                     require(!daemon.is_running(), "stopped");
                     require(!std::filesystem::exists(config.daemon.pid_path), "pid removed");
                     require(!std::filesystem::exists(config.daemon.socket_path),
                             "socket removed");
                     require(!client.daemon_reachable(), "no longer reachable");
                     daemon.stop();
                   }});

  tests.push_back({"daemon_second_instance_is_refused", [] {
                     hermit::testing::TempWorkspace ws;
                     EnvGuard home("HOME", (ws.path() / "user").string());
                     const auto config = hermit::testing::temp_config(ws);
                     hermit::testing::FakeProcessRunner runner;

                     dm::Daemon first(config, &runner);
                     auto started = first.start(dm::DaemonOptions{.run_scheduler = false});
                     require(started.ok(), started.error());

                     dm::Daemon second(config, &runner);
                     require(!second.start(dm::DaemonOptions{.run_scheduler = false}).ok(),
                             "pid file refuses a second daemon");
                     auto forced =
                         second.start(dm::DaemonOptions{.force = true, .run_scheduler = false});
                     require(!forced.ok(), "live socket refuses even with --force");
                     require(forced.error().find("listening") != std::string::npos,
                             "socket probe message");

                     require(std::filesystem::exists(config.daemon.pid_path),
                             "first daemon keeps its pid file");
                     hermit::gateway::IpcClient client(config.daemon.socket_path, 5s);
                     require(client.daemon_reachable(), "first daemon still serving");
                     first.stop();
                   }});

  tests.push_back({"daemon_replaces_stale_socket", [] {
                     hermit::testing::TempWorkspace ws;
                     EnvGuard home("HOME", (ws.path() / "user").string());
                     const auto config = hermit::testing::temp_config(ws);
                     std::filesystem::create_directories(
                         std::filesystem::path(config.daemon.socket_path).parent_path());
                     make_stale_socket(config.daemon.socket_path);
                     require(std::filesystem::exists(config.daemon.socket_path), "stale socket");

                     hermit::testing::FakeProcessRunner runner;
                     dm::Daemon daemon(config, &runner);
                     auto started = daemon.start(dm::DaemonOptions{.run_scheduler = false});
                     require(started.ok(), started.error());
                     hermit::gateway::IpcClient client(config.daemon.socket_path, 5s);
                     auto raw = client.round_trip(R"({"cmd":"ping"})");
                     require(raw.ok(), raw.error());
                     require(raw.value().find("\"pong\"") != std::string::npos, "answers");
                     daemon.stop();
                   }});

  tests.push_back({"daemon_server_rejects_garbage_lines", [] {
                     hermit::testing::TempWorkspace ws;
                     EnvGuard home("HOME", (ws.path() / "user").string());
                     const auto config = hermit::testing::temp_config(ws);
                     hermit::testing::FakeProcessRunner runner;
                     dm::Daemon daemon(config, &runner);
                     require(daemon.start(dm::DaemonOptions{.run_scheduler = false}).ok(),
                             "start");

                     hermit::gateway::IpcClient client(config.daemon.socket_path, 5s);
                     auto raw = client.round_trip("this is not json");
                     require(raw.ok(), raw.error());
                     auto decoded = hermit::gateway::decode_response(raw.value());
                     require(decoded.ok() && decoded.value().code == "invalid_request",
                             "invalid_request expected");
                     daemon.stop();
                   }});

  tests.push_back({"daemon_socket_io_read_line", [] {
                     int fds[2] = {-1, -1};
                     require(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0, "socketpair");
                     require(hermit::gateway::write_all(fds[0], "first line\nrest").ok(), "write");
                     auto line = hermit::gateway::read_line(fds[1], 1024);
                     require(line.ok() && line.value() == "first line", "line without newline");

                     require(hermit::gateway::write_all(fds[0], std::string(64, 'x')).ok(),
                             "write long");
                     close(fds[0]);
                     auto capped = hermit::gateway::read_line(fds[1], 16);
                     require(!capped.ok(), "over-long line rejected");
                     close(fds[1]);

                     require(hermit::gateway::socket_path_fits("/tmp/hermit.sock"), "short path");
                     require(!hermit::gateway::socket_path_fits(std::string(200, 'a')),
                             "long path");
                   }});
}

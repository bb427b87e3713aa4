#include "../test_framework.hpp"

#include "hermit/common/json_util.hpp"
#include "hermit/common/time.hpp"
#include "hermit/daemon/daemon.hpp"
#include "hermit/gateway/client.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <cstdlib>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

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

/// A running daemon with a scripted agent, talked to over its real socket.
struct RunningDaemon {
  hermit::testing::TempWorkspace ws;
  EnvGuard home{"HOME", (ws.path() / "user").string()};
  hermit::config::Config config = hermit::testing::temp_config(ws);
  hermit::testing::FakeProcessRunner runner;
  hermit::daemon::Daemon daemon{config, &runner};
  hermit::gateway::IpcClient client{config.daemon.socket_path, std::chrono::seconds(10)};

  RunningDaemon() {
    runner.set_default_reply(
        hermit::testing::FakeReply{.stdout_text = hermit::testing::agent_json("done", "s-0")});
    auto started = daemon.start(hermit::daemon::DaemonOptions{.run_scheduler = false});
    hermit::tests::require(started.ok(), started.error());
  }

  ~RunningDaemon() {
    runner.release();
    daemon.stop();
  }

  hermit::gateway::ClientResponse call(const hermit::gateway::Request &request) const {
    auto response = client.call(request);
    hermit::tests::require(response.ok(), response.error());
    return response.value();
  }
};

} // namespace

void register_alpha_scenario_tests(std::vector<hermit::tests::TestCase> &tests) {
  using hermit::tests::require;
  namespace gw = hermit::gateway;
  namespace common = hermit::common;
  using hermit::testing::agent_json;
  using hermit::testing::FakeReply;
  using namespace std::chrono_literals;

  tests.push_back({"alpha_conversation_resumes_over_socket", [] {
                     RunningDaemon d;
                     d.runner.push_reply(FakeReply{.stdout_text = agent_json("Hi there", "s-1")});
                     d.runner.push_reply(FakeReply{.stdout_text = agent_json("Still here", "s-2")});

                     auto first = d.call(gw::SendMessage{.group = "alpha", .prompt = "hello"});
                     require(first.ok, first.error);
                     require(first.field("result") == "Hi there", "first reply");
                     require(first.field("resumed") == "false", "fresh conversation");

                     auto second = d.call(gw::SendMessage{.group = "alpha", .prompt = "again"});
                     require(second.ok && second.field("resumed") == "true", "resumed");
                     require(second.field("session_id") == "s-2", "latest session stored");
                     const auto calls = d.runner.calls();
                     require(calls.size() == 2, "two invocations");
                     bool resume_flag = false;
                     for (std::size_t i = 0; i + 1 < calls[1].argv.size(); ++i) {
                       if (calls[1].argv[i] == "--resume" && calls[1].argv[i + 1] == "s-1") {
                         resume_flag = true;
                       }
                     }
                     require(resume_flag, "second invocation resumes s-1");

                     auto groups = d.call(gw::ListWorkspaces{});
                     const auto rows = common::json_split_top_level_objects(groups.field("groups"));
                     require(rows.size() == 1, "one workspace");
                     require(common::json_parse_flat(rows[0]).at("session_id") == "s-2",
                             "session listed");

                     auto history = d.call(gw::StartInteractive{.group = "alpha", .history = 10});
                     require(common::json_split_top_level_objects(history.field("history"))
                                     .size() == 4,
                             "both turns in history");

                     auto cleared = d.call(gw::ClearSession{.group = "alpha"});
                     require(cleared.field("cleared") == "true", "cleared");
                     d.runner.push_reply(FakeReply{.stdout_text = agent_json("New", "s-3")});
                     auto fresh = d.call(gw::SendMessage{.group = "alpha", .prompt = "restart"});
                     require(fresh.field("resumed") == "false" && fresh.field("session_id") == "s-3",
                             "new session after clear");
                     const auto last_argv = d.runner.calls().back().argv;
                     require(std::find(last_argv.begin(), last_argv.end(), "--resume") ==
                                 last_argv.end(),
                             "no resume flag after clear");
                   }});

  tests.push_back({"alpha_tasks_fire_through_scheduler", [] {
                     RunningDaemon d;
                     d.runner.set_default_reply(FakeReply{.stdout_text = agent_json("report", "s-9")});

                     auto added = d.call(
                         gw::AddTask{.group = "ops", .cron = "once:+1s", .prompt = "daily report"});
                     require(added.ok, added.error);
                     const auto id = added.field("task_id");
                     auto recurring =
                         d.call(gw::AddTask{.group = "ops", .cron = "@hourly", .prompt = "ping"});
                     require(recurring.ok, recurring.error);
                     auto bad = d.call(gw::AddTask{.cron = "every now and then", .prompt = "x"});
                     require(bad.code == "invalid_trigger", "bad trigger rejected");

                     auto report = d.daemon.scheduler()->tick(common::Clock::now() + 5s);
                     require(report.fired == 1 && report.failed == 0, "one-shot fired");
                     require(d.runner.calls().at(0).options.stdin_text == "daily report",
                             "task prompt delivered");
                     require(d.daemon.scheduler()->tick(common::Clock::now() + 10s).due == 0,
                             "one-shot left the due list");

                     auto listed = d.call(gw::ListTasks{.group = std::string("ops")});
                     const auto rows = common::json_split_top_level_objects(listed.field("tasks"));
                     require(rows.size() == 2, "two tasks");
                     bool found = false;
                     for (const auto &row : rows) {
                       const auto fields = common::json_parse_flat(row);
                       if (fields.at("id") == id) {
                         found = true;
                         require(fields.at("status") == "completed", "one-shot completed");
                         require(fields.at("last_result") == "report", "result stored");
                       }
                     }
                     require(found, "task listed");

                     auto removed = d.call(gw::RemoveTask{.task_id = id});
                     require(removed.ok, removed.error);
                     auto again = d.call(gw::RemoveTask{.task_id = id});
                     require(again.code == "not_found", "second removal not found");

                     auto groups = d.call(gw::ListWorkspaces{});
                     const auto workspaces =
                         common::json_split_top_level_objects(groups.field("groups"));
                     require(workspaces.size() == 1 &&
                                 common::json_parse_flat(workspaces[0]).at("active_tasks") == "1",
                             "active task count");
                   }});

  tests.push_back({"alpha_same_workspace_requests_are_serialized", [] {
                     RunningDaemon d;
                     d.runner.hold();
                     std::vector<std::thread> senders;
                     std::vector<int> ok(2, 0);
                     for (int i = 0; i < 2; ++i) {
                       senders.emplace_back([&d, &ok, i] {
                         auto response = d.client.call(
                             gw::SendMessage{.group = "shared", .prompt = "p" + std::to_string(i)});
                         ok[i] = response.ok() && response.value().ok ? 1 : 0;
                       });
                     }
                     require(d.runner.wait_for_calls(1, 3000ms), "first invocation started");
                     std::this_thread::sleep_for(200ms);
                     require(d.runner.call_count() == 1, "second request waits for the lock");

                     auto status = d.call(gw::DaemonStatus{});
                     require(status.field("message") == "pong", "status answers while busy");
                     require(status.field("active_invocations") == "1", "one active invocation");

                     d.runner.release();
                     for (auto &sender : senders) {
                       sender.join();
                     }
                     require(ok[0] == 1 && ok[1] == 1, "both requests answered");
                     require(d.runner.max_concurrent() == 1, "never two at once");
                   }});

  tests.push_back({"alpha_different_workspaces_run_in_parallel", [] {
                     RunningDaemon d;
                     d.runner.hold();
                     std::vector<std::thread> senders;
                     for (const std::string group : {"left", "right"}) {
                       senders.emplace_back([&d, group] {
                         (void)d.client.call(gw::SendMessage{.group = group, .prompt = "go"});
                       });
                     }
                     const bool both = d.runner.wait_for_calls(2, 3000ms);
                     d.runner.release();
                     for (auto &sender : senders) {
                       sender.join();
                     }
                     require(both, "independent workspaces should not block each other");
                     require(d.runner.max_concurrent() == 2, "two concurrent invocations");
                   }});

  tests.push_back({"alpha_busy_reject_policy_over_socket", [] {
                     RunningDaemon d;
                     d.config.daemon.interactive_busy_policy = "reject";
                     d.runner.hold();
                     std::thread holder([&d] {
                       (void)d.client.call(gw::SendMessage{.group = "solo", .prompt = "long"});
                     });
                     require(d.runner.wait_for_calls(1, 3000ms), "first invocation started");
                     auto busy = d.call(gw::SendMessage{.group = "solo", .prompt = "second"});
                     d.runner.release();
                     holder.join();
                     require(busy.code == "busy", "busy expected, got " + busy.code);
                   }});
}

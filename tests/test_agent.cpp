#include "test_framework.hpp"

#include "hermit/agent/invoker.hpp"
#include "hermit/agent/locks.hpp"
#include "hermit/agent/output.hpp"
#include "hermit/agent/session_runner.hpp"
#include "hermit/sandbox/policy.hpp"
#include "hermit/store/transcript.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>

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

/// Store, locks, fake runner and invoker wired the way the daemon wires them.
struct AgentFixture {
  hermit::testing::TempWorkspace ws;
  EnvGuard home{"HOME", (ws.path() / "user").string()};
  hermit::config::Config config = hermit::testing::temp_config(ws);
  hermit::store::Store store{std::filesystem::path(config.paths.data_dir) / "hermit.db",
                             config.paths.groups_dir};
  hermit::agent::WorkspaceLocks locks;
  hermit::testing::FakeProcessRunner runner;
  hermit::agent::AgentInvoker invoker{config, runner};
  hermit::agent::SessionRunner sessions{config, store, locks, invoker};

  hermit::store::Workspace workspace(const std::string &name) {
    auto created = store.get_or_create_workspace(name);
    hermit::tests::require(created.ok(), created.error());
    return created.value();
  }
};

bool contains_pair(const std::vector<std::string> &args, const std::string &first,
                   const std::string &second) {
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == first && args[i + 1] == second) {
      return true;
    }
  }
  return false;
}

} // namespace

void register_agent_tests(std::vector<hermit::tests::TestCase> &tests) {
  using hermit::tests::require;
  namespace ag = hermit::agent;
  namespace st = hermit::store;
  using hermit::testing::agent_json;
  using hermit::testing::FakeReply;

  tests.push_back({"agent_output_single_object", [] {
                     auto parsed = ag::parse_agent_output(agent_json("hello\nworld", "s-1"));
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().result == "hello\nworld", "result mismatch");
                     require(parsed.value().session_id == "s-1", "session mismatch");
                     require(!parsed.value().is_error, "not an error");
                   }});

  tests.push_back({"agent_output_event_array_uses_last_result", [] {
                     const std::string text =
                         R"([{"type":"system","session_id":"s-0"},)"
                         R"({"type":"result","result":"first","session_id":"s-1"},)"
                         R"({"type":"assistant","message":{"content":"x"}},)"
                         R"({"type":"result","result":"final","session_id":"s-2"}])";
                     auto parsed = ag::parse_agent_output(text);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().result == "final", "last result wins");
                     require(parsed.value().session_id == "s-2", "session of last result");

                     auto no_result = ag::parse_agent_output(R"([{"type":"system"}])");
                     require(!no_result.ok(), "array without result fails");
                   }});

  tests.push_back({"agent_output_noise_before_json_line", [] {
                     const std::string text = "warming up...\nnot json {\n" +
                                              agent_json("ok", "s-9") + "\n";
                     auto parsed = ag::parse_agent_output(text);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().session_id == "s-9", "trailing object found");
                   }});

  tests.push_back({"agent_output_non_string_session_id_is_missing", [] {
                     auto null_id = ag::parse_agent_output(
                         R"({"type":"result","result":"hi","session_id":null,"is_error":false})");
                     require(null_id.ok() && null_id.value().session_id.empty(),
                             "null session_id reads as missing");
                     auto numeric = ag::parse_agent_output(
                         R"({"type":"result","result":"hi","session_id":42})");
                     require(numeric.ok() && numeric.value().session_id.empty(),
                             "numeric session_id reads as missing");
                     auto quoted = ag::parse_agent_output(agent_json("hi", "null"));
                     require(quoted.ok() && quoted.value().session_id == "null",
                             "a quoted id is taken as given");
                   }});

  tests.push_back({"agent_output_error_flags", [] {
                     auto flagged = ag::parse_agent_output(agent_json("rate limited", "s", true));
                     require(flagged.ok() && flagged.value().is_error, "is_error true");
                     auto subtype = ag::parse_agent_output(
                         R"({"type":"result","subtype":"error_max_turns","session_id":"s"})");
                     require(subtype.ok() && subtype.value().is_error, "error subtype");
                     require(!ag::parse_agent_output("").ok(), "empty output fails");
                     require(!ag::parse_agent_output("plain text").ok(), "text fails");
                   }});

  tests.push_back({"agent_invoker_success_runs_through_helper", [] {
                     AgentFixture fx;
                     fx.runner.set_default_reply(FakeReply{.stdout_text = agent_json("hi", "s-1")});
                     const auto workspace = fx.workspace("alpha");

                     auto result = fx.invoker.invoke(workspace, "say hi", std::nullopt);
                     require(result.ok(), result.failure.message);
                     require(result.output->reply == "hi", "reply mismatch");
                     require(result.output->session_id == "s-1", "session mismatch");
                     require(fx.invoker.active_invocations() == 0, "no active invocations left");

                     const auto calls = fx.runner.calls();
                     require(calls.size() == 1, "one helper call");
                     const auto &argv = calls[0].argv;
                     require(argv.front() == fx.config.sandbox.helper, "helper first");
                     const auto sep = std::find(argv.begin(), argv.end(), "--");
                     require(sep != argv.end() && *(sep + 1) == "claude", "agent after --");
                     require(std::find(argv.begin(), argv.end(), "--resume") == argv.end(),
                             "no resume on first turn");
                     require(std::find(argv.begin(), argv.end(), "say hi") == argv.end(),
                             "prompt goes to stdin, not argv");
                     require(calls[0].options.stdin_text == "say hi", "stdin prompt");
                     require(calls[0].options.env.has_value(), "explicit env");
                     require(calls[0].options.timeout ==
                                 std::chrono::milliseconds(fx.config.agent.timeout_secs * 1000),
                             "timeout from config");

                     auto transcript = st::read_transcript_tail(st::transcript_path(workspace), 10);
                     require(transcript.ok() && transcript.value().size() == 2, "two entries");
                     require(transcript.value()[0].role == st::TranscriptRole::User, "user first");
                     require(transcript.value()[0].metadata.at("origin") == "ipc", "origin");
                     require(transcript.value()[1].role == st::TranscriptRole::Assistant,
                             "assistant second");
                     require(transcript.value()[1].metadata.at("session_id") == "s-1",
                             "session recorded");
                   }});

  tests.push_back({"agent_invoker_resume_and_argv_prompt", [] {
                     AgentFixture fx;
                     fx.config.agent.prompt_via_stdin = false;
                     fx.runner.set_default_reply(FakeReply{.stdout_text = agent_json("r", "s-2")});
                     const auto workspace = fx.workspace("alpha");

                     auto result = fx.invoker.invoke(workspace, "continue", std::string("s-1"));
                     require(result.ok(), result.failure.message);
                     const auto argv = fx.runner.calls().at(0).argv;
                     require(contains_pair(argv, "--resume", "s-1"), "resume flag passed");
                     require(argv.back() == "continue", "prompt is the last argument");
                     require(fx.runner.calls().at(0).options.stdin_text.empty(), "empty stdin");
                   }});

  tests.push_back({"agent_invoker_failure_kinds", [] {
                     AgentFixture fx;
                     const auto workspace = fx.workspace("alpha");

                     fx.runner.push_reply(FakeReply{.timed_out = true});
                     auto timeout = fx.invoker.invoke(workspace, "p", std::nullopt);
                     require(!timeout.ok() && timeout.failure.kind == ag::InvokeFailureKind::Timeout,
                             "timeout kind");

                     fx.runner.push_reply(
                         FakeReply{.exit_code = 1, .stdout_text = agent_json("quota", "s", true)});
                     auto agent_error = fx.invoker.invoke(workspace, "p", std::nullopt);
                     require(!agent_error.ok() &&
                                 agent_error.failure.kind == ag::InvokeFailureKind::AgentError &&
                                 agent_error.failure.message == "quota",
                             "agent error carries the agent's message");

                     fx.runner.push_reply(
                         FakeReply{.exit_code = 2, .stdout_text = "", .stderr_text = "bwrap: nope"});
                     auto helper = fx.invoker.invoke(workspace, "p", std::nullopt);
                     require(!helper.ok() && helper.failure.kind == ag::InvokeFailureKind::Helper,
                             "helper kind");
                     require(helper.failure.message.find("bwrap: nope") != std::string::npos,
                             "stderr tail in message");

                     fx.runner.push_reply(FakeReply{.stdout_text = "garbage"});
                     auto malformed = fx.invoker.invoke(workspace, "p", std::nullopt);
                     require(!malformed.ok() &&
                                 malformed.failure.kind == ag::InvokeFailureKind::Malformed,
                             "malformed kind");

                     fx.runner.push_reply(FakeReply{.stdout_text = R"({"result":"x"})"});
                     auto no_session = fx.invoker.invoke(workspace, "p", std::nullopt);
                     require(!no_session.ok() &&
                                 no_session.failure.kind == ag::InvokeFailureKind::Malformed,
                             "missing session id is malformed");

                     fx.runner.set_start_error(std::string("exec failed"));
                     auto start = fx.invoker.invoke(workspace, "p", std::nullopt);
                     require(!start.ok() && start.failure.kind == ag::InvokeFailureKind::Helper,
                             "start failure is a helper failure");

                     auto transcript = st::read_transcript_tail(st::transcript_path(workspace), 2);
                     require(transcript.ok() && transcript.value().size() == 2, "tail of two");
                     require(transcript.value()[1].role == st::TranscriptRole::System,
                             "failures are logged as system entries");
                     require(transcript.value()[1].metadata.at("failure") == "helper",
                             "failure kind recorded");
                   }});

  tests.push_back({"agent_session_runner_resumes_stored_session", [] {
                     AgentFixture fx;
                     fx.runner.push_reply(FakeReply{.stdout_text = agent_json("one", "s-1")});
                     fx.runner.push_reply(FakeReply{.stdout_text = agent_json("two", "s-2")});

                     auto first = fx.sessions.send("default", "hello", {}, ag::BusyPolicy::Queue);
                     require(first.ok(), first.message);
                     require(!first.resumed, "first turn starts fresh");
                     auto second = fx.sessions.send("default", "again", {}, ag::BusyPolicy::Queue);
                     require(second.ok(), second.message);
                     require(second.resumed, "second turn resumes");
                     require(contains_pair(fx.runner.calls().at(1).argv, "--resume", "s-1"),
                             "stored session passed to the agent");

                     auto session = fx.store.get_session("default");
                     require(session.ok() && session.value()->id == "s-2",
                             "latest session id stored");
                   }});

  tests.push_back({"agent_session_runner_failure_keeps_session", [] {
                     AgentFixture fx;
                     fx.workspace("default");
                     require(fx.store.set_session("default", "keep-me").ok(), "seed session");
                     fx.runner.set_default_reply(FakeReply{.timed_out = true});

                     auto outcome = fx.sessions.send("default", "slow", {}, ag::BusyPolicy::Queue);
                     require(outcome.status == ag::TurnStatus::Timeout, "timeout status");
                     auto session = fx.store.get_session("default");
                     require(session.ok() && session.value()->id == "keep-me",
                             "session unchanged after failure");
                   }});

  tests.push_back({"agent_session_runner_null_session_id_keeps_session", [] {
                     AgentFixture fx;
                     fx.workspace("default");
                     require(fx.store.set_session("default", "keep-me").ok(), "seed session");
                     const std::string null_id =
                         R"({"type":"result","result":"hi","session_id":null})";
                     fx.runner.set_default_reply(FakeReply{.stdout_text = null_id});

                     auto outcome = fx.sessions.send("default", "p", {}, ag::BusyPolicy::Queue);
                     require(outcome.status == ag::TurnStatus::InvocationFailed,
                             "reply without a session id is a failed turn");
                     auto session = fx.store.get_session("default");
                     require(session.ok() && session.value()->id == "keep-me",
                             "stored session survives");

                     fx.runner.set_default_reply(FakeReply{.stdout_text = agent_json("ok", "s-5")});
                     auto next = fx.sessions.send("default", "again", {}, ag::BusyPolicy::Queue);
                     require(next.ok(), next.message);
                     const auto argv = fx.runner.calls().back().argv;
                     bool resumed_kept = false;
                     for (std::size_t i = 0; i + 1 < argv.size(); ++i) {
                       if (argv[i] == "--resume" && argv[i + 1] == "keep-me") {
                         resumed_kept = true;
                       }
                     }
                     require(resumed_kept, "next turn resumes the kept session");
                   }});

  tests.push_back({"agent_session_runner_invalid_workspaces", [] {
                     AgentFixture fx;
                     auto bad = fx.sessions.send("../etc", "x", {}, ag::BusyPolicy::Queue);
                     require(bad.status == ag::TurnStatus::InvalidWorkspace, "invalid name");

                     fx.workspace("my notes");
                     auto clash = fx.sessions.send("My Notes", "x", {}, ag::BusyPolicy::Queue);
                     require(clash.status == ag::TurnStatus::InvalidWorkspace, "folder collision");
                     require(fx.runner.call_count() == 0, "agent never started");
                   }});

  tests.push_back({"agent_session_runner_reject_when_busy", [] {
                     AgentFixture fx;
                     auto held = fx.locks.try_acquire("default");
                     require(held.has_value(), "lease expected");
                     auto outcome = fx.sessions.send("default", "x", {}, ag::BusyPolicy::Reject);
                     require(outcome.status == ag::TurnStatus::Busy, "busy expected");

                     auto other = fx.locks.try_acquire("other");
                     require(other.has_value(), "other workspace is independent");
                     auto wrong = fx.sessions.run_turn(*other, "default", "x", {});
                     require(wrong.status == ag::TurnStatus::Busy,
                             "a lease for another workspace is refused");
                   }});

  tests.push_back({"agent_parse_busy_policy", [] {
                     require(ag::parse_busy_policy("queue").value() == ag::BusyPolicy::Queue,
                             "queue");
                     require(ag::parse_busy_policy("reject").value() == ag::BusyPolicy::Reject,
                             "reject");
                     require(ag::parse_busy_policy("defer").value() == ag::BusyPolicy::Reject,
                             "defer maps to reject");
                     require(!ag::parse_busy_policy("later").ok(), "unknown policy");
                   }});
}

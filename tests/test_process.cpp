#include "test_framework.hpp"

#include "hermit/sandbox/process.hpp"

#include <chrono>

void register_process_tests(std::vector<hermit::tests::TestCase> &tests) {
  using hermit::tests::require;
  namespace sb = hermit::sandbox;
  using namespace std::chrono_literals;

  tests.push_back({"process_captures_stdout_stderr_and_exit", [] {
                     sb::PosixProcessRunner runner;
                     sb::ProcessOptions options;
                     options.timeout = 5s;
                     auto result = runner.run({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"},
                                              options);
                     require(result.ok(), result.error());
                     require(result.value().exit_code == 3, "exit code mismatch");
                     require(result.value().stdout_text == "out\n", "stdout mismatch");
                     require(result.value().stderr_text == "err\n", "stderr mismatch");
                     require(!result.value().timed_out, "should not time out");
                   }});

  tests.push_back({"process_feeds_stdin", [] {
                     sb::PosixProcessRunner runner;
                     sb::ProcessOptions options;
                     options.timeout = 5s;
                     options.stdin_text = "hello from stdin";
                     auto result = runner.run({"/bin/sh", "-c", "cat"}, options);
                     require(result.ok(), result.error());
                     require(result.value().stdout_text == "hello from stdin", "echo mismatch");
                   }});

  tests.push_back({"process_env_replaces_environment", [] {
                     sb::PosixProcessRunner runner;
                     sb::ProcessOptions options;
                     options.timeout = 5s;
                     options.env = sb::EnvList{{"ONLY_VAR", "value"}};
                     auto result =
                         runner.run({"/bin/sh", "-c", "echo \"$ONLY_VAR:${HOME:-unset}\""},
                                    options);
                     require(result.ok(), result.error());
                     require(result.value().stdout_text == "value:unset\n",
                             "child must see exactly the given environment");
                   }});

  tests.push_back({"process_timeout_kills_child", [] {
                     sb::PosixProcessRunner runner;
                     sb::ProcessOptions options;
                     options.timeout = 300ms;
                     const auto started = std::chrono::steady_clock::now();
                     auto result = runner.run({"/bin/sh", "-c", "sleep 10"}, options);
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(result.ok(), result.error());
                     require(result.value().timed_out, "timeout expected");
                     require(elapsed < 5s, "child should be killed promptly");
                   }});

  tests.push_back({"process_missing_executable_fails_to_start", [] {
                     sb::PosixProcessRunner runner;
                     auto result = runner.run({"hermit-no-such-binary-xyz"}, {});
                     require(!result.ok(), "missing executable should fail");
                     auto empty = runner.run({}, {});
                     require(!empty.ok(), "empty argv should fail");
                   }});

  tests.push_back({"process_resolve_executable", [] {
                     require(sb::resolve_executable("sh").has_value(), "sh on PATH");
                     require(sb::resolve_executable("/bin/sh") ==
                                 std::optional<std::string>("/bin/sh"),
                             "absolute path kept");
                     require(!sb::resolve_executable("hermit-no-such-binary-xyz").has_value(),
                             "unknown binary");
                   }});
}

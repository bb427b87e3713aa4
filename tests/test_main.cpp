#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<hermit::tests::TestCase> &tests);
void register_config_tests(std::vector<hermit::tests::TestCase> &tests);
void register_store_tests(std::vector<hermit::tests::TestCase> &tests);
void register_sandbox_tests(std::vector<hermit::tests::TestCase> &tests);
void register_process_tests(std::vector<hermit::tests::TestCase> &tests);
void register_agent_tests(std::vector<hermit::tests::TestCase> &tests);
void register_locks_tests(std::vector<hermit::tests::TestCase> &tests);
void register_scheduler_tests(std::vector<hermit::tests::TestCase> &tests);
void register_gateway_tests(std::vector<hermit::tests::TestCase> &tests);
void register_observability_health_tests(std::vector<hermit::tests::TestCase> &tests);
void register_daemon_tests(std::vector<hermit::tests::TestCase> &tests);
void register_alpha_scenario_tests(std::vector<hermit::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<hermit::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_store_tests(tests);
  register_sandbox_tests(tests);
  register_process_tests(tests);
  register_agent_tests(tests);
  register_locks_tests(tests);
  register_scheduler_tests(tests);
  register_gateway_tests(tests);
  register_observability_health_tests(tests);
  register_daemon_tests(tests);
  register_alpha_scenario_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}

#include "test_framework.hpp"

#include "skyhost/observability/global.hpp"

#include <csignal>
#include <iostream>

void register_common_config_tests(std::vector<skyhost::tests::TestCase> &tests);
void register_observability_tests(std::vector<skyhost::tests::TestCase> &tests);
void register_process_tests(std::vector<skyhost::tests::TestCase> &tests);
void register_fleet_tests(std::vector<skyhost::tests::TestCase> &tests);
void register_health_tests(std::vector<skyhost::tests::TestCase> &tests);
void register_readiness_tests(std::vector<skyhost::tests::TestCase> &tests);
void register_status_doctor_tests(std::vector<skyhost::tests::TestCase> &tests);
void register_cli_tests(std::vector<skyhost::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when a peer closes early
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<skyhost::tests::TestCase> tests;
  register_common_config_tests(tests);
  register_observability_tests(tests);
  register_process_tests(tests);
  register_fleet_tests(tests);
  register_health_tests(tests);
  register_readiness_tests(tests);
  register_status_doctor_tests(tests);
  register_cli_tests(tests);

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

  skyhost::observability::set_global_observer(nullptr);
  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}

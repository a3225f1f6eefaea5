#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_config_tests(std::vector<docsandbox::tests::TestCase> &tests);
void register_sessions_tests(std::vector<docsandbox::tests::TestCase> &tests);
void register_workspace_tests(std::vector<docsandbox::tests::TestCase> &tests);
void register_watcher_tests(std::vector<docsandbox::tests::TestCase> &tests);
void register_render_tests(std::vector<docsandbox::tests::TestCase> &tests);
void register_observability_health_tests(std::vector<docsandbox::tests::TestCase> &tests);
void register_daemon_tests(std::vector<docsandbox::tests::TestCase> &tests);
void register_integration_tests(std::vector<docsandbox::tests::TestCase> &tests);

int main() {
  // Renderer child processes may close stdin early.
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<docsandbox::tests::TestCase> tests;
  register_config_tests(tests);
  register_sessions_tests(tests);
  register_workspace_tests(tests);
  register_watcher_tests(tests);
  register_render_tests(tests);
  register_observability_health_tests(tests);
  register_daemon_tests(tests);
  register_integration_tests(tests);

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

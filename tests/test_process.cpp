#include "test_framework.hpp"

#include "skyhost/process/runner.hpp"

#include <chrono>

void register_process_tests(std::vector<skyhost::tests::TestCase> &tests) {
  using skyhost::tests::require;
  namespace pr = skyhost::process;

  tests.push_back({"runner_captures_output_and_exit_code", [] {
                     pr::SubprocessRunner runner;
                     pr::CommandOptions options;
                     options.allow_failure = true;
                     const auto result =
                         runner.run({"sh", "-c", "echo out; echo err 1>&2; exit 3"}, options);
                     require(result.ok(), result.error());
                     require(result.value().exit_code == 3, "exit code");
                     require(result.value().stdout_text == "out\n", "stdout");
                     require(result.value().stderr_text == "err\n", "stderr");
                     require(!result.value().timed_out, "not timed out");
                   }});

  tests.push_back({"runner_failure_carries_stderr", [] {
                     pr::SubprocessRunner runner;
                     const auto result = runner.run({"sh", "-c", "echo 'no such service' 1>&2; exit 1"});
                     require(!result.ok(), "non-zero exit should fail");
                     require(result.error() == "no such service", result.error());
                   }});

  tests.push_back({"runner_missing_binary_exits_127", [] {
                     pr::SubprocessRunner runner;
                     pr::CommandOptions options;
                     options.allow_failure = true;
                     const auto result = runner.run({"skyhost-definitely-missing-tool"}, options);
                     require(result.ok(), result.error());
                     require(result.value().exit_code == pr::kExitCommandNotFound, "127 expected");
                     require(result.value().stderr_text.find("skyhost-definitely-missing-tool") !=
                                 std::string::npos,
                             "stderr should name the program");
                   }});

  tests.push_back({"runner_injects_environment", [] {
                     pr::SubprocessRunner runner;
                     pr::CommandOptions options;
                     options.env["SKYHOST_RUNNER_TEST"] = "injected";
                     const auto result =
                         runner.run({"sh", "-c", "printf %s \"$SKYHOST_RUNNER_TEST\""}, options);
                     require(result.ok(), result.error());
                     require(result.value().stdout_text == "injected", result.value().stdout_text);
                   }});

  tests.push_back({"runner_kills_on_timeout", [] {
                     pr::SubprocessRunner runner;
                     pr::CommandOptions options;
                     options.timeout = std::chrono::milliseconds(200);
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = runner.run({"sleep", "5"}, options);
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(!result.ok(), "timeout should fail");
                     require(result.error().find("timed out") != std::string::npos, result.error());
                     require(elapsed < std::chrono::seconds(3), "child should be killed promptly");

                     options.allow_failure = true;
                     const auto tolerated = runner.run({"sleep", "5"}, options);
                     require(tolerated.ok(), tolerated.error());
                     require(tolerated.value().timed_out, "timed_out flag");
                   }});

  tests.push_back({"runner_rejects_empty_argv", [] {
                     pr::SubprocessRunner runner;
                     require(!runner.run({}).ok(), "empty argv should fail");
                   }});
}

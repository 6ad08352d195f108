#pragma once

#include "skyhost/common/result.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace skyhost::process {

/// Exit status reported when the program could not be executed at all.
constexpr int kExitCommandNotFound = 127;

struct CommandOptions {
  // std::nullopt waits for the child indefinitely.
  std::optional<std::chrono::milliseconds> timeout = std::chrono::milliseconds(30'000);
  // Added on top of the inherited environment; overrides same-named variables.
  std::map<std::string, std::string> env;
  bool allow_failure = false;
  // Mirror the child's stdout/stderr to ours while still capturing them.
  bool echo_output = false;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
};

class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  /// argv[0] is resolved through PATH. Fails on spawn errors, on timeout, and on a
  /// non-zero exit unless options.allow_failure is set.
  [[nodiscard]] virtual common::Result<ProcessResult>
  run(const std::vector<std::string> &argv, const CommandOptions &options = {}) = 0;
};

class SubprocessRunner final : public ICommandRunner {
public:
  [[nodiscard]] common::Result<ProcessResult>
  run(const std::vector<std::string> &argv, const CommandOptions &options = {}) override;
};

} // namespace skyhost::process

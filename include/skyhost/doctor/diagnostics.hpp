#pragma once

#include "skyhost/common/result.hpp"
#include "skyhost/config/schema.hpp"
#include "skyhost/fleet/compose.hpp"
#include "skyhost/readiness/readiness.hpp"

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace skyhost::doctor {

enum class CheckStatus {
  Pass,
  Fail,
  Warn,
};

struct DiagnosticCheck {
  std::string name;
  CheckStatus status = CheckStatus::Pass;
  std::string message;
  std::optional<std::chrono::milliseconds> latency;
};

struct DiagnosticsReport {
  std::vector<DiagnosticCheck> checks;
  int passed = 0;
  int failed = 0;
  int warnings = 0;

  [[nodiscard]] bool ok() const { return failed == 0; }
};

struct DiagnosticsOptions {
  bool skip_dns = false;
  bool skip_docker = false;
};

/// The compose file and the reverse-proxy config directory must exist before the
/// environment can be checked; a missing one is a Config error.
[[nodiscard]] common::Status check_prerequisites(const config::Config &config);

/// Config validation, the readiness gate (unless skip_dns) and the tool pre-flight
/// (unless skip_docker). Every stage is reported even when an earlier one fails.
[[nodiscard]] DiagnosticsReport run_diagnostics(const config::Config &config,
                                                const DiagnosticsOptions &options,
                                                const readiness::ReadinessGate &gate,
                                                fleet::ComposeController &compose);

void print_diagnostics_report(std::ostream &out, const DiagnosticsReport &report);

} // namespace skyhost::doctor

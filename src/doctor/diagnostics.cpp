#include "skyhost/doctor/diagnostics.hpp"

#include "skyhost/config/config.hpp"

#include <filesystem>

namespace skyhost::doctor {

namespace {

void add_check(DiagnosticsReport &report, DiagnosticCheck check) {
  switch (check.status) {
  case CheckStatus::Pass:
    ++report.passed;
    break;
  case CheckStatus::Fail:
    ++report.failed;
    break;
  case CheckStatus::Warn:
    ++report.warnings;
    break;
  }
  report.checks.push_back(std::move(check));
}

DiagnosticCheck check_config(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Config";
  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    check.status = CheckStatus::Fail;
    check.message = validation.error();
    return check;
  }

  if (!validation.value().empty()) {
    check.status = CheckStatus::Warn;
    check.message = validation.value().front();
    return check;
  }

  check.status = CheckStatus::Pass;
  check.message = "valid";
  return check;
}

template <typename Fn> DiagnosticCheck timed_stage(const std::string &name, Fn &&stage) {
  DiagnosticCheck check;
  check.name = name;
  const auto start = std::chrono::steady_clock::now();
  const readiness::StageResult result = stage();
  check.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  check.status = result.passed() ? CheckStatus::Pass : CheckStatus::Fail;
  check.message = result.detail.empty() ? std::string(readiness::to_string(result.outcome))
                                        : result.detail;
  return check;
}

DiagnosticCheck check_dependencies(fleet::ComposeController &compose) {
  DiagnosticCheck check;
  check.name = "Docker";
  const auto status = compose.check_dependencies();
  if (!status.ok()) {
    check.status = CheckStatus::Fail;
    check.message = status.error();
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = "docker and compose available";
  return check;
}

} // namespace

common::Status check_prerequisites(const config::Config &config) {
  std::error_code ec;
  if (!std::filesystem::exists(config.fleet.compose_file, ec)) {
    return common::Status::error(
        common::ErrorKind::Config,
        config.fleet.compose_file + " not found. Generate the compose file before starting the fleet.");
  }
  if (!std::filesystem::is_directory(config.fleet.proxy_config_dir, ec)) {
    return common::Status::error(common::ErrorKind::Config,
                                 config.fleet.proxy_config_dir + " directory not found");
  }
  return common::Status::success();
}

DiagnosticsReport run_diagnostics(const config::Config &config, const DiagnosticsOptions &options,
                                  const readiness::ReadinessGate &gate,
                                  fleet::ComposeController &compose) {
  DiagnosticsReport report;
  add_check(report, check_config(config));

  if (!options.skip_dns) {
    const std::string &domain = config.network.domain;
    add_check(report, timed_stage("DNS", [&]() { return gate.check_dns(domain); }));
    add_check(report, timed_stage("HTTPS", [&]() { return gate.check_https(domain); }));
    add_check(report, timed_stage("WebSocket", [&]() { return gate.check_websocket(domain); }));
  }

  if (!options.skip_docker) {
    add_check(report, check_dependencies(compose));
  }
  return report;
}

void print_diagnostics_report(std::ostream &out, const DiagnosticsReport &report) {
  auto status_prefix = [](CheckStatus status) -> const char * {
    switch (status) {
    case CheckStatus::Pass:
      return "[PASS]";
    case CheckStatus::Fail:
      return "[FAIL]";
    case CheckStatus::Warn:
      return "[WARN]";
    }
    return "[INFO]";
  };

  for (const auto &check : report.checks) {
    out << status_prefix(check.status) << " " << check.name << ": " << check.message;
    if (check.latency.has_value()) {
      out << " (" << check.latency->count() << "ms)";
    }
    out << "\n";
  }

  out << "Summary: " << report.passed << " passed, " << report.failed << " failed, "
      << report.warnings << " warnings\n";
}

} // namespace skyhost::doctor

#include "skyhost/readiness/readiness.hpp"

#include "skyhost/common/fs.hpp"
#include "skyhost/observability/global.hpp"

#include <chrono>

namespace skyhost::readiness {

namespace {

StageResult record(const std::string &stage, StageResult result) {
  observability::record_readiness_stage(stage, std::string(to_string(result.outcome)),
                                        result.detail);
  return result;
}

StageResult failed(std::string detail) {
  return StageResult{.outcome = StageOutcome::Failed, .detail = std::move(detail)};
}

std::string test_host(const std::string &domain) { return "test-wss." + domain; }

} // namespace

std::string_view to_string(const StageOutcome outcome) {
  switch (outcome) {
  case StageOutcome::Passed:
    return "passed";
  case StageOutcome::Failed:
    return "failed";
  case StageOutcome::Skipped:
    return "skipped";
  }
  return "failed";
}

bool is_ipv4_address(const std::string_view text) {
  int octets = 0;
  std::size_t pos = 0;
  while (true) {
    std::size_t digits = 0;
    unsigned int value = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      value = value * 10 + static_cast<unsigned int>(text[pos] - '0');
      ++digits;
      ++pos;
      if (digits > 3) {
        return false;
      }
    }
    if (digits == 0 || value > 255) {
      return false;
    }
    ++octets;
    if (pos == text.size()) {
      return octets == 4;
    }
    if (text[pos] != '.' || octets == 4) {
      return false;
    }
    ++pos;
  }
}

ReadinessGate::ReadinessGate(ReadinessOptions options,
                             std::shared_ptr<process::ICommandRunner> runner,
                             std::shared_ptr<net::HttpClient> http,
                             std::shared_ptr<net::WebSocketProber> websocket)
    : options_(std::move(options)), runner_(std::move(runner)), http_(std::move(http)),
      websocket_(std::move(websocket)) {}

StageResult ReadinessGate::check_dns(const std::string &domain) const {
  if (runner_ == nullptr) {
    return record("dns", failed("no command runner"));
  }

  const std::vector<std::string> argv = {
      options_.dig_command, "+short", "+time=" + std::to_string(options_.dns_timeout_secs),
      "+tries=1",           "A",      domain};
  // dig bounds itself; the extra margin only catches a hung process.
  const auto limit = std::chrono::seconds(
      static_cast<std::chrono::seconds::rep>(options_.dns_timeout_secs + 3));
  const auto result = runner_->run(argv, process::CommandOptions{.timeout = limit,
                                                                 .env = {},
                                                                 .allow_failure = true,
                                                                 .echo_output = false});
  if (!result.ok()) {
    return record("dns", failed(result.error()));
  }
  const auto &outcome = result.value();
  if (outcome.timed_out) {
    return record("dns", failed("lookup timed out"));
  }
  if (outcome.exit_code == process::kExitCommandNotFound) {
    return record("dns", failed(options_.dig_command + " is not installed"));
  }
  if (outcome.exit_code != 0) {
    const std::string diagnostic = common::trim(outcome.stderr_text);
    return record("dns", failed(diagnostic.empty()
                                    ? "lookup failed with exit code " +
                                          std::to_string(outcome.exit_code)
                                    : diagnostic));
  }

  for (const auto &line : common::split_lines(outcome.stdout_text)) {
    const std::string candidate = common::trim(line);
    if (is_ipv4_address(candidate)) {
      return record("dns", StageResult{.outcome = StageOutcome::Passed, .detail = candidate});
    }
  }
  return record("dns", failed("no A record for " + domain));
}

StageResult ReadinessGate::check_https(const std::string &domain) const {
  if (http_ == nullptr) {
    return record("https", failed("no http client"));
  }

  const std::string url = "https://" + test_host(domain) + "/";
  const auto response =
      http_->get(url, net::HttpRequestOptions{.timeout_ms = options_.timeout_ms * 2,
                                              .connect_timeout_ms = options_.timeout_ms,
                                              .follow_redirects = true,
                                              .verify_tls = false});
  if (!response.completed()) {
    return record("https", failed(response.network_error_message.empty()
                                      ? "request failed"
                                      : response.network_error_message));
  }
  if (response.status >= 400) {
    return record("https", failed("HTTP " + std::to_string(response.status)));
  }
  return record("https", StageResult{.outcome = StageOutcome::Passed,
                                     .detail = "HTTP " + std::to_string(response.status)});
}

StageResult ReadinessGate::check_websocket(const std::string &domain) const {
  if (websocket_ == nullptr) {
    return record("websocket", failed("no websocket prober"));
  }

  const std::string url = "https://" + test_host(domain) + "/ws";
  const auto result =
      websocket_->handshake(url, std::chrono::milliseconds(options_.timeout_ms));
  if (!result.upgraded) {
    return record("websocket", failed(result.message));
  }
  return record("websocket", StageResult{.outcome = StageOutcome::Passed, .detail = "101"});
}

ReadinessResult ReadinessGate::run(const std::string &domain, const RunOptions &options) const {
  ReadinessResult result;
  if (!options.skip_dns) {
    result.dns = check_dns(domain);
  }
  if (!options.skip_https) {
    result.https = check_https(domain);
  }
  if (!options.skip_websocket) {
    result.websocket = check_websocket(domain);
  }
  return result;
}

} // namespace skyhost::readiness

#pragma once

#include "skyhost/net/http_client.hpp"
#include "skyhost/net/websocket_probe.hpp"
#include "skyhost/process/runner.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace skyhost::readiness {

enum class StageOutcome {
  Passed,
  Failed,
  Skipped,
};

[[nodiscard]] std::string_view to_string(StageOutcome outcome);

struct StageResult {
  StageOutcome outcome = StageOutcome::Skipped;
  std::string detail;

  [[nodiscard]] bool passed() const { return outcome == StageOutcome::Passed; }
};

struct ReadinessResult {
  StageResult dns;
  StageResult https;
  StageResult websocket;

  [[nodiscard]] bool dns_resolvable() const { return dns.passed(); }
  [[nodiscard]] bool https_reachable() const { return https.passed(); }
  [[nodiscard]] bool websocket_reachable() const { return websocket.passed(); }
};

struct ReadinessOptions {
  std::uint64_t timeout_ms = 5'000;
  std::uint64_t dns_timeout_secs = 2;
  std::string dig_command = "dig";
};

struct RunOptions {
  bool skip_dns = false;
  bool skip_https = false;
  bool skip_websocket = false;
};

/// Exactly four dot-separated decimal octets, each 0-255.
[[nodiscard]] bool is_ipv4_address(std::string_view text);

/// Staged DNS -> HTTPS -> WebSocket reachability check against test-wss.<domain>.
/// Diagnostic only; a failed stage never stops the later ones.
class ReadinessGate {
public:
  ReadinessGate(ReadinessOptions options, std::shared_ptr<process::ICommandRunner> runner,
                std::shared_ptr<net::HttpClient> http,
                std::shared_ptr<net::WebSocketProber> websocket);

  [[nodiscard]] StageResult check_dns(const std::string &domain) const;
  [[nodiscard]] StageResult check_https(const std::string &domain) const;
  [[nodiscard]] StageResult check_websocket(const std::string &domain) const;

  [[nodiscard]] ReadinessResult run(const std::string &domain, const RunOptions &options = {}) const;

private:
  ReadinessOptions options_;
  std::shared_ptr<process::ICommandRunner> runner_;
  std::shared_ptr<net::HttpClient> http_;
  std::shared_ptr<net::WebSocketProber> websocket_;
};

} // namespace skyhost::readiness

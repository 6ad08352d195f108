#pragma once

#include "skyhost/fleet/catalog.hpp"
#include "skyhost/net/http_client.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace skyhost::health {

enum class HealthState {
  Healthy,
  Degraded,
  Unhealthy,
};

[[nodiscard]] std::string_view to_string(HealthState state);

struct HealthStatus {
  std::string service;
  HealthState status = HealthState::Unhealthy;
  std::uint64_t latency_ms = 0;
  std::optional<std::string> details;
};

/// Where a service answers its health probe: https://<subdomain>.<domain><path>.
struct ProbeTarget {
  fleet::LogicalService service;
  std::string_view subdomain;
  std::string_view path;
};

[[nodiscard]] const ProbeTarget &probe_target(fleet::LogicalService service);

/// Transport failure -> Unhealthy, 2xx -> Healthy, 5xx -> Degraded, anything else -> Unhealthy.
[[nodiscard]] HealthState classify_response(const net::HttpResponse &response);

struct HealthCheckerOptions {
  std::string domain = "localhost";
  // Replaces https://<subdomain>.<domain> when non-empty.
  std::string base_url;
  std::uint64_t timeout_ms = 5'000;
};

class HealthChecker {
public:
  HealthChecker(HealthCheckerOptions options, std::shared_ptr<net::HttpClient> http);

  /// Never fails; unknown names are Unhealthy without touching the network.
  [[nodiscard]] HealthStatus check_service(const std::string &name) const;

  /// Probes concurrently; results keep the order of `names`.
  [[nodiscard]] std::vector<HealthStatus> check_services(const std::vector<std::string> &names) const;

  [[nodiscard]] std::optional<std::string> probe_url(const std::string &name) const;
  [[nodiscard]] std::string probe_url(fleet::LogicalService service) const;

private:
  HealthCheckerOptions options_;
  std::shared_ptr<net::HttpClient> http_;
};

void print_health_status(std::ostream &out, const HealthStatus &status, bool verbose);

} // namespace skyhost::health

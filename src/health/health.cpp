#include "skyhost/health/health.hpp"

#include "skyhost/observability/global.hpp"

#include <array>
#include <chrono>
#include <future>

namespace skyhost::health {

namespace {

constexpr std::array<ProbeTarget, fleet::kAllServices.size()> kProbeTable = {{
    {fleet::LogicalService::Pds, "pds", "/xrpc/_health"},
    {fleet::LogicalService::Plc, "plc", "/health"},
    {fleet::LogicalService::AppView, "appview", "/xrpc/_health"},
    {fleet::LogicalService::Bgs, "bgs", "/health"},
    {fleet::LogicalService::SocialApp, "social-app", "/"},
    {fleet::LogicalService::Ozone, "ozone", "/health"},
    {fleet::LogicalService::FeedGenerator, "feed-generator", "/health"},
    {fleet::LogicalService::Jetstream, "jetstream", "/health"},
}};

std::uint64_t elapsed_ms(const std::chrono::steady_clock::time_point started) {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - started)
                                        .count());
}

} // namespace

std::string_view to_string(const HealthState state) {
  switch (state) {
  case HealthState::Healthy:
    return "healthy";
  case HealthState::Degraded:
    return "degraded";
  case HealthState::Unhealthy:
    return "unhealthy";
  }
  return "unhealthy";
}

const ProbeTarget &probe_target(const fleet::LogicalService service) {
  for (const auto &target : kProbeTable) {
    if (target.service == service) {
      return target;
    }
  }
  return kProbeTable.front();
}

HealthState classify_response(const net::HttpResponse &response) {
  if (!response.completed()) {
    return HealthState::Unhealthy;
  }
  if (response.status >= 200 && response.status < 300) {
    return HealthState::Healthy;
  }
  if (response.status >= 500 && response.status < 600) {
    return HealthState::Degraded;
  }
  return HealthState::Unhealthy;
}

HealthChecker::HealthChecker(HealthCheckerOptions options, std::shared_ptr<net::HttpClient> http)
    : options_(std::move(options)), http_(std::move(http)) {}

std::string HealthChecker::probe_url(const fleet::LogicalService service) const {
  const auto &target = probe_target(service);
  std::string base = options_.base_url;
  if (base.empty()) {
    base = "https://" + std::string(target.subdomain) + "." + options_.domain;
  }
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + std::string(target.path);
}

std::optional<std::string> HealthChecker::probe_url(const std::string &name) const {
  const auto service = fleet::parse_service(name);
  if (!service.has_value()) {
    return std::nullopt;
  }
  return probe_url(*service);
}

HealthStatus HealthChecker::check_service(const std::string &name) const {
  const auto started = std::chrono::steady_clock::now();
  HealthStatus status{.service = name,
                      .status = HealthState::Unhealthy,
                      .latency_ms = 0,
                      .details = std::nullopt};

  const auto url = probe_url(name);
  if (url.has_value() && http_ != nullptr) {
    const auto response = http_->get(*url, net::HttpRequestOptions{.timeout_ms = options_.timeout_ms,
                                                                   .connect_timeout_ms = 0,
                                                                   .follow_redirects = false,
                                                                   .verify_tls = false});
    status.status = classify_response(response);
  }
  status.latency_ms = elapsed_ms(started);

  if (!url.has_value()) {
    observability::record_error("health", "unknown service: " + name);
  }
  observability::record_health_probe(name, std::string(to_string(status.status)),
                                     std::chrono::milliseconds(status.latency_ms));
  return status;
}

std::vector<HealthStatus> HealthChecker::check_services(const std::vector<std::string> &names) const {
  std::vector<std::future<HealthStatus>> pending;
  pending.reserve(names.size());
  for (const auto &name : names) {
    pending.push_back(
        std::async(std::launch::async, [this, name]() { return check_service(name); }));
  }

  std::vector<HealthStatus> results;
  results.reserve(pending.size());
  for (auto &future : pending) {
    results.push_back(future.get());
  }
  return results;
}

void print_health_status(std::ostream &out, const HealthStatus &status, const bool verbose) {
  const char *indicator = "✗";
  if (status.status == HealthState::Healthy) {
    indicator = "✓";
  } else if (status.status == HealthState::Degraded) {
    indicator = "!";
  }

  out << indicator << " " << status.service << " ";
  if (verbose) {
    out << "\n";
    out << "  Status: " << to_string(status.status) << "\n";
    out << "  Latency: " << status.latency_ms << "ms\n";
    if (status.details.has_value()) {
      out << "  Details: " << *status.details << "\n";
    }
    return;
  }
  out << "- " << to_string(status.status) << "\n";
}

} // namespace skyhost::health

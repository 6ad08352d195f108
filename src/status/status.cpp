#include "skyhost/status/status.hpp"

#include "skyhost/common/json_util.hpp"
#include "skyhost/common/time.hpp"
#include "skyhost/fleet/catalog.hpp"
#include "skyhost/observability/global.hpp"

#include <sstream>
#include <vector>

namespace skyhost::status {

namespace {

void write_optional(std::ostringstream &json, const std::optional<std::string> &value) {
  if (value.has_value()) {
    json << "\"" << common::json_escape(*value) << "\"";
  } else {
    json << "null";
  }
}

} // namespace

StatusManager::StatusManager(std::shared_ptr<fleet::ITopologySource> topology,
                             std::shared_ptr<const health::HealthChecker> health)
    : topology_(std::move(topology)), health_(std::move(health)) {}

common::Result<SystemStatus> StatusManager::snapshot(const SnapshotOptions &options) const {
  if (topology_ == nullptr) {
    return common::Result<SystemStatus>::failure(common::ErrorKind::Orchestration,
                                                 "no topology source configured");
  }
  const auto topology = topology_->query_topology();
  if (!topology.ok()) {
    return common::Result<SystemStatus>::failure(topology.error_details());
  }
  const auto &live = topology.value().services;

  SystemStatus system;
  std::size_t running = 0;
  for (const auto service : fleet::kAllServices) {
    const std::string name(fleet::to_string(service));
    ServiceStatus entry{.name = name,
                        .running = false,
                        .healthy = false,
                        .endpoint = std::nullopt,
                        .version = std::nullopt,
                        .details = {}};

    if (const auto it = live.find(name); it != live.end()) {
      const auto &process = it->second;
      entry.running = process.running;
      if (process.image.has_value()) {
        entry.version = fleet::image_tag(*process.image);
      }
      if (options.verbose) {
        entry.details["state"] = process.state;
        for (std::size_t i = 0; i < process.ports.size(); ++i) {
          entry.details["port_" + std::to_string(i)] = process.ports[i];
        }
      }
    }
    if (entry.running) {
      ++running;
    }
    system.services.emplace(name, std::move(entry));
  }

  if (options.probe_health && health_ != nullptr) {
    std::vector<std::string> names;
    for (const auto service : fleet::kAllServices) {
      names.emplace_back(fleet::to_string(service));
    }
    for (const auto &probe : health_->check_services(names)) {
      auto &entry = system.services.at(probe.service);
      entry.healthy = probe.status == health::HealthState::Healthy;
      entry.endpoint = health_->probe_url(probe.service);
      if (options.verbose) {
        entry.details["health"] = std::string(health::to_string(probe.status));
        entry.details["latency_ms"] = std::to_string(probe.latency_ms);
      }
    }
  }

  system.timestamp = std::chrono::system_clock::now();
  observability::record_snapshot(system.services.size(), running);
  return common::Result<SystemStatus>::success(std::move(system));
}

void print_status(std::ostream &out, const SystemStatus &status, const bool verbose) {
  out << "\nService Status:\n";
  out << "=============\n";

  for (const auto service : fleet::kAllServices) {
    const auto it = status.services.find(std::string(fleet::to_string(service)));
    if (it == status.services.end()) {
      continue;
    }
    const auto &entry = it->second;
    out << (entry.running ? "✓" : "✗") << " " << entry.name << " ";
    if (verbose) {
      out << "\n";
      for (const auto &[key, value] : entry.details) {
        out << "  " << key << ": " << value << "\n";
      }
      if (entry.version.has_value()) {
        out << "  version: " << *entry.version << "\n";
      }
      if (entry.endpoint.has_value()) {
        out << "  endpoint: " << *entry.endpoint << "\n";
      }
    } else {
      out << "- " << (entry.running ? "Running" : "Stopped");
      if (entry.endpoint.has_value()) {
        out << " (" << (entry.healthy ? "healthy" : "not healthy") << ")";
      }
      out << "\n";
    }
  }

  out << "\nLast Updated: " << common::format_rfc3339(status.timestamp) << "\n\n";
}

std::string status_json(const SystemStatus &status) {
  std::ostringstream json;
  json << "{\"services\":{";
  bool first = true;
  for (const auto &[name, entry] : status.services) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << "\"" << common::json_escape(name) << "\":{";
    json << "\"name\":\"" << common::json_escape(entry.name) << "\",";
    json << "\"running\":" << (entry.running ? "true" : "false") << ",";
    json << "\"healthy\":" << (entry.healthy ? "true" : "false") << ",";
    json << "\"endpoint\":";
    write_optional(json, entry.endpoint);
    json << ",\"version\":";
    write_optional(json, entry.version);
    json << ",\"details\":{";
    bool first_detail = true;
    for (const auto &[key, value] : entry.details) {
      if (!first_detail) {
        json << ",";
      }
      first_detail = false;
      json << "\"" << common::json_escape(key) << "\":\"" << common::json_escape(value) << "\"";
    }
    json << "}}";
  }
  json << "},\"timestamp\":\"" << common::format_rfc3339(status.timestamp) << "\"}";
  return json.str();
}

} // namespace skyhost::status

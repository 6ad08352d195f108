#pragma once

#include "skyhost/common/result.hpp"
#include "skyhost/fleet/topology.hpp"
#include "skyhost/health/health.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace skyhost::status {

struct ServiceStatus {
  std::string name;
  bool running = false;
  // Only meaningful when the snapshot was taken with probe_health.
  bool healthy = false;
  std::optional<std::string> endpoint;
  std::optional<std::string> version;
  std::map<std::string, std::string> details;
};

struct SystemStatus {
  std::map<std::string, ServiceStatus> services;
  std::chrono::system_clock::time_point timestamp;
};

struct SnapshotOptions {
  bool verbose = false;
  bool probe_health = false;
};

class StatusManager {
public:
  explicit StatusManager(std::shared_ptr<fleet::ITopologySource> topology,
                         std::shared_ptr<const health::HealthChecker> health = nullptr);

  /// One topology query, then one entry per catalog service. Orchestration errors from
  /// the topology query are returned unchanged.
  [[nodiscard]] common::Result<SystemStatus> snapshot(const SnapshotOptions &options = {}) const;

private:
  std::shared_ptr<fleet::ITopologySource> topology_;
  std::shared_ptr<const health::HealthChecker> health_;
};

void print_status(std::ostream &out, const SystemStatus &status, bool verbose);
[[nodiscard]] std::string status_json(const SystemStatus &status);

} // namespace skyhost::status

#pragma once

#include "skyhost/common/result.hpp"
#include "skyhost/config/schema.hpp"
#include "skyhost/fleet/topology.hpp"
#include "skyhost/process/runner.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace skyhost::fleet {

struct ComposeOptions {
  std::filesystem::path compose_file = "docker-compose.yml";
  std::filesystem::path secrets_file = "config/secrets.toml";
  std::string compose_command = "docker-compose";
  std::string docker_command = "docker";
  // std::nullopt disables the limit.
  std::optional<std::chrono::milliseconds> tool_timeout = std::chrono::seconds(600);
};

[[nodiscard]] ComposeOptions compose_options_from(const config::FleetConfig &fleet);

/// Drives the process group through the external compose tool. All failures are
/// Orchestration errors carrying the tool's own diagnostic.
class ComposeController final : public ITopologySource {
public:
  ComposeController(ComposeOptions options, std::map<std::string, std::string> env,
                    std::shared_ptr<process::ICommandRunner> runner);

  [[nodiscard]] common::Status
  start(const std::optional<std::vector<std::string>> &services = std::nullopt);
  [[nodiscard]] common::Status stop(bool purge);
  [[nodiscard]] common::Status check_dependencies();
  [[nodiscard]] common::Result<Topology> query_topology() override;

  [[nodiscard]] const ComposeOptions &options() const { return options_; }

private:
  [[nodiscard]] std::vector<std::string> compose_argv(const std::vector<std::string> &args) const;
  [[nodiscard]] common::Result<process::ProcessResult>
  invoke(const std::vector<std::string> &argv, const process::CommandOptions &options,
         const std::string &action);
  [[nodiscard]] common::Status require_compose_file() const;

  ComposeOptions options_;
  std::map<std::string, std::string> env_;
  std::shared_ptr<process::ICommandRunner> runner_;
};

} // namespace skyhost::fleet

#pragma once

#include "skyhost/common/result.hpp"
#include "skyhost/config/schema.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace skyhost::config {

[[nodiscard]] std::filesystem::path config_path();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_from(const std::filesystem::path &path);
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Fails on hard errors; the value holds non-fatal warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Environment handed to the compose tool on start (DOMAIN, BIND_ADDRESS, USE_TLS).
[[nodiscard]] std::map<std::string, std::string> env_vars(const Config &config);

} // namespace skyhost::config

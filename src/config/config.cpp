#include "skyhost/config/config.hpp"

#include "skyhost/common/fs.hpp"
#include "skyhost/common/toml.hpp"

#include <array>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <set>

namespace skyhost::config {

namespace {

constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::uint16_t read_port(const common::TomlDocument &doc, const std::string &key,
                        const std::uint16_t fallback) {
  const auto value = doc.get_u64(key, fallback);
  if (value > std::numeric_limits<std::uint16_t>::max()) {
    return 0;
  }
  return static_cast<std::uint16_t>(value);
}

void load_network(Config &config, const common::TomlDocument &doc) {
  auto &network = config.network;
  network.domain = doc.get_string("network.domain", network.domain);
  network.bind_address = doc.get_string("network.bind_address", network.bind_address);
  network.use_tls = doc.get_bool("network.use_tls", network.use_tls);
  network.ports.http = read_port(doc, "network.ports.http", network.ports.http);
  network.ports.https = read_port(doc, "network.ports.https", network.ports.https);
  network.ports.pds = read_port(doc, "network.ports.pds", network.ports.pds);
  network.ports.plc = read_port(doc, "network.ports.plc", network.ports.plc);
}

void load_fleet(Config &config, const common::TomlDocument &doc) {
  auto &fleet = config.fleet;
  fleet.compose_file = expand_config_value(doc.get_string("fleet.compose_file", fleet.compose_file));
  fleet.secrets_file = expand_config_value(doc.get_string("fleet.secrets_file", fleet.secrets_file));
  fleet.proxy_config_dir =
      expand_config_value(doc.get_string("fleet.proxy_config_dir", fleet.proxy_config_dir));
  fleet.compose_command = doc.get_string("fleet.compose_command", fleet.compose_command);
  fleet.docker_command = doc.get_string("fleet.docker_command", fleet.docker_command);
  fleet.tool_timeout_secs = doc.get_u64("fleet.tool_timeout_secs", fleet.tool_timeout_secs);
}

} // namespace

std::filesystem::path config_path() {
  if (g_config_path_override.has_value()) {
    return *g_config_path_override;
  }
  if (const char *env = std::getenv("SKYHOST_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::filesystem::path(CONFIG_FILENAME);
}

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Config,
                                           "failed to parse config: " + parsed.error());
  }

  const auto &doc = parsed.value();
  Config config;
  load_network(config, doc);

  config.storage.data_dir =
      expand_config_value(doc.get_string("storage.data_dir", config.storage.data_dir));
  config.storage.cert_dir =
      expand_config_value(doc.get_string("storage.cert_dir", config.storage.cert_dir));
  config.storage.persist_data = doc.get_bool("storage.persist_data", config.storage.persist_data);

  config.email.smtp_url = doc.get_string("email.smtp_url", config.email.smtp_url);
  config.email.cert_email = doc.get_string("email.cert_email", config.email.cert_email);
  config.email.admin_email = doc.get_string("email.admin_email", config.email.admin_email);

  load_fleet(config, doc);

  config.probes.timeout_ms = doc.get_u64("probes.timeout_ms", config.probes.timeout_ms);
  config.probes.dns_timeout_secs =
      doc.get_u64("probes.dns_timeout_secs", config.probes.dns_timeout_secs);
  config.probes.base_url = doc.get_string("probes.base_url", config.probes.base_url);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.level = doc.get_string("observability.level", config.observability.level);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config_from(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Config,
                                           "failed to read config file: " + content.error());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return config;
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<Config> load_config() { return load_config_from(config_path()); }

void apply_env_overrides(Config &config) {
  if (const char *domain = std::getenv("SKYHOST_DOMAIN"); domain != nullptr && *domain) {
    config.network.domain = domain;
  }
  if (const char *compose = std::getenv("SKYHOST_COMPOSE_FILE"); compose != nullptr && *compose) {
    config.fleet.compose_file = common::expand_path(compose);
  }
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.network.domain).empty()) {
    return ValidationResult::failure(common::ErrorKind::Config, "Domain cannot be empty");
  }
  if (common::trim(config.network.bind_address).empty()) {
    return ValidationResult::failure(common::ErrorKind::Config, "Bind address cannot be empty");
  }

  const auto &ports = config.network.ports;
  const std::array<std::uint16_t, 4> values = {ports.http, ports.https, ports.pds, ports.plc};
  for (const auto port : values) {
    if (port == 0) {
      return ValidationResult::failure(common::ErrorKind::Config,
                                       "Port numbers must be between 1 and 65535");
    }
  }
  if (std::set<std::uint16_t>(values.begin(), values.end()).size() != values.size()) {
    return ValidationResult::failure(common::ErrorKind::Config, "Port numbers must be unique");
  }

  if (common::trim(config.fleet.compose_command).empty()) {
    return ValidationResult::failure(common::ErrorKind::Config,
                                     "fleet.compose_command cannot be empty");
  }
  if (common::trim(config.fleet.compose_file).empty()) {
    return ValidationResult::failure(common::ErrorKind::Config,
                                     "fleet.compose_file cannot be empty");
  }
  if (config.fleet.tool_timeout_secs == 0) {
    warnings.push_back("fleet.tool_timeout_secs is 0; compose invocations will not time out");
  }

  if (config.probes.timeout_ms == 0) {
    return ValidationResult::failure(common::ErrorKind::Config,
                                     "probes.timeout_ms must be greater than 0");
  }
  if (config.probes.dns_timeout_secs == 0) {
    return ValidationResult::failure(common::ErrorKind::Config,
                                     "probes.dns_timeout_secs must be greater than 0");
  }
  if (!config.probes.base_url.empty()) {
    warnings.push_back("probes.base_url overrides every service endpoint");
  }

  for (const auto &part : common::split(config.observability.backend, ',')) {
    const std::string backend = common::to_lower(common::trim(part));
    if (backend != "log" && backend != "none" && backend != "noop") {
      return ValidationResult::failure(common::ErrorKind::Config,
                                       "Invalid observability.backend: " +
                                           config.observability.backend);
    }
  }

  const std::string level = common::to_lower(config.observability.level);
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    return ValidationResult::failure(common::ErrorKind::Config,
                                     "Invalid observability.level: " + config.observability.level);
  }

  return ValidationResult::success(std::move(warnings));
}

std::map<std::string, std::string> env_vars(const Config &config) {
  return {
      {"DOMAIN", config.network.domain},
      {"BIND_ADDRESS", config.network.bind_address},
      {"USE_TLS", config.network.use_tls ? "true" : "false"},
  };
}

} // namespace skyhost::config

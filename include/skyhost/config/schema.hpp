#pragma once

#include <cstdint>
#include <string>

namespace skyhost::config {

struct PortsConfig {
  std::uint16_t http = 80;
  std::uint16_t https = 443;
  std::uint16_t pds = 2583;
  std::uint16_t plc = 2582;
};

struct NetworkConfig {
  std::string domain = "localhost";
  std::string bind_address = "0.0.0.0";
  bool use_tls = true;
  PortsConfig ports;
};

struct StorageConfig {
  std::string data_dir = "./data";
  std::string cert_dir = "./certs";
  bool persist_data = true;
};

struct EmailConfig {
  std::string smtp_url;
  std::string cert_email = "admin@localhost";
  std::string admin_email = "admin@localhost";
};

struct FleetConfig {
  std::string compose_file = "docker-compose.yml";
  std::string secrets_file = "config/secrets.toml";
  std::string proxy_config_dir = "config/caddy";
  // "docker-compose" or "docker compose"; split on whitespace when invoked.
  std::string compose_command = "docker-compose";
  std::string docker_command = "docker";
  // 0 disables the limit.
  std::uint64_t tool_timeout_secs = 600;
};

struct ProbesConfig {
  std::uint64_t timeout_ms = 5'000;
  std::uint64_t dns_timeout_secs = 2;
  // Replaces https://<service>.<domain> when set, e.g. http://127.0.0.1:8080.
  std::string base_url;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  NetworkConfig network;
  StorageConfig storage;
  EmailConfig email;
  FleetConfig fleet;
  ProbesConfig probes;
  ObservabilityConfig observability;
};

} // namespace skyhost::config

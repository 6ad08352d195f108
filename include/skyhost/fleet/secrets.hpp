#pragma once

#include "skyhost/common/result.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace skyhost::fleet {

struct Secrets {
  std::string pds_jwt_secret;
  std::string pds_admin_password;
  std::string pds_plc_rotation_key;

  /// PDS_JWT_SECRET, PDS_ADMIN_PASSWORD and PDS_PLC_ROTATION_KEY_K256.
  [[nodiscard]] std::map<std::string, std::string> as_env_vars() const;
};

[[nodiscard]] common::Result<Secrets> parse_secrets(const std::string &content);

/// Environment derived from the secrets file. A missing file yields an empty map;
/// an unreadable or incomplete one is a Config error.
[[nodiscard]] common::Result<std::map<std::string, std::string>>
load_secret_env(const std::filesystem::path &path);

} // namespace skyhost::fleet

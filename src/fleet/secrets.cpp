#include "skyhost/fleet/secrets.hpp"

#include "skyhost/common/fs.hpp"
#include "skyhost/common/toml.hpp"

#include <array>
#include <utility>

namespace skyhost::fleet {

std::map<std::string, std::string> Secrets::as_env_vars() const {
  return {
      {"PDS_JWT_SECRET", pds_jwt_secret},
      {"PDS_ADMIN_PASSWORD", pds_admin_password},
      {"PDS_PLC_ROTATION_KEY_K256", pds_plc_rotation_key},
  };
}

common::Result<Secrets> parse_secrets(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Secrets>::failure(common::ErrorKind::Config,
                                            "failed to parse secrets: " + parsed.error());
  }
  const auto &doc = parsed.value();

  Secrets secrets;
  const std::array<std::pair<const char *, std::string *>, 3> fields = {{
      {"pds_jwt_secret", &secrets.pds_jwt_secret},
      {"pds_admin_password", &secrets.pds_admin_password},
      {"pds_plc_rotation_key", &secrets.pds_plc_rotation_key},
  }};
  for (const auto &[key, target] : fields) {
    if (!doc.has(key)) {
      return common::Result<Secrets>::failure(common::ErrorKind::Config,
                                              std::string("secrets file is missing ") + key);
    }
    *target = doc.get_string(key);
  }
  return common::Result<Secrets>::success(std::move(secrets));
}

common::Result<std::map<std::string, std::string>>
load_secret_env(const std::filesystem::path &path) {
  using EnvResult = common::Result<std::map<std::string, std::string>>;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return EnvResult::success({});
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return EnvResult::failure(common::ErrorKind::Config,
                              "failed to read secrets file: " + content.error());
  }
  const auto secrets = parse_secrets(content.value());
  if (!secrets.ok()) {
    return EnvResult::failure(secrets.error_details());
  }
  return EnvResult::success(secrets.value().as_env_vars());
}

} // namespace skyhost::fleet

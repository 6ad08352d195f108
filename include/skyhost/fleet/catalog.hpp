#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace skyhost::fleet {

enum class LogicalService {
  Pds,
  Plc,
  AppView,
  Bgs,
  SocialApp,
  Ozone,
  FeedGenerator,
  Jetstream,
};

inline constexpr std::array<LogicalService, 8> kAllServices = {
    LogicalService::Pds,       LogicalService::Plc,   LogicalService::AppView,
    LogicalService::Bgs,       LogicalService::SocialApp, LogicalService::Ozone,
    LogicalService::FeedGenerator, LogicalService::Jetstream,
};

/// Wire name as used by the compose file and on the command line.
[[nodiscard]] std::string_view to_string(LogicalService service);
[[nodiscard]] std::optional<LogicalService> parse_service(std::string_view name);

} // namespace skyhost::fleet

#include "skyhost/fleet/catalog.hpp"

namespace skyhost::fleet {

std::string_view to_string(const LogicalService service) {
  switch (service) {
  case LogicalService::Pds:
    return "pds";
  case LogicalService::Plc:
    return "plc";
  case LogicalService::AppView:
    return "appview";
  case LogicalService::Bgs:
    return "bgs";
  case LogicalService::SocialApp:
    return "social-app";
  case LogicalService::Ozone:
    return "ozone";
  case LogicalService::FeedGenerator:
    return "feed-generator";
  case LogicalService::Jetstream:
    return "jetstream";
  }
  return "unknown";
}

std::optional<LogicalService> parse_service(const std::string_view name) {
  for (const auto service : kAllServices) {
    if (to_string(service) == name) {
      return service;
    }
  }
  return std::nullopt;
}

} // namespace skyhost::fleet

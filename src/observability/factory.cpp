#include "skyhost/observability/factory.hpp"

#include "skyhost/common/fs.hpp"
#include "skyhost/observability/log_observer.hpp"
#include "skyhost/observability/multi_observer.hpp"
#include "skyhost/observability/noop_observer.hpp"

namespace skyhost::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend, const LogLevel level) {
  if (backend == "log") {
    return std::make_unique<LogObserver>(level);
  }
  return std::make_unique<NoopObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  const LogLevel level = parse_log_level(config.level);
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') == std::string::npos) {
    return create_single(backend, level);
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &part : common::split(backend, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty()) {
      multi->add(create_single(name, level));
    }
  }
  return multi;
}

} // namespace skyhost::observability

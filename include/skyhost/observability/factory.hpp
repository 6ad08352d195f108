#pragma once

#include "skyhost/config/schema.hpp"
#include "skyhost/observability/observer.hpp"

#include <memory>

namespace skyhost::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

} // namespace skyhost::observability

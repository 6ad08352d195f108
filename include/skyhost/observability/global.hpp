#pragma once

#include "skyhost/observability/observer.hpp"

#include <memory>

namespace skyhost::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_tool_invocation(const std::string &command, int exit_code,
                            std::chrono::milliseconds duration, bool timed_out);
void record_lifecycle(const std::string &action, const std::string &target);
void record_health_probe(const std::string &service, const std::string &state,
                         std::chrono::milliseconds latency);
void record_readiness_stage(const std::string &stage, const std::string &outcome,
                            const std::string &detail = "");
void record_snapshot(std::size_t services, std::size_t running);
void record_dropped_records(std::uint64_t count);
void record_config_warning(const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace skyhost::observability

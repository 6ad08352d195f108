#include "skyhost/observability/global.hpp"

#include <mutex>

namespace skyhost::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_tool_invocation(const std::string &command, const int exit_code,
                            const std::chrono::milliseconds duration, const bool timed_out) {
  record_event(ToolInvocationEvent{
      .command = command, .exit_code = exit_code, .duration = duration, .timed_out = timed_out});
}

void record_lifecycle(const std::string &action, const std::string &target) {
  record_event(LifecycleEvent{.action = action, .target = target});
}

void record_health_probe(const std::string &service, const std::string &state,
                         const std::chrono::milliseconds latency) {
  record_event(HealthProbeEvent{.service = service, .state = state, .latency = latency});
  record_metric(ProbeLatencyMetric{.service = service, .latency = latency});
}

void record_readiness_stage(const std::string &stage, const std::string &outcome,
                            const std::string &detail) {
  record_event(ReadinessStageEvent{.stage = stage, .outcome = outcome, .detail = detail});
}

void record_snapshot(const std::size_t services, const std::size_t running) {
  record_event(SnapshotEvent{.services = services, .running = running});
}

void record_dropped_records(const std::uint64_t count) {
  record_metric(DroppedRecordsMetric{.count = count});
}

void record_config_warning(const std::string &message) {
  record_event(ConfigWarningEvent{.message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace skyhost::observability

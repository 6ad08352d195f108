#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace skyhost::observability {

struct ToolInvocationEvent {
  std::string command;
  int exit_code = 0;
  std::chrono::milliseconds duration{0};
  bool timed_out = false;
};

struct LifecycleEvent {
  std::string action;
  std::string target;
};

struct HealthProbeEvent {
  std::string service;
  std::string state;
  std::chrono::milliseconds latency{0};
};

struct ReadinessStageEvent {
  std::string stage;
  std::string outcome;
  std::string detail;
};

struct SnapshotEvent {
  std::size_t services = 0;
  std::size_t running = 0;
};

struct ConfigWarningEvent {
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ToolInvocationEvent, LifecycleEvent, HealthProbeEvent,
                                   ReadinessStageEvent, SnapshotEvent, ConfigWarningEvent,
                                   ErrorEvent>;

struct ProbeLatencyMetric {
  std::string service;
  std::chrono::milliseconds latency{0};
};

struct DroppedRecordsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ProbeLatencyMetric, DroppedRecordsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace skyhost::observability

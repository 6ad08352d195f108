#include "skyhost/observability/log_observer.hpp"

#include "skyhost/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace skyhost::observability {

namespace {

const char *level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::string ms(const std::chrono::milliseconds value) {
  return std::to_string(value.count()) + "ms";
}

} // namespace

LogLevel parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ToolInvocationEvent>) {
          if (evt.timed_out) {
            log_line(LogLevel::Warn, "tool.timeout command=\"" + evt.command +
                                         "\" after=" + ms(evt.duration));
          } else {
            log_line(LogLevel::Debug, "tool.exit command=\"" + evt.command +
                                          "\" code=" + std::to_string(evt.exit_code) +
                                          " duration=" + ms(evt.duration));
          }
        } else if constexpr (std::is_same_v<T, LifecycleEvent>) {
          const LogLevel level = evt.action == "purge" ? LogLevel::Warn : LogLevel::Info;
          log_line(level, "fleet." + evt.action + " target=" + evt.target);
        } else if constexpr (std::is_same_v<T, HealthProbeEvent>) {
          log_line(LogLevel::Debug, "health.probe service=" + evt.service + " state=" + evt.state +
                                        " latency=" + ms(evt.latency));
        } else if constexpr (std::is_same_v<T, ReadinessStageEvent>) {
          std::string line = "readiness." + evt.stage + " outcome=" + evt.outcome;
          if (!evt.detail.empty()) {
            line += " detail=\"" + evt.detail + "\"";
          }
          log_line(LogLevel::Debug, line);
        } else if constexpr (std::is_same_v<T, SnapshotEvent>) {
          log_line(LogLevel::Debug, "status.snapshot services=" + std::to_string(evt.services) +
                                        " running=" + std::to_string(evt.running));
        } else if constexpr (std::is_same_v<T, ConfigWarningEvent>) {
          log_line(LogLevel::Warn, "config: " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ProbeLatencyMetric>) {
          log_line(LogLevel::Debug,
                   "metric.probe_latency service=" + m.service + " value=" + ms(m.latency));
        } else if constexpr (std::is_same_v<T, DroppedRecordsMetric>) {
          log_line(LogLevel::Warn,
                   "metric.topology_dropped_records=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace skyhost::observability

#include "docsandbox/observability/log_observer.hpp"

#include "docsandbox/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace docsandbox::observability {

namespace {

const char *level_label(const LogLevel level) {
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

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

std::optional<LogLevel> parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

LogObserver::LogObserver(const LogLevel min_level) : min_level_(min_level), out_(&std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(&out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level_label(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SessionCreatedEvent>) {
          log_line(LogLevel::Info,
                   "session.created token=" + evt.token + " workspace=" + evt.workspace);
        } else if constexpr (std::is_same_v<T, SessionEvictedEvent>) {
          log_line(evt.success ? LogLevel::Info : LogLevel::Warn,
                   "session.evicted token=" + evt.token +
                       " age_ms=" + std::to_string(evt.age.count()) +
                       " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, SweepCompletedEvent>) {
          log_line(LogLevel::Info, "sweep.completed evicted=" + std::to_string(evt.evicted) +
                                       " failed=" + std::to_string(evt.failed));
        } else if constexpr (std::is_same_v<T, WatcherStateEvent>) {
          log_line(LogLevel::Info,
                   "watcher.state backend=" + evt.backend + " running=" + bool_text(evt.running));
        } else if constexpr (std::is_same_v<T, ChangeDetectedEvent>) {
          log_line(LogLevel::Debug, "watcher.change workspace=" + evt.workspace +
                                        " path=" + evt.path +
                                        " admitted=" + bool_text(evt.admitted));
        } else if constexpr (std::is_same_v<T, RegenerationEvent>) {
          if (evt.success) {
            log_line(LogLevel::Info, "regeneration.ok workspace=" + evt.workspace +
                                         " duration_ms=" + std::to_string(evt.duration.count()));
          } else {
            log_line(LogLevel::Warn,
                     "regeneration.failed workspace=" + evt.workspace + " error=" + evt.error);
          }
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(LogLevel::Warn, evt.component + ": " + evt.message);
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
        if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line(LogLevel::Debug, "metric.active_sessions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, RegenerationLatencyMetric>) {
          log_line(LogLevel::Debug,
                   "metric.regeneration_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ArtifactSizeMetric>) {
          log_line(LogLevel::Debug, "metric.artifact_bytes=" + std::to_string(m.bytes));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace docsandbox::observability

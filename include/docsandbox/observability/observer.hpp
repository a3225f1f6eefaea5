#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace docsandbox::observability {

struct SessionCreatedEvent {
  std::string token;
  std::string workspace;
};

struct SessionEvictedEvent {
  std::string token;
  std::chrono::milliseconds age{0};
  bool success = false;
};

struct SweepCompletedEvent {
  std::size_t evicted = 0;
  std::size_t failed = 0;
};

struct WatcherStateEvent {
  std::string backend;
  bool running = false;
};

struct ChangeDetectedEvent {
  std::string workspace;
  std::string path;
  bool admitted = false;
};

struct RegenerationEvent {
  std::string workspace;
  bool success = false;
  std::chrono::milliseconds duration{0};
  std::string error;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<SessionCreatedEvent, SessionEvictedEvent, SweepCompletedEvent, WatcherStateEvent,
                 ChangeDetectedEvent, RegenerationEvent, WarningEvent, ErrorEvent>;

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

struct RegenerationLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ArtifactSizeMetric {
  std::uint64_t bytes = 0;
};

using ObserverMetric =
    std::variant<ActiveSessionsMetric, RegenerationLatencyMetric, ArtifactSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace docsandbox::observability

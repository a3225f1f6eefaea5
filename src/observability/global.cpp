#include "docsandbox/observability/global.hpp"

#include <mutex>

namespace docsandbox::observability {

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

void record_session_created(const std::string &token, const std::string &workspace) {
  record_event(SessionCreatedEvent{.token = token, .workspace = workspace});
}

void record_session_evicted(const std::string &token, std::chrono::milliseconds age,
                            const bool success) {
  record_event(SessionEvictedEvent{.token = token, .age = age, .success = success});
}

void record_sweep_completed(const std::size_t evicted, const std::size_t failed) {
  record_event(SweepCompletedEvent{.evicted = evicted, .failed = failed});
}

void record_watcher_state(const std::string &backend, const bool running) {
  record_event(WatcherStateEvent{.backend = backend, .running = running});
}

void record_change_detected(const std::string &workspace, const std::string &path,
                            const bool admitted) {
  record_event(ChangeDetectedEvent{.workspace = workspace, .path = path, .admitted = admitted});
}

void record_regeneration(const std::string &workspace, const bool success,
                         std::chrono::milliseconds duration, const std::string &error) {
  record_event(RegenerationEvent{
      .workspace = workspace, .success = success, .duration = duration, .error = error});
  record_metric(RegenerationLatencyMetric{.latency = duration});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace docsandbox::observability

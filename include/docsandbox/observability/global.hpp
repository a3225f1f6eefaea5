#pragma once

#include "docsandbox/observability/observer.hpp"

#include <memory>

namespace docsandbox::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_session_created(const std::string &token, const std::string &workspace);
void record_session_evicted(const std::string &token, std::chrono::milliseconds age, bool success);
void record_sweep_completed(std::size_t evicted, std::size_t failed);
void record_watcher_state(const std::string &backend, bool running);
void record_change_detected(const std::string &workspace, const std::string &path, bool admitted);
void record_regeneration(const std::string &workspace, bool success,
                         std::chrono::milliseconds duration, const std::string &error = "");
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace docsandbox::observability

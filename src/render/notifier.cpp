#include "docsandbox/render/notifier.hpp"

#include "docsandbox/common/json_util.hpp"
#include "docsandbox/observability/global.hpp"

#include <iostream>
#include <sstream>
#include <type_traits>
#include <vector>

namespace docsandbox::render {

std::string artifact_event_name(const ArtifactEvent &event) {
  return std::holds_alternative<ArtifactUpdated>(event) ? "artifact-updated" : "artifact-failed";
}

std::string artifact_event_json(const ArtifactEvent &event) {
  std::ostringstream json;
  std::visit(
      [&json](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ArtifactUpdated>) {
          json << "{\"event\":\"artifact-updated\",\"workspace\":\""
               << common::json_escape(evt.workspace) << "\",\"timestamp\":\"" << evt.timestamp
               << "\",\"size\":" << evt.size << "}";
        } else {
          json << "{\"event\":\"artifact-failed\",\"workspace\":\""
               << common::json_escape(evt.workspace) << "\",\"error\":{\"message\":\""
               << common::json_escape(evt.error.message) << "\",\"trace\":\""
               << common::json_escape(evt.error.trace) << "\",\"timestamp\":\""
               << evt.error.timestamp << "\"}}";
        }
      },
      event);
  return json.str();
}

ArtifactNotifier::SubscriptionId ArtifactNotifier::subscribe(ArtifactListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = next_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void ArtifactNotifier::unsubscribe(const SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(id);
}

void ArtifactNotifier::publish(const ArtifactEvent &event) {
  std::vector<ArtifactListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners.reserve(listeners_.size());
    for (const auto &[id, listener] : listeners_) {
      listeners.push_back(listener);
    }
  }

  for (const auto &listener : listeners) {
    try {
      listener(event);
    } catch (const std::exception &ex) {
      observability::record_error("notifier", std::string("listener_exception: ") + ex.what());
      std::cerr << "[notifier] listener_exception " << ex.what() << "\n";
    }
  }
}

std::size_t ArtifactNotifier::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

} // namespace docsandbox::render

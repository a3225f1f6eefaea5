#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <variant>

namespace docsandbox::render {

struct RegenerationError {
  std::string message;
  std::string trace;
  std::string timestamp;
};

struct ArtifactUpdated {
  std::string workspace;
  std::string timestamp;
  std::uintmax_t size = 0;
};

struct ArtifactFailed {
  std::string workspace;
  RegenerationError error;
};

using ArtifactEvent = std::variant<ArtifactUpdated, ArtifactFailed>;
using ArtifactListener = std::function<void(const ArtifactEvent &event)>;

[[nodiscard]] std::string artifact_event_name(const ArtifactEvent &event);
[[nodiscard]] std::string artifact_event_json(const ArtifactEvent &event);

class ArtifactNotifier {
public:
  using SubscriptionId = std::uint64_t;

  SubscriptionId subscribe(ArtifactListener listener);
  void unsubscribe(SubscriptionId id);
  void publish(const ArtifactEvent &event);
  [[nodiscard]] std::size_t subscriber_count() const;

private:
  mutable std::mutex mutex_;
  std::map<SubscriptionId, ArtifactListener> listeners_;
  SubscriptionId next_id_ = 1;
};

} // namespace docsandbox::render

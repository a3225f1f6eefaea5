#pragma once

#include "docsandbox/common/clock.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace docsandbox::watcher {

/// Leading-edge rate limiter keyed by workspace. The first event after a quiet
/// period is admitted immediately; later events are rejected until `interval`
/// has passed since the last admitted one. Rejections never move the window.
class DebounceGate {
public:
  explicit DebounceGate(common::ClockFn clock = common::default_clock());

  [[nodiscard]] bool admit(const std::string &key, std::chrono::milliseconds interval);
  void forget(const std::string &key);
  [[nodiscard]] std::size_t size() const;

private:
  common::ClockFn clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, common::SteadyTime> last_admitted_;
};

} // namespace docsandbox::watcher

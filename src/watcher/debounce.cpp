#include "docsandbox/watcher/debounce.hpp"

namespace docsandbox::watcher {

DebounceGate::DebounceGate(common::ClockFn clock)
    : clock_(clock ? std::move(clock) : common::default_clock()) {}

bool DebounceGate::admit(const std::string &key, const std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = clock_();
  const auto it = last_admitted_.find(key);
  if (it != last_admitted_.end() && now - it->second < interval) {
    return false;
  }
  last_admitted_[key] = now;
  return true;
}

void DebounceGate::forget(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_admitted_.erase(key);
}

std::size_t DebounceGate::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_admitted_.size();
}

} // namespace docsandbox::watcher

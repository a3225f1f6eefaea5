#include "docsandbox/watcher/polling_backend.hpp"

#include <algorithm>
#include <thread>
#include <vector>

namespace docsandbox::watcher {

PollingBackend::PollingBackend(const std::chrono::milliseconds interval, common::ClockFn clock)
    : interval_(interval), clock_(clock ? std::move(clock) : common::default_clock()) {}

common::Status PollingBackend::open(const std::filesystem::path &root) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return common::Status::error("watch root is not a directory: " + root.string(),
                                 common::ErrorCode::NotFound);
  }
  root_ = root;
  snapshot_ = scan();
  next_scan_ = clock_() + interval_;
  open_ = true;
  return common::Status::success();
}

void PollingBackend::close() {
  open_ = false;
  snapshot_.clear();
}

PollingBackend::Snapshot PollingBackend::scan() const {
  Snapshot out;
  std::error_code ec;
  for (auto it = std::filesystem::recursive_directory_iterator(
           root_, std::filesystem::directory_options::skip_permission_denied, ec);
       !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    // Workspaces may disappear mid-scan when the sweeper evicts them.
    std::error_code entry_ec;
    FileState state;
    state.is_directory = it->is_directory(entry_ec);
    if (entry_ec) {
      continue;
    }
    if (!state.is_directory) {
      if (!it->is_regular_file(entry_ec)) {
        continue;
      }
      state.size = it->file_size(entry_ec);
      if (entry_ec) {
        continue;
      }
    }
    state.modified = it->last_write_time(entry_ec);
    if (entry_ec) {
      continue;
    }
    out.emplace(it->path().string(), state);
  }
  return out;
}

void PollingBackend::scan_now(const WatchEventSink &sink) {
  if (!open_) {
    return;
  }
  Snapshot current = scan();
  std::vector<WatchEvent> events;
  for (const auto &[path, state] : current) {
    const auto previous = snapshot_.find(path);
    if (previous == snapshot_.end()) {
      events.push_back(WatchEvent{
          .path = path, .kind = ChangeKind::Created, .is_directory = state.is_directory});
    } else if (!state.is_directory && (previous->second.modified != state.modified ||
                                       previous->second.size != state.size)) {
      events.push_back(WatchEvent{.path = path, .kind = ChangeKind::Modified});
    }
  }
  snapshot_ = std::move(current);
  next_scan_ = clock_() + interval_;

  std::sort(events.begin(), events.end(),
            [](const WatchEvent &a, const WatchEvent &b) { return a.path < b.path; });
  for (const auto &event : events) {
    sink(event);
  }
}

void PollingBackend::wait(const std::chrono::milliseconds timeout, const WatchEventSink &sink) {
  const auto now = clock_();
  if (now < next_scan_) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(next_scan_ - now);
    std::this_thread::sleep_for(std::min(timeout, std::max(remaining, std::chrono::milliseconds(1))));
    if (clock_() < next_scan_) {
      return;
    }
  }
  scan_now(sink);
}

} // namespace docsandbox::watcher

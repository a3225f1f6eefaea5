#pragma once

#include "docsandbox/common/result.hpp"
#include "docsandbox/watcher/backend.hpp"
#include "docsandbox/watcher/debounce.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace docsandbox::watcher {

struct WatcherOptions {
  std::filesystem::path root;
  std::chrono::milliseconds debounce{500};
  std::vector<std::string> extensions = {".html", ".css", ".json"};
};

using RegenerateCallback = std::function<void(const std::filesystem::path &workspace)>;

class ChangeWatcher {
public:
  ChangeWatcher(WatcherOptions options, std::unique_ptr<WatchBackend> backend, DebounceGate &gate,
                RegenerateCallback callback);
  ~ChangeWatcher();

  ChangeWatcher(const ChangeWatcher &) = delete;
  ChangeWatcher &operator=(const ChangeWatcher &) = delete;

  [[nodiscard]] common::Status start();
  void stop();
  [[nodiscard]] bool is_running() const;

  bool handle_event(const WatchEvent &event);

  [[nodiscard]] std::optional<std::filesystem::path>
  resolve_workspace(const std::filesystem::path &path) const;
  [[nodiscard]] bool is_watched_extension(const std::filesystem::path &path) const;

  [[nodiscard]] std::string_view backend_name() const { return backend_->name(); }
  [[nodiscard]] std::uint64_t admitted_count() const { return admitted_; }

private:
  void run_loop();

  WatcherOptions options_;
  std::filesystem::path root_;
  std::unique_ptr<WatchBackend> backend_;
  DebounceGate &gate_;
  RegenerateCallback callback_;
  std::mutex lifecycle_mutex_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> admitted_{0};
};

} // namespace docsandbox::watcher

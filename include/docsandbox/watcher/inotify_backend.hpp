#pragma once

#ifdef __linux__

#include "docsandbox/watcher/backend.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>

namespace docsandbox::watcher {

class InotifyBackend final : public WatchBackend {
public:
  InotifyBackend() = default;
  ~InotifyBackend() override;

  InotifyBackend(const InotifyBackend &) = delete;
  InotifyBackend &operator=(const InotifyBackend &) = delete;

  [[nodiscard]] common::Status open(const std::filesystem::path &root) override;
  void wait(std::chrono::milliseconds timeout, const WatchEventSink &sink) override;
  void close() override;
  [[nodiscard]] std::string_view name() const override { return "native"; }

  [[nodiscard]] std::size_t watch_count() const { return wd_to_path_.size(); }

private:
  bool add_single_watch(const std::filesystem::path &path);
  void add_watches_recursive(const std::filesystem::path &path);

  int inotify_fd_ = -1;
  std::unordered_map<int, std::filesystem::path> wd_to_path_;
  std::unordered_set<std::string> watched_paths_;
};

} // namespace docsandbox::watcher

#endif // __linux__

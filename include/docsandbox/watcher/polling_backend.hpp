#pragma once

#include "docsandbox/common/clock.hpp"
#include "docsandbox/watcher/backend.hpp"

#include <unordered_map>

namespace docsandbox::watcher {

class PollingBackend final : public WatchBackend {
public:
  explicit PollingBackend(std::chrono::milliseconds interval,
                          common::ClockFn clock = common::default_clock());

  [[nodiscard]] common::Status open(const std::filesystem::path &root) override;
  void wait(std::chrono::milliseconds timeout, const WatchEventSink &sink) override;
  void close() override;
  [[nodiscard]] std::string_view name() const override { return "polling"; }

  void scan_now(const WatchEventSink &sink);
  [[nodiscard]] std::size_t tracked_count() const { return snapshot_.size(); }

private:
  struct FileState {
    std::filesystem::file_time_type modified{};
    std::uintmax_t size = 0;
    bool is_directory = false;
  };
  using Snapshot = std::unordered_map<std::string, FileState>;

  [[nodiscard]] Snapshot scan() const;

  std::chrono::milliseconds interval_;
  common::ClockFn clock_;
  std::filesystem::path root_;
  Snapshot snapshot_;
  common::SteadyTime next_scan_{};
  bool open_ = false;
};

} // namespace docsandbox::watcher

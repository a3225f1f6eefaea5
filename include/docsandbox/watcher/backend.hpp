#pragma once

#include "docsandbox/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace docsandbox::watcher {

enum class ChangeKind { Created, Modified };

struct WatchEvent {
  std::filesystem::path path;
  ChangeKind kind = ChangeKind::Modified;
  bool is_directory = false;
};

using WatchEventSink = std::function<void(const WatchEvent &event)>;

class WatchBackend {
public:
  virtual ~WatchBackend() = default;

  [[nodiscard]] virtual common::Status open(const std::filesystem::path &root) = 0;
  virtual void wait(std::chrono::milliseconds timeout, const WatchEventSink &sink) = 0;
  virtual void close() = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

[[nodiscard]] common::Result<std::unique_ptr<WatchBackend>>
create_backend(const std::string &mode, std::chrono::milliseconds poll_interval);

} // namespace docsandbox::watcher

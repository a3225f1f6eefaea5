#include "docsandbox/watcher/backend.hpp"

#include "docsandbox/common/fs.hpp"
#include "docsandbox/watcher/polling_backend.hpp"

#ifdef __linux__
#include "docsandbox/watcher/inotify_backend.hpp"
#endif

#include <iostream>

namespace docsandbox::watcher {

common::Result<std::unique_ptr<WatchBackend>>
create_backend(const std::string &mode, const std::chrono::milliseconds poll_interval) {
  using BackendResult = common::Result<std::unique_ptr<WatchBackend>>;
  const std::string normalized = common::to_lower(common::trim(mode));
  if (normalized == "polling") {
    return BackendResult::success(std::make_unique<PollingBackend>(poll_interval));
  }
  if (normalized == "native") {
#ifdef __linux__
    return BackendResult::success(std::make_unique<InotifyBackend>());
#else
    std::cerr << "[watcher] native notifications unavailable on this platform, using polling\n";
    return BackendResult::success(std::make_unique<PollingBackend>(poll_interval));
#endif
  }
  return BackendResult::failure("unknown watch mode: " + mode, common::ErrorCode::Config);
}

} // namespace docsandbox::watcher

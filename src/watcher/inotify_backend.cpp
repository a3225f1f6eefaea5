#ifdef __linux__

#include "docsandbox/watcher/inotify_backend.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace docsandbox::watcher {

namespace {

constexpr std::uint32_t WATCH_MASK =
    IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_TO | IN_DELETE_SELF;

} // namespace

InotifyBackend::~InotifyBackend() { close(); }

common::Status InotifyBackend::open(const std::filesystem::path &root) {
  close();
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return common::Status::error("watch root is not a directory: " + root.string(),
                                 common::ErrorCode::NotFound);
  }

  inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (inotify_fd_ < 0) {
    return common::Status::error(std::string("inotify_init1 failed: ") + std::strerror(errno));
  }
  if (!add_single_watch(root)) {
    const std::string reason = std::strerror(errno);
    close();
    return common::Status::error("unable to watch " + root.string() + ": " + reason);
  }
  add_watches_recursive(root);
  return common::Status::success();
}

void InotifyBackend::close() {
  if (inotify_fd_ >= 0) {
    for (const auto &[wd, _] : wd_to_path_) {
      inotify_rm_watch(inotify_fd_, wd);
    }
    ::close(inotify_fd_);
    inotify_fd_ = -1;
  }
  wd_to_path_.clear();
  watched_paths_.clear();
}

bool InotifyBackend::add_single_watch(const std::filesystem::path &path) {
  const std::string key = path.string();
  if (watched_paths_.contains(key)) {
    return true;
  }
  const int wd = inotify_add_watch(inotify_fd_, key.c_str(), WATCH_MASK);
  if (wd < 0) {
    return false;
  }
  wd_to_path_[wd] = path;
  watched_paths_.insert(key);
  return true;
}

void InotifyBackend::add_watches_recursive(const std::filesystem::path &path) {
  std::error_code ec;
  for (auto it = std::filesystem::recursive_directory_iterator(
           path, std::filesystem::directory_options::skip_permission_denied, ec);
       !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_directory(entry_ec) && !add_single_watch(it->path())) {
      std::cerr << "[watcher] unable to watch " << it->path().string() << ": "
                << std::strerror(errno) << "\n";
    }
  }
}

void InotifyBackend::wait(const std::chrono::milliseconds timeout, const WatchEventSink &sink) {
  if (inotify_fd_ < 0) {
    return;
  }

  pollfd fds{.fd = inotify_fd_, .events = POLLIN, .revents = 0};
  const int ready = ::poll(&fds, 1, static_cast<int>(timeout.count()));
  if (ready <= 0 || (fds.revents & POLLIN) == 0) {
    return;
  }

  alignas(inotify_event) std::array<char, 16 * 1024> buffer{};
  while (true) {
    const ssize_t length = ::read(inotify_fd_, buffer.data(), buffer.size());
    if (length <= 0) {
      break;
    }

    for (ssize_t offset = 0; offset < length;) {
      const auto *event = reinterpret_cast<const inotify_event *>(buffer.data() + offset);
      offset += static_cast<ssize_t>(sizeof(inotify_event) + event->len);

      if ((event->mask & IN_IGNORED) != 0) {
        if (const auto it = wd_to_path_.find(event->wd); it != wd_to_path_.end()) {
          watched_paths_.erase(it->second.string());
          wd_to_path_.erase(it);
        }
        continue;
      }
      const auto dir_it = wd_to_path_.find(event->wd);
      if (dir_it == wd_to_path_.end() || event->len == 0) {
        continue;
      }

      const auto path = dir_it->second / event->name;
      const bool is_directory = (event->mask & IN_ISDIR) != 0;
      if (is_directory && (event->mask & (IN_CREATE | IN_MOVED_TO)) != 0) {
        add_single_watch(path);
        add_watches_recursive(path);
      }
      const auto kind =
          (event->mask & (IN_CREATE | IN_MOVED_TO)) != 0 ? ChangeKind::Created : ChangeKind::Modified;
      sink(WatchEvent{.path = path, .kind = kind, .is_directory = is_directory});
    }
  }
}

} // namespace docsandbox::watcher

#endif // __linux__

#include "docsandbox/daemon/pid_file.hpp"

#include "docsandbox/common/fs.hpp"

#include <cerrno>
#include <iostream>
#include <stdexcept>

#include <signal.h>
#include <unistd.h>

namespace docsandbox::daemon {

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

PidFile::~PidFile() { release(); }

std::optional<int> PidFile::recorded_pid() const {
  auto content = common::read_text_file(path_);
  if (!content.ok()) {
    return std::nullopt;
  }
  const std::string text = common::trim(content.value());
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const int pid = std::stoi(text, &consumed);
    if (consumed != text.size() || pid <= 0) {
      return std::nullopt;
    }
    return pid;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

common::Status PidFile::acquire() {
  if (acquired_) {
    return common::Status::success();
  }

  auto dir = common::ensure_dir(path_.parent_path());
  if (!dir.ok()) {
    return common::Status::error("failed to create pid directory: " + dir.error());
  }

  std::error_code ec;
  if (std::filesystem::exists(path_, ec)) {
    const auto existing = recorded_pid();
    if (existing.has_value() && *existing != static_cast<int>(getpid()) &&
        is_process_running(*existing)) {
      return common::Status::error("daemon already running with pid " +
                                       std::to_string(*existing),
                                   common::ErrorCode::InvalidArgument);
    }
    std::cerr << "[daemon] removing stale pid file " << path_.string() << "\n";
    std::filesystem::remove(path_, ec);
  }

  auto written = common::write_text_file(path_, std::to_string(getpid()) + "\n");
  if (!written.ok()) {
    return common::Status::error("failed to write pid file: " + written.error());
  }
  acquired_ = true;
  return common::Status::success();
}

void PidFile::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    std::cerr << "[daemon] failed to remove pid file: " << ec.message() << "\n";
  }
  acquired_ = false;
}

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  // EPERM means the process exists but belongs to someone else.
  return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace docsandbox::daemon

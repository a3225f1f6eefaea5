#pragma once

#include "docsandbox/common/result.hpp"

#include <filesystem>
#include <optional>

namespace docsandbox::daemon {

class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

  [[nodiscard]] common::Status acquire();
  void release();

  [[nodiscard]] bool acquired() const { return acquired_; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  [[nodiscard]] std::optional<int> recorded_pid() const;

  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace docsandbox::daemon

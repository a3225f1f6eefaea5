#pragma once

#include "docsandbox/common/result.hpp"
#include "docsandbox/config/schema.hpp"
#include "docsandbox/daemon/pid_file.hpp"
#include "docsandbox/daemon/state_writer.hpp"
#include "docsandbox/runtime/workspace_service.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>

namespace docsandbox::daemon {

struct DaemonOptions {
  std::filesystem::path state_dir;
  std::chrono::milliseconds state_interval{std::chrono::seconds(5)};
};

class Daemon {
public:
  explicit Daemon(const config::Config &config, runtime::ServiceDependencies deps = {});
  ~Daemon();

  Daemon(const Daemon &) = delete;
  Daemon &operator=(const Daemon &) = delete;

  [[nodiscard]] common::Status start(const DaemonOptions &options = {});
  void stop();
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] runtime::WorkspaceService &service() { return *service_; }
  [[nodiscard]] std::filesystem::path state_file() const;

private:
  config::Config config_;
  std::unique_ptr<runtime::WorkspaceService> service_;
  std::unique_ptr<PidFile> pid_;
  std::unique_ptr<StateWriter> state_writer_;
  std::atomic<bool> running_{false};
};

[[nodiscard]] common::Result<std::filesystem::path> resolve_state_dir(const DaemonOptions &options);

} // namespace docsandbox::daemon

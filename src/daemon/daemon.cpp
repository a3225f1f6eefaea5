#include "docsandbox/daemon/daemon.hpp"

#include "docsandbox/config/config.hpp"
#include "docsandbox/health/health.hpp"
#include "docsandbox/observability/global.hpp"

#include <iostream>

namespace docsandbox::daemon {

common::Result<std::filesystem::path> resolve_state_dir(const DaemonOptions &options) {
  if (!options.state_dir.empty()) {
    return common::Result<std::filesystem::path>::success(options.state_dir);
  }
  return config::config_dir();
}

Daemon::Daemon(const config::Config &config, runtime::ServiceDependencies deps)
    : config_(config),
      service_(std::make_unique<runtime::WorkspaceService>(config_, std::move(deps))) {}

Daemon::~Daemon() { stop(); }

common::Status Daemon::start(const DaemonOptions &options) {
  if (running_) {
    return common::Status::error("daemon already running", common::ErrorCode::InvalidArgument);
  }
  health::mark_component_starting("daemon");

  auto state_dir = resolve_state_dir(options);
  if (!state_dir.ok()) {
    health::mark_component_error("daemon", state_dir.error());
    return state_dir.status();
  }

  auto pid = std::make_unique<PidFile>(state_dir.value() / "daemon.pid");
  auto pid_status = pid->acquire();
  if (!pid_status.ok()) {
    health::mark_component_error("daemon", pid_status.error());
    return pid_status;
  }

  auto started = service_->start_background();
  if (!started.ok()) {
    health::mark_component_error("daemon", started.error());
    observability::record_error("daemon", started.error());
    return started;
  }

  auto *service = service_.get();
  state_writer_ = std::make_unique<StateWriter>(
      state_dir.value() / "daemon_state.json",
      [service]() { return service->store().active_count(); }, options.state_interval);
  pid_ = std::move(pid);
  running_ = true;
  health::mark_component_ok("daemon");
  state_writer_->start();

  std::cerr << "[daemon] managing workspaces under " << service_->store().root().string()
            << " (" << service_->store().active_count() << " adopted)\n";
  return common::Status::success();
}

void Daemon::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  service_->stop_background();
  health::reset_component("daemon");
  if (state_writer_ != nullptr) {
    state_writer_->stop();
    state_writer_.reset();
  }
  if (pid_ != nullptr) {
    pid_->release();
    pid_.reset();
  }
}

bool Daemon::is_running() const { return running_; }

std::filesystem::path Daemon::state_file() const {
  if (state_writer_ != nullptr) {
    return state_writer_->state_file();
  }
  return {};
}

} // namespace docsandbox::daemon

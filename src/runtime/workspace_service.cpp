#include "docsandbox/runtime/workspace_service.hpp"

#include "docsandbox/common/fs.hpp"
#include "docsandbox/health/health.hpp"
#include "docsandbox/render/simple_template_engine.hpp"
#include "docsandbox/sessions/token.hpp"

#include <iostream>

namespace docsandbox::runtime {

WorkspaceService::WorkspaceService(const config::Config &config, ServiceDependencies deps)
    : config_(config), engine_(std::move(deps.engine)), renderer_(std::move(deps.renderer)),
      pending_backend_(std::move(deps.watch_backend)) {
  if (engine_ == nullptr) {
    engine_ = std::make_shared<render::SimpleTemplateEngine>(config_.templates.inject_now);
  }
  if (renderer_ == nullptr) {
    renderer_ =
        std::make_shared<render::CommandRenderer>(config_.renderer.command, config_.renderer.args);
  }
  const common::ClockFn clock = deps.clock ? deps.clock : common::default_clock();

  store_ = std::make_unique<sessions::SessionStore>(
      common::expand_path(config_.workspace.root),
      workspace::WorkspaceFactory(common::expand_path(config_.workspace.template_dir)),
      config_.sessions.lifetime, clock);
  gate_ = std::make_unique<watcher::DebounceGate>(clock);
  notifier_ = std::make_unique<render::ArtifactNotifier>();
  dispatcher_ = std::make_unique<render::RegenerationDispatcher>(
      render::DispatcherOptions{.main_file = config_.workspace.main_file,
                                .params_file = config_.workspace.params_file,
                                .artifact_file = config_.workspace.artifact_file},
      *engine_, *renderer_, *notifier_);
  sweeper_ = std::make_unique<sessions::ExpirySweeper>(
      *store_, sessions::SweeperConfig{.interval = config_.sessions.cleanup_interval,
                                       .lifetime = config_.sessions.lifetime});
  sweeper_->set_on_evicted([this](const std::string &token) { on_evicted(token); });
}

WorkspaceService::~WorkspaceService() { stop_background(); }

void WorkspaceService::on_evicted(const std::string &token) {
  gate_->forget(token);
  dispatcher_->forget(token);
}

common::Status WorkspaceService::start_background() {
  auto root = common::ensure_dir(store_->root());
  if (!root.ok()) {
    return common::Status::error(root.error(), common::ErrorCode::Config);
  }
  auto adopted = store_->adopt_existing();
  if (!adopted.ok()) {
    return adopted.status();
  }

  sweeper_->start();

  if (!config_.watcher.enabled) {
    health::mark_component_ok("watcher");
    return common::Status::success();
  }
  if (watcher_ == nullptr) {
    std::unique_ptr<watcher::WatchBackend> backend = std::move(pending_backend_);
    if (backend == nullptr) {
      auto created = watcher::create_backend(config_.watcher.mode, config_.watcher.poll_interval);
      if (!created.ok()) {
        sweeper_->stop();
        return created.status();
      }
      backend = std::move(created.value());
    }
    watcher_ = std::make_unique<watcher::ChangeWatcher>(
        watcher::WatcherOptions{.root = store_->root(),
                                .debounce = config_.watcher.debounce,
                                .extensions = config_.watcher.extensions},
        std::move(backend), *gate_,
        [this](const std::filesystem::path &workspace) {
          dispatcher_->regenerate_async(workspace);
        });
  }
  auto started = watcher_->start();
  if (!started.ok()) {
    sweeper_->stop();
    return started;
  }
  return common::Status::success();
}

void WorkspaceService::stop_background() {
  if (watcher_ != nullptr && watcher_->is_running()) {
    watcher_->stop();
  }
  sweeper_->stop();
  dispatcher_->wait_idle();
}

common::Result<SessionHandle>
WorkspaceService::resolve_session(const std::optional<std::string> &token) {
  SessionHandle handle;
  if (token.has_value() && sessions::is_valid_token(*token)) {
    handle.token = *token;
  } else {
    if (token.has_value() && !token->empty()) {
      std::cerr << "[sessions] replacing malformed session token\n";
    }
    auto issued = store_->create_session_id();
    if (!issued.ok()) {
      return common::Result<SessionHandle>::failure(issued.status());
    }
    handle.token = issued.value();
    handle.issued = true;
  }

  auto workspace = store_->get_or_create_workspace(handle.token);
  if (!workspace.ok()) {
    return common::Result<SessionHandle>::failure(workspace.status());
  }
  handle.workspace = workspace.value();
  return common::Result<SessionHandle>::success(std::move(handle));
}

common::Result<workspace::WorkspaceFiles> WorkspaceService::files_for(const std::string &token) {
  auto workspace = store_->get_or_create_workspace(token);
  if (!workspace.ok()) {
    return common::Result<workspace::WorkspaceFiles>::failure(workspace.status());
  }
  return common::Result<workspace::WorkspaceFiles>::success(
      workspace::WorkspaceFiles(workspace.value(), config_.workspace.protected_files));
}

common::Result<std::vector<workspace::FileEntry>>
WorkspaceService::list_files(const std::string &token) {
  auto files = files_for(token);
  if (!files.ok()) {
    return common::Result<std::vector<workspace::FileEntry>>::failure(files.status());
  }
  return files.value().list();
}

common::Result<std::string> WorkspaceService::read_file(const std::string &token,
                                                        const std::string &path) {
  auto files = files_for(token);
  if (!files.ok()) {
    return common::Result<std::string>::failure(files.status());
  }
  return files.value().read(path);
}

common::Status WorkspaceService::write_file(const std::string &token, const std::string &path,
                                            const std::string &content) {
  auto files = files_for(token);
  if (!files.ok()) {
    return files.status();
  }
  return files.value().write(path, content);
}

common::Status WorkspaceService::create_file(const std::string &token, const std::string &path,
                                             const std::string &content) {
  auto files = files_for(token);
  if (!files.ok()) {
    return files.status();
  }
  return files.value().create(path, content);
}

common::Status WorkspaceService::delete_file(const std::string &token, const std::string &path) {
  auto files = files_for(token);
  if (!files.ok()) {
    return files.status();
  }
  return files.value().remove(path);
}

common::Result<render::RegenerationOutcome>
WorkspaceService::regenerate(const std::string &token) {
  auto workspace = store_->get_or_create_workspace(token);
  if (!workspace.ok()) {
    return common::Result<render::RegenerationOutcome>::failure(workspace.status());
  }
  return common::Result<render::RegenerationOutcome>::success(
      dispatcher_->regenerate(workspace.value(), true));
}

common::Result<std::string> WorkspaceService::preview(const std::string &token) {
  auto workspace = store_->get_or_create_workspace(token);
  if (!workspace.ok()) {
    return common::Result<std::string>::failure(workspace.status());
  }
  return dispatcher_->preview(workspace.value());
}

common::Result<WorkspaceStatus> WorkspaceService::status(const std::string &token) {
  auto workspace = store_->get_or_create_workspace(token);
  if (!workspace.ok()) {
    return common::Result<WorkspaceStatus>::failure(workspace.status());
  }
  return common::Result<WorkspaceStatus>::success(WorkspaceStatus{
      .artifact = dispatcher_->status(workspace.value()), .session = store_->info(token)});
}

common::Status WorkspaceService::evict(const std::string &token) {
  auto status = store_->evict(token);
  if (status.ok()) {
    on_evicted(token);
  }
  return status;
}

render::ArtifactNotifier::SubscriptionId
WorkspaceService::subscribe(render::ArtifactListener listener) {
  return notifier_->subscribe(std::move(listener));
}

void WorkspaceService::unsubscribe(const render::ArtifactNotifier::SubscriptionId id) {
  notifier_->unsubscribe(id);
}

} // namespace docsandbox::runtime

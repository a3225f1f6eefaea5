#pragma once

#include "docsandbox/common/clock.hpp"
#include "docsandbox/common/result.hpp"
#include "docsandbox/config/schema.hpp"
#include "docsandbox/render/dispatcher.hpp"
#include "docsandbox/render/document_renderer.hpp"
#include "docsandbox/render/notifier.hpp"
#include "docsandbox/render/template_engine.hpp"
#include "docsandbox/sessions/store.hpp"
#include "docsandbox/sessions/sweeper.hpp"
#include "docsandbox/watcher/change_watcher.hpp"
#include "docsandbox/watcher/debounce.hpp"
#include "docsandbox/workspace/files.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docsandbox::runtime {

struct SessionHandle {
  std::string token;
  std::filesystem::path workspace;
  bool issued = false;
};

struct WorkspaceStatus {
  render::ArtifactStatus artifact;
  std::optional<sessions::SessionInfo> session;
};

struct ServiceDependencies {
  std::shared_ptr<render::ITemplateEngine> engine;
  std::shared_ptr<render::IDocumentRenderer> renderer;
  std::unique_ptr<watcher::WatchBackend> watch_backend;
  common::ClockFn clock;
};

class WorkspaceService {
public:
  explicit WorkspaceService(const config::Config &config, ServiceDependencies deps = {});
  ~WorkspaceService();

  WorkspaceService(const WorkspaceService &) = delete;
  WorkspaceService &operator=(const WorkspaceService &) = delete;

  [[nodiscard]] common::Status start_background();
  void stop_background();

  [[nodiscard]] common::Result<SessionHandle>
  resolve_session(const std::optional<std::string> &token);

  [[nodiscard]] common::Result<std::vector<workspace::FileEntry>>
  list_files(const std::string &token);
  [[nodiscard]] common::Result<std::string> read_file(const std::string &token,
                                                      const std::string &path);
  [[nodiscard]] common::Status write_file(const std::string &token, const std::string &path,
                                          const std::string &content);
  [[nodiscard]] common::Status create_file(const std::string &token, const std::string &path,
                                           const std::string &content = "");
  [[nodiscard]] common::Status delete_file(const std::string &token, const std::string &path);

  [[nodiscard]] common::Result<render::RegenerationOutcome> regenerate(const std::string &token);
  [[nodiscard]] common::Result<std::string> preview(const std::string &token);
  [[nodiscard]] common::Result<WorkspaceStatus> status(const std::string &token);
  [[nodiscard]] common::Status evict(const std::string &token);

  render::ArtifactNotifier::SubscriptionId subscribe(render::ArtifactListener listener);
  void unsubscribe(render::ArtifactNotifier::SubscriptionId id);

  [[nodiscard]] sessions::SessionStore &store() { return *store_; }
  [[nodiscard]] sessions::ExpirySweeper &sweeper() { return *sweeper_; }
  [[nodiscard]] render::RegenerationDispatcher &dispatcher() { return *dispatcher_; }
  [[nodiscard]] watcher::DebounceGate &debounce_gate() { return *gate_; }
  [[nodiscard]] watcher::ChangeWatcher *change_watcher() { return watcher_.get(); }

private:
  [[nodiscard]] common::Result<workspace::WorkspaceFiles> files_for(const std::string &token);
  void on_evicted(const std::string &token);

  config::Config config_;
  std::shared_ptr<render::ITemplateEngine> engine_;
  std::shared_ptr<render::IDocumentRenderer> renderer_;
  std::unique_ptr<sessions::SessionStore> store_;
  std::unique_ptr<watcher::DebounceGate> gate_;
  std::unique_ptr<render::ArtifactNotifier> notifier_;
  std::unique_ptr<render::RegenerationDispatcher> dispatcher_;
  std::unique_ptr<sessions::ExpirySweeper> sweeper_;
  std::unique_ptr<watcher::WatchBackend> pending_backend_;
  std::unique_ptr<watcher::ChangeWatcher> watcher_;
};

} // namespace docsandbox::runtime

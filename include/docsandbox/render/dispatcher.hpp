#pragma once

#include "docsandbox/common/result.hpp"
#include "docsandbox/render/document_renderer.hpp"
#include "docsandbox/render/notifier.hpp"
#include "docsandbox/render/template_engine.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace docsandbox::render {

struct DispatcherOptions {
  std::string main_file = "index.html";
  std::string params_file = "params.json";
  std::string artifact_file = "output.pdf";
};

enum class RegenerationOutcome { Rendered, Skipped, Failed };

struct ArtifactStatus {
  bool exists = false;
  std::uintmax_t size = 0;
  std::optional<std::string> last_generated;
  std::optional<RegenerationError> last_error;
};

/// Turns a workspace's main file and parameters into its artifact. Runs for
/// one workspace are serialized; different workspaces never wait on each other.
class RegenerationDispatcher {
public:
  RegenerationDispatcher(DispatcherOptions options, ITemplateEngine &engine,
                         IDocumentRenderer &renderer, ArtifactNotifier &notifier);
  ~RegenerationDispatcher();

  RegenerationDispatcher(const RegenerationDispatcher &) = delete;
  RegenerationDispatcher &operator=(const RegenerationDispatcher &) = delete;

  RegenerationOutcome regenerate(const std::filesystem::path &workspace, bool notify);
  void regenerate_async(const std::filesystem::path &workspace);
  void wait_idle();

  [[nodiscard]] common::Result<std::string> preview(const std::filesystem::path &workspace) const;
  [[nodiscard]] ArtifactStatus status(const std::filesystem::path &workspace) const;
  [[nodiscard]] std::filesystem::path artifact_path(const std::filesystem::path &workspace) const;

  void forget(const std::string &workspace_id);

private:
  struct RunState {
    std::optional<std::string> last_generated;
    std::uintmax_t size = 0;
    std::optional<RegenerationError> last_error;
  };

  // Outlives forget() while a run still holds it, so a recreated workspace
  // keeps queuing behind the run that started before eviction.
  struct WorkspaceSlot {
    std::mutex run;
    std::uint64_t generation = 0;
  };

  [[nodiscard]] std::shared_ptr<WorkspaceSlot> workspace_slot(const std::string &workspace_id);
  RegenerationOutcome fail(const std::string &workspace_id, const WorkspaceSlot &slot,
                           std::uint64_t generation, const std::string &stage,
                           const std::string &error, bool notify,
                           std::chrono::steady_clock::time_point started);

  DispatcherOptions options_;
  ITemplateEngine &engine_;
  IDocumentRenderer &renderer_;
  ArtifactNotifier &notifier_;

  mutable std::mutex state_mutex_;
  std::unordered_map<std::string, std::shared_ptr<WorkspaceSlot>> slots_;
  std::unordered_map<std::string, RunState> states_;

  std::mutex async_mutex_;
  std::vector<std::future<void>> pending_;
};

} // namespace docsandbox::render

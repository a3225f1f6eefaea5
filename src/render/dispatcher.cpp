#include "docsandbox/render/dispatcher.hpp"

#include "docsandbox/common/clock.hpp"
#include "docsandbox/common/fs.hpp"
#include "docsandbox/observability/global.hpp"
#include "docsandbox/render/params.hpp"

#include <algorithm>
#include <iostream>

namespace docsandbox::render {

namespace {

std::string first_line(const std::string &text) {
  const auto newline = text.find('\n');
  return newline == std::string::npos ? text : text.substr(0, newline);
}

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               started);
}

std::string workspace_key(const std::filesystem::path &workspace) {
  auto name = workspace.filename();
  if (name.empty()) {
    name = workspace.parent_path().filename();
  }
  return name.string();
}

} // namespace

RegenerationDispatcher::RegenerationDispatcher(DispatcherOptions options, ITemplateEngine &engine,
                                               IDocumentRenderer &renderer,
                                               ArtifactNotifier &notifier)
    : options_(std::move(options)), engine_(engine), renderer_(renderer), notifier_(notifier) {}

RegenerationDispatcher::~RegenerationDispatcher() { wait_idle(); }

std::shared_ptr<RegenerationDispatcher::WorkspaceSlot>
RegenerationDispatcher::workspace_slot(const std::string &workspace_id) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto &slot = slots_[workspace_id];
  if (slot == nullptr) {
    slot = std::make_shared<WorkspaceSlot>();
  }
  return slot;
}

std::filesystem::path
RegenerationDispatcher::artifact_path(const std::filesystem::path &workspace) const {
  return workspace / options_.artifact_file;
}

RegenerationOutcome RegenerationDispatcher::fail(const std::string &workspace_id,
                                                 const WorkspaceSlot &slot,
                                                 const std::uint64_t generation,
                                                 const std::string &stage,
                                                 const std::string &error, const bool notify,
                                                 const std::chrono::steady_clock::time_point started) {
  RegenerationError recorded{.message = first_line(error),
                             .trace = stage + ": " + error,
                             .timestamp = common::now_rfc3339()};
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (slot.generation != generation) {
      std::cerr << "[render] dropping failure for forgotten workspace=" << workspace_id.substr(0, 8)
                << "\n";
      return RegenerationOutcome::Failed;
    }
    states_[workspace_id].last_error = recorded;
  }
  observability::record_regeneration(workspace_id, false, elapsed_since(started), recorded.message);
  std::cerr << "[render] " << stage << " failed workspace=" << workspace_id.substr(0, 8)
            << " error=" << recorded.message << "\n";
  if (notify) {
    notifier_.publish(ArtifactFailed{.workspace = workspace_id, .error = std::move(recorded)});
  }
  return RegenerationOutcome::Failed;
}

RegenerationOutcome RegenerationDispatcher::regenerate(const std::filesystem::path &workspace,
                                                       const bool notify) {
  const std::string id = workspace_key(workspace);
  const auto slot = workspace_slot(id);
  std::lock_guard<std::mutex> run_lock(slot->run);
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    generation = slot->generation;
  }
  const auto started = std::chrono::steady_clock::now();

  try {
    const auto main_file = workspace / options_.main_file;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(main_file, ec)) {
      std::cerr << "[render] main file missing, nothing to render: " << main_file.string() << "\n";
      return RegenerationOutcome::Skipped;
    }
    auto source = common::read_text_file(main_file);
    if (!source.ok()) {
      return fail(id, *slot, generation, "read", source.error(), notify, started);
    }
    if (common::trim(source.value()).empty()) {
      return RegenerationOutcome::Skipped;
    }

    const auto params = load_params(workspace / options_.params_file);
    auto markup = render_with_fallback(engine_, main_file, params, workspace);
    if (!markup.ok()) {
      return fail(id, *slot, generation, "template", markup.error(), notify, started);
    }

    const auto artifact = artifact_path(workspace);
    auto staging = artifact;
    staging += ".tmp";
    auto rendered = renderer_.render(markup.value(), staging, workspace);
    if (!rendered.ok()) {
      std::filesystem::remove(staging, ec);
      return fail(id, *slot, generation, "render", rendered.error(), notify, started);
    }
    std::filesystem::rename(staging, artifact, ec);
    if (ec) {
      std::error_code cleanup_ec;
      std::filesystem::remove(staging, cleanup_ec);
      return fail(id, *slot, generation, "publish", "failed to replace artifact: " + ec.message(),
                  notify, started);
    }
    const auto size = std::filesystem::file_size(artifact, ec);
    if (ec) {
      return fail(id, *slot, generation, "publish",
                  "artifact vanished after render: " + ec.message(), notify, started);
    }

    const std::string timestamp = common::now_rfc3339();
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (slot->generation != generation) {
        return RegenerationOutcome::Skipped;
      }
      auto &state = states_[id];
      state.last_generated = timestamp;
      state.size = size;
      state.last_error.reset();
    }
    const auto duration = elapsed_since(started);
    observability::record_regeneration(id, true, duration);
    observability::record_metric(
        observability::ArtifactSizeMetric{.bytes = static_cast<std::uint64_t>(size)});
    std::cerr << "[render] artifact updated workspace=" << id.substr(0, 8) << " bytes=" << size
              << " duration_ms=" << duration.count() << "\n";
    if (notify) {
      notifier_.publish(ArtifactUpdated{.workspace = id, .timestamp = timestamp, .size = size});
    }
    return RegenerationOutcome::Rendered;
  } catch (const std::exception &ex) {
    return fail(id, *slot, generation, "exception", ex.what(), notify, started);
  }
}

void RegenerationDispatcher::regenerate_async(const std::filesystem::path &workspace) {
  std::lock_guard<std::mutex> lock(async_mutex_);
  pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                [](const std::future<void> &future) {
                                  return future.wait_for(std::chrono::seconds(0)) ==
                                         std::future_status::ready;
                                }),
                 pending_.end());
  pending_.push_back(std::async(std::launch::async,
                                [this, workspace]() { (void)regenerate(workspace, true); }));
}

void RegenerationDispatcher::wait_idle() {
  while (true) {
    std::vector<std::future<void>> batch;
    {
      std::lock_guard<std::mutex> lock(async_mutex_);
      batch.swap(pending_);
    }
    if (batch.empty()) {
      return;
    }
    for (auto &future : batch) {
      future.wait();
    }
  }
}

common::Result<std::string>
RegenerationDispatcher::preview(const std::filesystem::path &workspace) const {
  const auto main_file = workspace / options_.main_file;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(main_file, ec)) {
    return common::Result<std::string>::failure("main file not found: " + options_.main_file,
                                                common::ErrorCode::NotFound);
  }
  auto source = common::read_text_file(main_file);
  if (!source.ok() || common::trim(source.value()).empty()) {
    return source;
  }
  const auto params = load_params(workspace / options_.params_file);
  return render_with_fallback(engine_, main_file, params, workspace);
}

ArtifactStatus RegenerationDispatcher::status(const std::filesystem::path &workspace) const {
  ArtifactStatus out;
  const auto artifact = artifact_path(workspace);
  std::error_code ec;
  out.exists = std::filesystem::is_regular_file(artifact, ec);
  if (out.exists) {
    out.size = std::filesystem::file_size(artifact, ec);
    if (ec) {
      out.size = 0;
    }
  }

  std::lock_guard<std::mutex> lock(state_mutex_);
  if (const auto it = states_.find(workspace_key(workspace)); it != states_.end()) {
    out.last_generated = it->second.last_generated;
    out.last_error = it->second.last_error;
  }
  return out;
}

void RegenerationDispatcher::forget(const std::string &workspace_id) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  states_.erase(workspace_id);
  const auto it = slots_.find(workspace_id);
  if (it == slots_.end()) {
    return;
  }
  ++it->second->generation;
  if (it->second.use_count() == 1) {
    slots_.erase(it);
  }
}

} // namespace docsandbox::render

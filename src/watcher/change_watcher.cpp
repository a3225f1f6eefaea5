#include "docsandbox/watcher/change_watcher.hpp"

#include "docsandbox/common/fs.hpp"
#include "docsandbox/health/health.hpp"
#include "docsandbox/observability/global.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>

namespace docsandbox::watcher {

namespace {

constexpr auto WAIT_STEP = std::chrono::milliseconds(100);

} // namespace

ChangeWatcher::ChangeWatcher(WatcherOptions options, std::unique_ptr<WatchBackend> backend,
                             DebounceGate &gate, RegenerateCallback callback)
    : options_(std::move(options)), backend_(std::move(backend)), gate_(gate),
      callback_(std::move(callback)) {
  for (auto &extension : options_.extensions) {
    extension = common::to_lower(extension);
  }
  std::error_code ec;
  root_ = std::filesystem::weakly_canonical(options_.root, ec);
  if (ec) {
    root_ = options_.root.lexically_normal();
  }
}

ChangeWatcher::~ChangeWatcher() {
  if (running_ || thread_.joinable()) {
    stop();
  }
}

common::Status ChangeWatcher::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_) {
    std::cerr << "[watcher] already running\n";
    observability::record_warning("watcher", "start requested while already running");
    return common::Status::success();
  }

  health::mark_component_starting("watcher");
  auto root = common::ensure_dir(options_.root);
  if (!root.ok()) {
    health::mark_component_error("watcher", root.error());
    return common::Status::error(root.error(), common::ErrorCode::Config);
  }
  std::error_code ec;
  root_ = std::filesystem::weakly_canonical(options_.root, ec);
  if (ec) {
    root_ = options_.root.lexically_normal();
  }

  auto opened = backend_->open(root_);
  if (!opened.ok()) {
    health::mark_component_error("watcher", opened.error());
    return opened;
  }

  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
  health::mark_component_ok("watcher");
  observability::record_watcher_state(std::string(backend_->name()), true);
  std::cerr << "[watcher] watching " << root_.string() << " mode=" << backend_->name() << "\n";
  return common::Status::success();
}

void ChangeWatcher::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_ && !thread_.joinable()) {
    std::cerr << "[watcher] stop requested while not running\n";
    return;
  }
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
  backend_->close();
  observability::record_watcher_state(std::string(backend_->name()), false);
}

bool ChangeWatcher::is_running() const { return running_; }

void ChangeWatcher::run_loop() {
  const WatchEventSink sink = [this](const WatchEvent &event) { (void)handle_event(event); };
  while (running_) {
    backend_->wait(WAIT_STEP, sink);
  }
}

bool ChangeWatcher::is_watched_extension(const std::filesystem::path &path) const {
  const std::string extension = common::to_lower(path.extension().string());
  if (extension.empty()) {
    return false;
  }
  return std::find(options_.extensions.begin(), options_.extensions.end(), extension) !=
         options_.extensions.end();
}

std::optional<std::filesystem::path>
ChangeWatcher::resolve_workspace(const std::filesystem::path &path) const {
  const auto normalized = path.lexically_normal();
  if (!common::is_subpath(normalized, root_)) {
    return std::nullopt;
  }
  const auto relative = normalized.lexically_relative(root_);
  auto it = relative.begin();
  if (it == relative.end() || it->empty() || *it == "." || *it == "..") {
    return std::nullopt;
  }
  const auto workspace = *it;
  // A file placed directly in the root belongs to no workspace.
  if (std::next(it) == relative.end()) {
    return std::nullopt;
  }
  return root_ / workspace;
}

bool ChangeWatcher::handle_event(const WatchEvent &event) {
  if (event.is_directory || !is_watched_extension(event.path)) {
    return false;
  }
  const auto workspace = resolve_workspace(event.path);
  if (!workspace.has_value()) {
    return false;
  }

  const std::string key = workspace->filename().string();
  const bool admitted = gate_.admit(key, options_.debounce);
  observability::record_change_detected(key, event.path.string(), admitted);
  if (!admitted) {
    return false;
  }

  ++admitted_;
  try {
    callback_(*workspace);
  } catch (const std::exception &ex) {
    observability::record_error("watcher", std::string("callback_exception: ") + ex.what());
    std::cerr << "[watcher] callback_exception workspace=" << key << " error=" << ex.what() << "\n";
  }
  return true;
}

} // namespace docsandbox::watcher

#include "tests/helpers/test_helpers.hpp"

#include "docsandbox/common/fs.hpp"
#include "docsandbox/observability/global.hpp"
#include "docsandbox/observability/noop_observer.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <thread>

namespace docsandbox::testing {

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("docsandbox-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
  path_ = std::filesystem::canonical(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::permissions(path_, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::add, ec);
  std::filesystem::remove_all(path_, ec);
}

void TempDir::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

std::string TempDir::read_file(const std::string &name) const {
  std::ifstream in(path_ / name);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

ManualClock::ManualClock() : now_(std::chrono::steady_clock::now()) {}

common::SteadyTime ManualClock::now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

void ManualClock::advance(const std::chrono::milliseconds amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += amount;
}

common::ClockFn ManualClock::fn() {
  return [this]() { return now(); };
}

common::Status RecordingRenderer::render(const std::string &markup,
                                         const std::filesystem::path &output,
                                         const std::filesystem::path &base_url) {
  const int current = ++in_flight_;
  int seen = max_in_flight_.load();
  while (current > seen && !max_in_flight_.compare_exchange_weak(seen, current)) {
  }

  std::optional<std::string> failure;
  std::chrono::milliseconds delay{0};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(RenderCall{.markup = markup, .output = output, .base_url = base_url});
    failure = failure_;
    delay = delay_;
  }
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }

  common::Status status = common::Status::success();
  if (failure.has_value()) {
    status = common::Status::error(*failure, common::ErrorCode::RenderError);
  } else {
    status = common::write_text_file(output, "PDF:" + markup);
  }
  --in_flight_;
  return status;
}

void RecordingRenderer::fail_with(std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_ = std::move(message);
}

void RecordingRenderer::succeed() {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_.reset();
}

void RecordingRenderer::set_delay(const std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lock(mutex_);
  delay_ = delay;
}

std::vector<RenderCall> RecordingRenderer::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

std::size_t RecordingRenderer::call_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_.size();
}

render::ArtifactListener RecordingNotifier::listener() {
  return [this](const render::ArtifactEvent &event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  };
}

std::vector<render::ArtifactEvent> RecordingNotifier::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::size_t RecordingNotifier::updated_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t out = 0;
  for (const auto &event : events_) {
    out += std::holds_alternative<render::ArtifactUpdated>(event) ? 1 : 0;
  }
  return out;
}

std::size_t RecordingNotifier::failed_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t out = 0;
  for (const auto &event : events_) {
    out += std::holds_alternative<render::ArtifactFailed>(event) ? 1 : 0;
  }
  return out;
}

std::optional<render::ArtifactFailed> RecordingNotifier::last_failure() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
    if (const auto *failed = std::get_if<render::ArtifactFailed>(&*it); failed != nullptr) {
      return *failed;
    }
  }
  return std::nullopt;
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> RecordingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ObserverCapture::ObserverCapture() {
  auto observer = std::make_unique<RecordingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ObserverCapture::~ObserverCapture() {
  observability::set_global_observer(std::make_unique<observability::NoopObserver>());
}

config::Config temp_config(const TempDir &dir) {
  config::Config config;
  config.workspace.root = (dir.path() / "workspaces").string();
  config.workspace.template_dir = (dir.path() / "template").string();
  config.sessions.lifetime = std::chrono::minutes(60);
  config.sessions.cleanup_interval = std::chrono::milliseconds(50);
  config.watcher.mode = "polling";
  config.watcher.poll_interval = std::chrono::milliseconds(20);
  config.watcher.debounce = std::chrono::milliseconds(200);
  config.renderer.command = "true";
  config.observability.backend = "none";
  return config;
}

void write_template(const TempDir &dir, const std::string &markup, const std::string &params) {
  dir.create_file("template/index.html", markup);
  dir.create_file("template/params.json", params);
  dir.create_file("template/style.css", "h1 { color: black; }\n");
}

bool wait_until(const std::function<bool()> &predicate, const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return predicate();
}

} // namespace docsandbox::testing

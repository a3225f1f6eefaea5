#pragma once

#include "docsandbox/common/clock.hpp"
#include "docsandbox/config/schema.hpp"
#include "docsandbox/observability/observer.hpp"
#include "docsandbox/render/document_renderer.hpp"
#include "docsandbox/render/notifier.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docsandbox::testing {

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read_file(const std::string &name) const;

private:
  std::filesystem::path path_;
};

/// Steady clock that only moves when told to.
class ManualClock {
public:
  ManualClock();

  [[nodiscard]] common::SteadyTime now() const;
  void advance(std::chrono::milliseconds amount);
  /// Callable bound to this clock; the clock must outlive it.
  [[nodiscard]] common::ClockFn fn();

private:
  mutable std::mutex mutex_;
  common::SteadyTime now_;
};

struct RenderCall {
  std::string markup;
  std::filesystem::path output;
  std::filesystem::path base_url;
};

/// Writes "PDF:" + markup to the output path and records every call.
class RecordingRenderer final : public render::IDocumentRenderer {
public:
  [[nodiscard]] common::Status render(const std::string &markup,
                                      const std::filesystem::path &output,
                                      const std::filesystem::path &base_url) override;

  void fail_with(std::string message);
  void succeed();
  void set_delay(std::chrono::milliseconds delay);

  [[nodiscard]] std::vector<RenderCall> calls() const;
  [[nodiscard]] std::size_t call_count() const;
  /// Highest number of render() calls observed in flight at once.
  [[nodiscard]] int max_in_flight() const { return max_in_flight_; }

private:
  mutable std::mutex mutex_;
  std::vector<RenderCall> calls_;
  std::optional<std::string> failure_;
  std::chrono::milliseconds delay_{0};
  std::atomic<int> in_flight_{0};
  std::atomic<int> max_in_flight_{0};
};

/// Collects everything published on an ArtifactNotifier.
class RecordingNotifier {
public:
  [[nodiscard]] render::ArtifactListener listener();

  [[nodiscard]] std::vector<render::ArtifactEvent> events() const;
  [[nodiscard]] std::size_t updated_count() const;
  [[nodiscard]] std::size_t failed_count() const;
  [[nodiscard]] std::optional<render::ArtifactFailed> last_failure() const;

private:
  mutable std::mutex mutex_;
  std::vector<render::ArtifactEvent> events_;
};

/// Observer that keeps every event, for assertions on what was recorded.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;
  template <typename Event> [[nodiscard]] std::size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t out = 0;
    for (const auto &event : events_) {
      if (std::holds_alternative<Event>(event)) {
        ++out;
      }
    }
    return out;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a RecordingObserver globally for the guard's lifetime.
class ObserverCapture {
public:
  ObserverCapture();
  ~ObserverCapture();

  ObserverCapture(const ObserverCapture &) = delete;
  ObserverCapture &operator=(const ObserverCapture &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  RecordingObserver *observer_ = nullptr;
};

/// Configuration rooted inside `dir`: workspaces under `dir/workspaces`, a
/// template tree under `dir/template`, no observability output.
config::Config temp_config(const TempDir &dir);

/// Populates `dir/template` with index.html, params.json and style.css.
void write_template(const TempDir &dir, const std::string &markup = "<h1>{{ title }}</h1>",
                    const std::string &params = "{\"title\": \"Hello\"}");

/// Polls `predicate` until it holds or `timeout` elapses.
bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout = std::chrono::seconds(5));

} // namespace docsandbox::testing

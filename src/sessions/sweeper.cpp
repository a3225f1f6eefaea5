#include "docsandbox/sessions/sweeper.hpp"

#include "docsandbox/health/health.hpp"
#include "docsandbox/observability/global.hpp"

#include <algorithm>
#include <iostream>

namespace docsandbox::sessions {

ExpirySweeper::ExpirySweeper(SessionStore &store, SweeperConfig config)
    : store_(store), config_(config) {}

ExpirySweeper::~ExpirySweeper() { stop(); }

void ExpirySweeper::set_on_evicted(EvictedCallback callback) { on_evicted_ = std::move(callback); }

void ExpirySweeper::start() {
  if (running_) {
    return;
  }
  running_ = true;
  health::mark_component_starting("sweeper");
  thread_ = std::thread([this]() { run_loop(); });
}

void ExpirySweeper::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool ExpirySweeper::is_running() const { return running_; }

SweepReport ExpirySweeper::sweep_once() {
  SweepReport report;
  for (const auto &expired : store_.list_expired(config_.lifetime)) {
    auto evicted = store_.evict_if_expired(expired.token, config_.lifetime);
    if (!evicted.ok()) {
      ++report.failed;
      observability::record_error("sweeper", evicted.error());
      std::cerr << "[sweeper] eviction failed session=" << expired.token.substr(0, 8)
                << " error=" << evicted.error() << "\n";
      continue;
    }
    if (!evicted.value()) {
      ++report.skipped;
      continue;
    }
    ++report.evicted;
    std::cerr << "[sweeper] evicted session=" << expired.token.substr(0, 8)
              << " idle_min=" << std::chrono::duration_cast<std::chrono::minutes>(expired.age).count()
              << "\n";
    if (on_evicted_) {
      on_evicted_(expired.token);
    }
  }

  if (report.evicted > 0 || report.failed > 0) {
    observability::record_sweep_completed(report.evicted, report.failed);
    std::cerr << "[sweeper] sweep complete: " << report.evicted << " deleted, " << report.failed
              << " failed, " << store_.active_count() << " active\n";
  }
  if (report.failed > 0) {
    health::mark_component_error("sweeper",
                                 std::to_string(report.failed) + " eviction(s) failed");
  } else {
    health::mark_component_ok("sweeper");
  }
  ++sweeps_completed_;
  return report;
}

void ExpirySweeper::run_loop() {
  health::mark_component_ok("sweeper");
  const auto interval = std::max(std::chrono::milliseconds(1), config_.interval);
  const auto step = std::min(interval, std::chrono::milliseconds(100));
  auto next = std::chrono::steady_clock::now() + interval;
  while (running_) {
    const auto now = std::chrono::steady_clock::now();
    if (now < next) {
      std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(step, next - now));
      continue;
    }
    (void)sweep_once();
    next = std::chrono::steady_clock::now() + interval;
  }
}

} // namespace docsandbox::sessions

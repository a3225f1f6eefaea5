#pragma once

#include "docsandbox/sessions/store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace docsandbox::sessions {

struct SweeperConfig {
  std::chrono::milliseconds interval{std::chrono::minutes(5)};
  std::chrono::milliseconds lifetime{std::chrono::hours(1)};
};

struct SweepReport {
  std::size_t evicted = 0;
  std::size_t failed = 0;
  std::size_t skipped = 0;
};

class ExpirySweeper {
public:
  using EvictedCallback = std::function<void(const std::string &token)>;

  ExpirySweeper(SessionStore &store, SweeperConfig config);
  ~ExpirySweeper();

  ExpirySweeper(const ExpirySweeper &) = delete;
  ExpirySweeper &operator=(const ExpirySweeper &) = delete;

  void set_on_evicted(EvictedCallback callback);

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  SweepReport sweep_once();
  [[nodiscard]] std::uint64_t sweeps_completed() const { return sweeps_completed_; }

private:
  void run_loop();

  SessionStore &store_;
  SweeperConfig config_;
  EvictedCallback on_evicted_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> sweeps_completed_{0};
};

} // namespace docsandbox::sessions

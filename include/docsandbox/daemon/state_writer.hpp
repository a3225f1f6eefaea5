#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

namespace docsandbox::daemon {

class StateWriter {
public:
  using SessionCounter = std::function<std::size_t()>;

  StateWriter(std::filesystem::path state_file, SessionCounter active_sessions,
              std::chrono::milliseconds interval = std::chrono::seconds(5));
  ~StateWriter();

  StateWriter(const StateWriter &) = delete;
  StateWriter &operator=(const StateWriter &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] std::string render_state() const;
  void write_state() const;

  [[nodiscard]] const std::filesystem::path &state_file() const { return state_file_; }

private:
  void write_loop();

  std::filesystem::path state_file_;
  SessionCounter active_sessions_;
  std::chrono::milliseconds interval_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::chrono::steady_clock::time_point started_at_{};
};

} // namespace docsandbox::daemon

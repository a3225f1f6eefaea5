#include "docsandbox/daemon/state_writer.hpp"

#include "docsandbox/common/clock.hpp"
#include "docsandbox/common/fs.hpp"
#include "docsandbox/health/health.hpp"

#include <iostream>
#include <sstream>

namespace docsandbox::daemon {

StateWriter::StateWriter(std::filesystem::path state_file, SessionCounter active_sessions,
                         const std::chrono::milliseconds interval)
    : state_file_(std::move(state_file)), active_sessions_(std::move(active_sessions)),
      interval_(interval) {
  started_at_ = std::chrono::steady_clock::now();
}

StateWriter::~StateWriter() { stop(); }

void StateWriter::start() {
  if (running_) {
    return;
  }
  running_ = true;
  started_at_ = std::chrono::steady_clock::now();
  thread_ = std::thread([this]() { write_loop(); });
}

void StateWriter::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool StateWriter::is_running() const { return running_; }

void StateWriter::write_loop() {
  const auto step = std::chrono::milliseconds(100);
  while (running_) {
    write_state();
    auto waited = std::chrono::milliseconds::zero();
    while (running_ && waited < interval_) {
      std::this_thread::sleep_for(step);
      waited += step;
    }
  }
  write_state();
}

std::string StateWriter::render_state() const {
  const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::steady_clock::now() - started_at_)
                          .count();
  const std::size_t sessions = active_sessions_ ? active_sessions_() : 0;

  std::ostringstream json;
  json << "{";
  json << "\"written_at\":\"" << common::now_rfc3339() << "\",";
  json << "\"uptime_seconds\":" << uptime << ",";
  json << "\"active_sessions\":" << sessions << ",";
  json << "\"health\":" << health::snapshot_json();
  json << "}";
  return json.str();
}

void StateWriter::write_state() const {
  const auto temp_path = state_file_.string() + ".tmp";
  auto written = common::write_text_file(temp_path, render_state());
  if (!written.ok()) {
    std::cerr << "[daemon] failed to write state: " << written.error() << "\n";
    return;
  }
  std::error_code ec;
  std::filesystem::rename(temp_path, state_file_, ec);
  if (ec) {
    std::cerr << "[daemon] failed to publish state: " << ec.message() << "\n";
  }
}

} // namespace docsandbox::daemon

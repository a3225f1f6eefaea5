#pragma once

#include "docsandbox/observability/observer.hpp"

#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace docsandbox::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &value);

class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(LogLevel min_level, std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream *out_;
  std::mutex mutex_;
};

} // namespace docsandbox::observability

#include "docsandbox/observability/factory.hpp"

#include "docsandbox/common/fs.hpp"
#include "docsandbox/observability/log_observer.hpp"
#include "docsandbox/observability/multi_observer.hpp"
#include "docsandbox/observability/noop_observer.hpp"

#include <sstream>

namespace docsandbox::observability {

namespace {

std::unique_ptr<IObserver> make_log_observer(const config::Config &config) {
  return std::make_unique<LogObserver>(
      parse_log_level(config.observability.log_level).value_or(LogLevel::Info));
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend == "log") {
    return make_log_observer(config);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::trim(part);
      if (p == "log") {
        multi->add(make_log_observer(config));
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return multi;
  }

  return make_log_observer(config);
}

} // namespace docsandbox::observability

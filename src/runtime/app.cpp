#include "docsandbox/runtime/app.hpp"

#include "docsandbox/config/config.hpp"
#include "docsandbox/observability/factory.hpp"
#include "docsandbox/observability/global.hpp"

#include <iostream>

namespace docsandbox::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.status());
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<RuntimeContext>::failure(validated.status());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "[config] warning: " << warning << "\n";
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
}

} // namespace docsandbox::runtime

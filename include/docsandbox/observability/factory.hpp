#pragma once

#include "docsandbox/config/schema.hpp"
#include "docsandbox/observability/observer.hpp"

#include <memory>

namespace docsandbox::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace docsandbox::observability

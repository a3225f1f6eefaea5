#pragma once

#include "docsandbox/common/result.hpp"
#include "docsandbox/config/schema.hpp"

#include <string>
#include <vector>

namespace docsandbox::runtime {

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  void install_observer() const;

private:
  config::Config config_;
};

} // namespace docsandbox::runtime

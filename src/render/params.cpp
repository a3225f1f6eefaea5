#include "docsandbox/render/params.hpp"

#include "docsandbox/common/fs.hpp"
#include "docsandbox/common/json_util.hpp"
#include "docsandbox/observability/global.hpp"

#include <iostream>

namespace docsandbox::render {

TemplateBindings load_params(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return {};
  }

  auto content = common::read_text_file(path);
  if (!content.ok()) {
    std::cerr << "[render] unable to read params " << path.string() << ": " << content.error()
              << "\n";
    return {};
  }

  const std::string trimmed = common::trim(content.value());
  if (trimmed.empty()) {
    return {};
  }
  std::string error;
  if (!common::json_validate(trimmed, &error) || trimmed.front() != '{') {
    const std::string reason = error.empty() ? "top-level value is not an object" : error;
    std::cerr << "[render] ignoring malformed params " << path.filename().string() << ": "
              << reason << "\n";
    observability::record_warning("render", "malformed params " + path.string() + ": " + reason);
    return {};
  }

  TemplateBindings bindings;
  for (auto &[key, value] : common::json_flatten_object(trimmed)) {
    bindings.emplace(key, std::move(value));
  }
  return bindings;
}

} // namespace docsandbox::render

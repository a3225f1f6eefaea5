#pragma once

#include "docsandbox/common/result.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>

namespace docsandbox::render {

using TemplateBindings = std::unordered_map<std::string, std::string>;

class ITemplateEngine {
public:
  virtual ~ITemplateEngine() = default;

  [[nodiscard]] virtual common::Result<std::string>
  render_file(const std::filesystem::path &main_file, const TemplateBindings &bindings,
              const std::filesystem::path &workspace_root) const = 0;

  [[nodiscard]] virtual common::Result<std::string>
  render_string(const std::string &source, const TemplateBindings &bindings) const = 0;

  [[nodiscard]] virtual common::Status validate(const std::string &source) const = 0;
};

[[nodiscard]] common::Result<std::string>
render_with_fallback(const ITemplateEngine &engine, const std::filesystem::path &main_file,
                     const TemplateBindings &bindings, const std::filesystem::path &workspace_root);

} // namespace docsandbox::render

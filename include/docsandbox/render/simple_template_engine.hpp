#pragma once

#include "docsandbox/render/template_engine.hpp"

namespace docsandbox::render {

class SimpleTemplateEngine final : public ITemplateEngine {
public:
  explicit SimpleTemplateEngine(bool inject_now = true);

  [[nodiscard]] common::Result<std::string>
  render_file(const std::filesystem::path &main_file, const TemplateBindings &bindings,
              const std::filesystem::path &workspace_root) const override;
  [[nodiscard]] common::Result<std::string>
  render_string(const std::string &source, const TemplateBindings &bindings) const override;
  [[nodiscard]] common::Status validate(const std::string &source) const override;

private:
  [[nodiscard]] TemplateBindings prepare(const TemplateBindings &bindings) const;

  bool inject_now_;
};

} // namespace docsandbox::render

#include "docsandbox/render/template_engine.hpp"

#include "docsandbox/common/fs.hpp"

#include <iostream>

namespace docsandbox::render {

common::Result<std::string> render_with_fallback(const ITemplateEngine &engine,
                                                 const std::filesystem::path &main_file,
                                                 const TemplateBindings &bindings,
                                                 const std::filesystem::path &workspace_root) {
  auto rendered = engine.render_file(main_file, bindings, workspace_root);
  if (rendered.ok() || rendered.code() == common::ErrorCode::TemplateError) {
    return rendered;
  }

  std::cerr << "[render] file-based rendering failed for " << main_file.filename().string()
            << ", trying fallback: " << rendered.error() << "\n";
  auto source = common::read_text_file(main_file);
  if (!source.ok()) {
    return common::Result<std::string>::failure(source.status());
  }
  auto fallback = engine.render_string(source.value(), bindings);
  if (!fallback.ok()) {
    return common::Result<std::string>::failure(
        "template rendering failed with both methods: " + fallback.error(),
        common::ErrorCode::TemplateError);
  }
  return fallback;
}

} // namespace docsandbox::render

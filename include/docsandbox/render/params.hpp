#pragma once

#include "docsandbox/render/template_engine.hpp"

#include <filesystem>

namespace docsandbox::render {

[[nodiscard]] TemplateBindings load_params(const std::filesystem::path &path);

} // namespace docsandbox::render

#pragma once

#include "docsandbox/common/result.hpp"

#include <filesystem>

namespace docsandbox::workspace {

[[nodiscard]] common::Status materialize(const std::filesystem::path &template_root,
                                         const std::filesystem::path &destination);

class WorkspaceFactory {
public:
  explicit WorkspaceFactory(std::filesystem::path template_root);

  [[nodiscard]] common::Status materialize(const std::filesystem::path &destination) const;
  [[nodiscard]] const std::filesystem::path &template_root() const { return template_root_; }

private:
  std::filesystem::path template_root_;
};

} // namespace docsandbox::workspace

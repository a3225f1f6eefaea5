#include "docsandbox/workspace/factory.hpp"

#include "docsandbox/observability/global.hpp"

#include <iostream>

namespace docsandbox::workspace {

common::Status materialize(const std::filesystem::path &template_root,
                           const std::filesystem::path &destination) {
  std::error_code ec;
  std::filesystem::create_directories(destination, ec);
  if (ec) {
    return common::Status::error("failed to create workspace " + destination.string() + ": " +
                                     ec.message(),
                                 common::ErrorCode::StorageError);
  }

  if (!std::filesystem::is_directory(template_root, ec)) {
    std::cerr << "[workspace] template directory missing, created empty workspace: "
              << template_root.string() << "\n";
    observability::record_warning("workspace",
                                  "template directory missing: " + template_root.string());
    return common::Status::success();
  }

  for (auto it = std::filesystem::recursive_directory_iterator(template_root, ec);
       !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    const auto relative = it->path().lexically_relative(template_root);
    const auto target = destination / relative;
    std::error_code entry_ec;
    if (it->is_directory(entry_ec)) {
      std::filesystem::create_directories(target, entry_ec);
    } else if (it->is_regular_file(entry_ec)) {
      std::filesystem::copy_file(it->path(), target,
                                 std::filesystem::copy_options::overwrite_existing, entry_ec);
    }
    if (entry_ec) {
      return common::Status::error("failed to copy " + it->path().string() + ": " +
                                       entry_ec.message(),
                                   common::ErrorCode::StorageError);
    }
  }
  if (ec) {
    return common::Status::error("failed to read template directory " + template_root.string() +
                                     ": " + ec.message(),
                                 common::ErrorCode::StorageError);
  }
  return common::Status::success();
}

WorkspaceFactory::WorkspaceFactory(std::filesystem::path template_root)
    : template_root_(std::move(template_root)) {}

common::Status WorkspaceFactory::materialize(const std::filesystem::path &destination) const {
  return workspace::materialize(template_root_, destination);
}

} // namespace docsandbox::workspace

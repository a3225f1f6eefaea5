#include "docsandbox/workspace/files.hpp"

#include "docsandbox/common/clock.hpp"
#include "docsandbox/common/fs.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace docsandbox::workspace {

namespace {

std::string modified_rfc3339(const std::filesystem::file_time_type modified) {
  const auto age = std::filesystem::file_time_type::clock::now() - modified;
  return common::to_rfc3339(std::chrono::system_clock::now() -
                            std::chrono::duration_cast<std::chrono::system_clock::duration>(age));
}

bool is_hidden(const std::filesystem::path &relative) {
  for (const auto &part : relative) {
    const std::string name = part.string();
    if (!name.empty() && name.front() == '.') {
      return true;
    }
  }
  return false;
}

} // namespace

WorkspaceFiles::WorkspaceFiles(std::filesystem::path root, std::vector<std::string> protected_files)
    : root_(std::move(root)), protected_files_(std::move(protected_files)) {}

common::Result<std::filesystem::path> WorkspaceFiles::resolve(const std::string &relative) const {
  return common::resolve_within(root_, relative);
}

bool WorkspaceFiles::is_protected(const std::string &relative) const {
  const auto normalized = std::filesystem::path(common::trim(relative)).lexically_normal();
  return std::any_of(protected_files_.begin(), protected_files_.end(),
                     [&](const std::string &name) {
                       return std::filesystem::path(name).lexically_normal() == normalized;
                     });
}

common::Result<std::vector<FileEntry>> WorkspaceFiles::list() const {
  using ListResult = common::Result<std::vector<FileEntry>>;
  std::vector<FileEntry> files;
  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    return ListResult::failure("workspace not found: " + root_.string(), common::ErrorCode::NotFound);
  }

  for (auto it = std::filesystem::recursive_directory_iterator(root_, ec);
       !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec)) {
      continue;
    }
    const auto relative = it->path().lexically_relative(root_);
    if (is_hidden(relative)) {
      continue;
    }
    const auto size = it->file_size(entry_ec);
    if (entry_ec) {
      std::cerr << "[workspace] unable to stat " << it->path().string() << ": "
                << entry_ec.message() << "\n";
      continue;
    }
    const auto modified = it->last_write_time(entry_ec);
    files.push_back(FileEntry{.path = relative.generic_string(),
                              .name = it->path().filename().string(),
                              .size = size,
                              .modified = entry_ec ? std::string() : modified_rfc3339(modified)});
  }
  if (ec) {
    return ListResult::failure("failed to list workspace: " + ec.message());
  }

  std::sort(files.begin(), files.end(),
            [](const FileEntry &a, const FileEntry &b) { return a.path < b.path; });
  return ListResult::success(std::move(files));
}

common::Result<std::string> WorkspaceFiles::read(const std::string &relative) const {
  auto path = resolve(relative);
  if (!path.ok()) {
    return common::Result<std::string>::failure(path.status());
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path.value(), ec)) {
    return common::Result<std::string>::failure("file not found: " + relative,
                                                common::ErrorCode::NotFound);
  }
  return common::read_text_file(path.value());
}

common::Status WorkspaceFiles::write(const std::string &relative, const std::string &content) const {
  auto path = resolve(relative);
  if (!path.ok()) {
    return path.status();
  }
  std::error_code ec;
  if (std::filesystem::is_directory(path.value(), ec)) {
    return common::Status::error("path is a directory: " + relative,
                                 common::ErrorCode::InvalidArgument);
  }
  return common::write_text_file(path.value(), content);
}

common::Status WorkspaceFiles::create(const std::string &relative, const std::string &content) const {
  auto path = resolve(relative);
  if (!path.ok()) {
    return path.status();
  }
  std::error_code ec;
  if (std::filesystem::exists(path.value(), ec)) {
    return common::Status::error("file already exists: " + relative,
                                 common::ErrorCode::InvalidArgument);
  }
  return common::write_text_file(path.value(), content);
}

common::Status WorkspaceFiles::remove(const std::string &relative) const {
  auto path = resolve(relative);
  if (!path.ok()) {
    return path.status();
  }
  if (is_protected(relative)) {
    return common::Status::error("cannot delete required file: " + relative,
                                 common::ErrorCode::InvalidArgument);
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path.value(), ec)) {
    return common::Status::error("file not found: " + relative, common::ErrorCode::NotFound);
  }
  if (!std::filesystem::remove(path.value(), ec) || ec) {
    return common::Status::error("failed to delete " + relative + ": " + ec.message());
  }
  return common::Status::success();
}

} // namespace docsandbox::workspace

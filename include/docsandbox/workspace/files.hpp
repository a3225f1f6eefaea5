#pragma once

#include "docsandbox/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace docsandbox::workspace {

struct FileEntry {
  std::string path;
  std::string name;
  std::uintmax_t size = 0;
  std::string modified;
};

class WorkspaceFiles {
public:
  WorkspaceFiles(std::filesystem::path root, std::vector<std::string> protected_files);

  [[nodiscard]] common::Result<std::vector<FileEntry>> list() const;
  [[nodiscard]] common::Result<std::string> read(const std::string &relative) const;
  [[nodiscard]] common::Status write(const std::string &relative, const std::string &content) const;
  [[nodiscard]] common::Status create(const std::string &relative,
                                      const std::string &content = "") const;
  [[nodiscard]] common::Status remove(const std::string &relative) const;

  [[nodiscard]] common::Result<std::filesystem::path> resolve(const std::string &relative) const;
  [[nodiscard]] bool is_protected(const std::string &relative) const;
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
  std::vector<std::string> protected_files_;
};

} // namespace docsandbox::workspace

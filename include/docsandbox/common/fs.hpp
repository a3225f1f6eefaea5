#pragma once

#include "docsandbox/common/result.hpp"

#include <filesystem>
#include <string>

namespace docsandbox::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                              const std::filesystem::path &parent);

/// Resolve `relative` against `root` and verify the result stays strictly inside
/// `root`, both lexically and after following any symlinks that already exist.
[[nodiscard]] Result<std::filesystem::path> resolve_within(const std::filesystem::path &root,
                                                           const std::string &relative);

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);
[[nodiscard]] Status write_text_file(const std::filesystem::path &path, const std::string &content);

} // namespace docsandbox::common

#include "docsandbox/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace docsandbox::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set", ErrorCode::Config);
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  auto c_it = candidate.begin();
  auto p_it = parent.begin();

  for (; p_it != parent.end(); ++p_it, ++c_it) {
    // A trailing separator on the parent yields an empty final element.
    if (p_it->empty()) {
      continue;
    }
    if (c_it == candidate.end() || *c_it != *p_it) {
      return false;
    }
  }

  return true;
}

Result<std::filesystem::path> resolve_within(const std::filesystem::path &root,
                                             const std::string &relative) {
  const std::string cleaned = trim(relative);
  if (cleaned.empty()) {
    return Result<std::filesystem::path>::failure("path is required", ErrorCode::InvalidArgument);
  }
  const std::filesystem::path requested(cleaned);
  if (requested.is_absolute() || requested.has_root_name()) {
    return Result<std::filesystem::path>::failure("absolute paths are not allowed: " + cleaned,
                                                  ErrorCode::PathViolation);
  }

  std::error_code ec;
  const auto canonical_root = std::filesystem::weakly_canonical(root, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("unable to resolve workspace root: " +
                                                  ec.message());
  }

  const auto joined = (canonical_root / requested).lexically_normal();
  if (joined == canonical_root || !is_subpath(joined, canonical_root)) {
    return Result<std::filesystem::path>::failure("path escapes workspace: " + cleaned,
                                                  ErrorCode::PathViolation);
  }

  const auto resolved = std::filesystem::weakly_canonical(joined, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("unable to resolve path: " + cleaned + ": " +
                                                  ec.message());
  }
  if (resolved == canonical_root || !is_subpath(resolved, canonical_root)) {
    return Result<std::filesystem::path>::failure("path escapes workspace: " + cleaned,
                                                  ErrorCode::PathViolation);
  }
  return Result<std::filesystem::path>::success(joined);
}

Result<std::string> read_text_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("unable to open file: " + path.string(),
                                        ErrorCode::NotFound);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure("failed reading file: " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Status write_text_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::error("failed to create parent directory: " + ec.message());
    }
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return Status::error("unable to open file for writing: " + path.string());
  }
  out << content;
  out.close();
  if (!out) {
    return Status::error("failed writing file: " + path.string());
  }
  return Status::success();
}

} // namespace docsandbox::common

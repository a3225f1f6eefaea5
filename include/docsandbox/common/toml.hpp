#pragma once

#include "docsandbox/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace docsandbox::common {

struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
  [[nodiscard]] Result<std::chrono::milliseconds>
  get_duration(const std::string &key, std::chrono::milliseconds fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

[[nodiscard]] Result<std::chrono::milliseconds> parse_duration(const std::string &text);
[[nodiscard]] std::string format_duration(std::chrono::milliseconds duration);

} // namespace docsandbox::common

#include "docsandbox/common/toml.hpp"

#include "docsandbox/common/fs.hpp"

#include <charconv>
#include <limits>
#include <sstream>

namespace docsandbox::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const char ch = array_value[i];
    if (ch == '"' && (i == 0 || array_value[i - 1] != '\\')) {
      in_quotes = !in_quotes;
      current.push_back(ch);
      continue;
    }

    if (!in_quotes && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }

    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

Result<std::chrono::milliseconds>
TomlDocument::get_duration(const std::string &key, const std::chrono::milliseconds fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return Result<std::chrono::milliseconds>::success(fallback);
  }
  auto parsed = parse_duration(unquote(it->second));
  if (!parsed.ok()) {
    return Result<std::chrono::milliseconds>::failure(key + ": " + parsed.error(),
                                                      ErrorCode::Config);
  }
  return parsed;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                                 std::to_string(line_number),
                                             ErrorCode::Config);
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                               std::to_string(line_number),
                                           ErrorCode::Config);
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number),
                                           ErrorCode::Config);
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

Result<std::chrono::milliseconds> parse_duration(const std::string &text) {
  const std::string value = to_lower(trim(text));
  if (value.empty()) {
    return Result<std::chrono::milliseconds>::failure("empty duration", ErrorCode::Config);
  }

  std::size_t digits = 0;
  while (digits < value.size() && value[digits] >= '0' && value[digits] <= '9') {
    ++digits;
  }
  if (digits == 0) {
    return Result<std::chrono::milliseconds>::failure("invalid duration: " + text,
                                                      ErrorCode::Config);
  }

  std::uint64_t amount = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + digits, amount);
  if (ec != std::errc() || ptr != value.data() + digits) {
    return Result<std::chrono::milliseconds>::failure("invalid duration: " + text,
                                                      ErrorCode::Config);
  }

  const std::string unit = trim(value.substr(digits));
  std::uint64_t scale = 0;
  if (unit == "ms") {
    scale = 1;
  } else if (unit.empty() || unit == "s") {
    scale = 1000;
  } else if (unit == "m") {
    scale = 60'000;
  } else if (unit == "h") {
    scale = 3'600'000;
  } else {
    return Result<std::chrono::milliseconds>::failure("unknown duration unit '" + unit + "'",
                                                      ErrorCode::Config);
  }

  if (amount > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) / scale) {
    return Result<std::chrono::milliseconds>::failure("duration out of range: " + text,
                                                      ErrorCode::Config);
  }
  return Result<std::chrono::milliseconds>::success(
      std::chrono::milliseconds(static_cast<std::int64_t>(amount * scale)));
}

std::string format_duration(const std::chrono::milliseconds duration) {
  const auto ms = duration.count();
  if (ms != 0 && ms % 3'600'000 == 0) {
    return std::to_string(ms / 3'600'000) + "h";
  }
  if (ms != 0 && ms % 60'000 == 0) {
    return std::to_string(ms / 60'000) + "m";
  }
  if (ms % 1000 == 0) {
    return std::to_string(ms / 1000) + "s";
  }
  return std::to_string(ms) + "ms";
}

} // namespace docsandbox::common

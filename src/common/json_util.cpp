#include "docsandbox/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <sstream>

namespace docsandbox::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool is_hex(const char ch) { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; }

class JsonValidator {
public:
  explicit JsonValidator(const std::string &text) : text_(text) {}

  bool run(std::string *error) {
    pos_ = json_skip_ws(text_, 0);
    if (!value(0)) {
      return fail(error);
    }
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ != text_.size()) {
      message_ = "trailing characters";
      return fail(error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 64;

  bool fail(std::string *error) const {
    if (error != nullptr) {
      std::ostringstream out;
      out << (message_.empty() ? "invalid JSON" : message_) << " at offset " << pos_;
      *error = out.str();
    }
    return false;
  }

  bool value(const std::size_t depth) {
    if (depth > kMaxDepth) {
      message_ = "nesting too deep";
      return false;
    }
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ >= text_.size()) {
      message_ = "unexpected end of input";
      return false;
    }
    const char ch = text_[pos_];
    if (ch == '{') {
      return object(depth);
    }
    if (ch == '[') {
      return array(depth);
    }
    if (ch == '"') {
      return string();
    }
    if (ch == '-' || (ch >= '0' && ch <= '9')) {
      return number();
    }
    return literal("true") || literal("false") || literal("null");
  }

  bool object(const std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (true) {
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        message_ = "expected object key";
        return false;
      }
      if (!string()) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        message_ = "expected ':'";
        return false;
      }
      ++pos_;
      if (!value(depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ < text_.size() && text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (pos_ < text_.size() && text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      message_ = "expected ',' or '}'";
      return false;
    }
  }

  bool array(const std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (true) {
      if (!value(depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ < text_.size() && text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (pos_ < text_.size() && text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      message_ = "expected ',' or ']'";
      return false;
    }
  }

  bool string() {
    ++pos_;
    while (pos_ < text_.size()) {
      const char ch = text_[pos_];
      if (ch == '"') {
        ++pos_;
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) {
        message_ = "control character in string";
        return false;
      }
      if (ch == '\\') {
        ++pos_;
        if (pos_ >= text_.size()) {
          break;
        }
        const char esc = text_[pos_];
        if (esc == 'u') {
          for (int i = 1; i <= 4; ++i) {
            if (pos_ + i >= text_.size() || !is_hex(text_[pos_ + i])) {
              message_ = "invalid unicode escape";
              return false;
            }
          }
          pos_ += 4;
        } else if (std::string("\"\\/bfnrt").find(esc) == std::string::npos) {
          message_ = "invalid escape";
          return false;
        }
      }
      ++pos_;
    }
    message_ = "unterminated string";
    return false;
  }

  bool number() {
    const std::size_t start = pos_;
    if (text_[pos_] == '-') {
      ++pos_;
    }
    std::size_t int_digits = 0;
    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
      ++int_digits;
    }
    if (int_digits == 0) {
      message_ = "invalid number";
      return false;
    }
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      std::size_t frac = 0;
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
        ++pos_;
        ++frac;
      }
      if (frac == 0) {
        message_ = "invalid number";
        return false;
      }
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
        ++pos_;
      }
      std::size_t exp = 0;
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
        ++pos_;
        ++exp;
      }
      if (exp == 0) {
        message_ = "invalid number";
        return false;
      }
    }
    return pos_ > start;
  }

  bool literal(const std::string &word) {
    if (text_.compare(pos_, word.size(), word) == 0) {
      pos_ += word.size();
      return true;
    }
    message_ = "unexpected token";
    return false;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
  std::string message_;
};

void flatten_into(const std::string &json, const std::string &prefix, JsonFlatMap &out,
                  const std::size_t depth) {
  for (const auto &[key, value] : json_parse_flat(json)) {
    const std::string full_key = prefix.empty() ? key : prefix + "." + key;
    out[full_key] = value;
    if (depth < 16 && !value.empty() && value.front() == '{') {
      flatten_into(value, full_key, out, depth + 1);
    }
  }
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        static constexpr char kHex[] = "0123456789abcdef";
        escaped += "\\u00";
        escaped.push_back(kHex[(static_cast<unsigned char>(ch) >> 4) & 0x0F]);
        escaped.push_back(kHex[static_cast<unsigned char>(ch) & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u':
      if (i + 4 < raw.size() && is_hex(raw[i + 1]) && is_hex(raw[i + 2]) && is_hex(raw[i + 3]) &&
          is_hex(raw[i + 4])) {
        append_utf8(out, static_cast<std::uint32_t>(std::stoul(raw.substr(i + 1, 4), nullptr, 16)));
        i += 4;
      } else {
        out.push_back(esc);
      }
      break;
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                     const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

bool json_validate(const std::string &json, std::string *error) {
  JsonValidator validator(json);
  return validator.run(error);
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  if (json.size() < 2 || json.front() != '{') {
    return result;
  }

  std::size_t pos = 1; // skip opening {
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }

    // expect key
    if (json[pos] != '"') {
      ++pos;
      continue;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = key_end + 1;

    // expect colon
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    ++pos;
    pos = json_skip_ws(json, pos);
    if (pos >= json.size()) {
      break;
    }

    // read value
    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      // number, true, false or null
      const std::size_t start = pos;
      while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
             std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
        ++pos;
      }
      result[key] = json.substr(start, pos - start);
    }
  }

  return result;
}

JsonFlatMap json_flatten_object(const std::string &json) {
  JsonFlatMap result;
  flatten_into(json, "", result, 0);
  return result;
}

} // namespace docsandbox::common

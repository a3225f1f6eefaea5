#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace docsandbox::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t, \uXXXX and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                   char open_ch, char close_ch);

/// Strict structural check of a complete JSON document. On failure `error`
/// receives a short description with the byte offset.
[[nodiscard]] bool json_validate(const std::string &json, std::string *error = nullptr);

/// Parse a flat JSON object into a key→value map (string values only, top-level).
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Like json_parse_flat, but nested objects are expanded into dotted keys
/// ("author.name"). The nested object itself is kept under its own key.
[[nodiscard]] JsonFlatMap json_flatten_object(const std::string &json);

} // namespace docsandbox::common

#pragma once

#include "toolguard/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolguard::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape the body of a JSON string literal (\n, \t, \uXXXX, ...).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Find the end (exclusive) of a bare scalar token (number, true, false, null).
[[nodiscard]] std::size_t json_find_scalar_end(const std::string &json, std::size_t pos);

/// Parse the top level of a JSON object into a key -> raw value map. Every value is kept as
/// its source text (strings keep their quotes and escapes).
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] Result<JsonFlatMap> json_parse_flat(const std::string &json);

/// Decode a JSON array text like ["a","b"]. Non-string elements are an error.
[[nodiscard]] Result<std::vector<std::string>> json_parse_string_array(const std::string &array_json);

/// Serialize strings as a JSON array.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

} // namespace toolguard::common

#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace hermit::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote and escape: `abc` -> `"abc"`.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string body (all standard escapes, \uXXXX to UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level object fields. String values are unescaped; objects, arrays,
/// numbers and booleans are kept as raw JSON text. Members whose value is
/// `null` are left out, so `"null"` always means the string.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Only the top-level members whose value is a JSON string, unescaped.
[[nodiscard]] JsonFlatMap json_parse_string_members(const std::string &json);

/// True when `text` (ignoring surrounding whitespace) is a well-formed
/// object whose braces and strings balance.
[[nodiscard]] bool json_is_object(const std::string &text);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Elements of a JSON array of strings like ["a","b"].
[[nodiscard]] std::vector<std::string> json_string_array(const std::string &array_json);

} // namespace hermit::common

#pragma once

#include "shellgate/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace shellgate::common {

/// Escape a string for embedding inside a JSON string literal. Control
/// characters are written as \u00XX.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal, including \uXXXX sequences
/// (surrogate pairs are combined and emitted as UTF-8). Fails on malformed
/// escapes.
[[nodiscard]] Result<std::string> json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

enum class JsonKind { String, Object, Array, Number, Bool, Null };

/// One member of a parsed object. Strings hold their decoded text; objects
/// and arrays hold their raw source (braces included) for a further parse.
struct JsonValue {
  JsonKind kind = JsonKind::Null;
  std::string text;
};

using JsonObject = std::unordered_map<std::string, JsonValue>;

/// Parse the top level of a JSON object. Nested containers are kept raw.
/// Trailing content or malformed members fail the parse.
[[nodiscard]] Result<JsonObject> json_parse_object(const std::string &json);

} // namespace shellgate::common

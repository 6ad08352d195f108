#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace skyhost::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal.
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Position of the closing quote of the string literal opening at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Position of the bracket matching the one at open_pos, skipping string contents.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// True when the whole (trimmed) text is one syntactically valid JSON value.
[[nodiscard]] bool json_is_valid(const std::string &text);

/// True when the whole (trimmed) text is one syntactically valid JSON object.
[[nodiscard]] bool json_is_object(const std::string &text);

/// Top-level members of an object. Strings are unescaped; nested objects, arrays,
/// numbers and literals are kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// String elements of a raw JSON array like ["a","b"]. Non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

/// Split a JSON array of objects into the raw text of each object.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace skyhost::common

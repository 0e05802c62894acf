#pragma once

#include "semcache/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace semcache::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string body (without the surrounding quotes).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Extract the first string field named `field`. Returns nullopt when absent or not a string.
[[nodiscard]] std::optional<std::string> json_get_string(const std::string &json,
                                                         const std::string &field);

/// Extract the first array field named `field`, brackets included. Empty when absent.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Parse a flat numeric array such as "[0.1, -2e-3, 4]".
[[nodiscard]] Result<std::vector<float>> json_parse_float_array(const std::string &array_json);

} // namespace semcache::common

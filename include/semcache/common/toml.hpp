#pragma once

#include "semcache/common/result.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace semcache::common {

// Flat view of a TOML document: "section.key" -> raw value text. Getters return
// `fallback` for a missing key or a value of the wrong shape.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;

private:
  [[nodiscard]] const std::string *raw(const std::string &key) const;
};

// Handles [section] headers, key = value pairs and # comments. A repeated key,
// an open string or a line without '=' is a ConfigError naming the line.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace semcache::common

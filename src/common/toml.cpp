#include "semcache/common/toml.hpp"

#include "semcache/common/fs.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>

namespace semcache::common {

namespace {

// Cuts `line` at the first '#' outside a quoted string. Returns false when a
// string is left open at end of line.
bool strip_comment(const std::string &line, std::string &out) {
  char quote = '\0';
  bool escaped = false;
  out.clear();
  for (const char ch : line) {
    if (quote == '\0' && ch == '#') {
      break;
    }
    out.push_back(ch);
    if (quote == '"' && escaped) {
      escaped = false;
    } else if (quote == '"' && ch == '\\') {
      escaped = true;
    } else if (quote != '\0' && ch == quote) {
      quote = '\0';
    } else if (quote == '\0' && (ch == '"' || ch == '\'')) {
      quote = ch;
    }
  }
  return quote == '\0';
}

// Literal ('...') strings are taken as written; basic ("...") strings decode
// \n, \t, \" and \\. Bare values come back unchanged.
std::string decode_string(const std::string &raw) {
  if (raw.size() < 2) {
    return raw;
  }
  if (raw.front() == '\'' && raw.back() == '\'') {
    return raw.substr(1, raw.size() - 2);
  }
  if (raw.front() != '"' || raw.back() != '"') {
    return raw;
  }

  std::string out;
  out.reserve(raw.size() - 2);
  for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 2 >= raw.size()) {
      out.push_back(raw[i]);
      continue;
    }
    const char next = raw[++i];
    out.push_back(next == 'n' ? '\n' : next == 't' ? '\t' : next);
  }
  return out;
}

Status line_error(const std::string &what, const std::size_t line_number) {
  return Status::error(ErrorCode::ConfigError, what + " at line " + std::to_string(line_number));
}

} // namespace

const std::string *TomlDocument::raw(const std::string &key) const {
  const auto it = values.find(key);
  return it == values.end() ? nullptr : &it->second;
}

bool TomlDocument::has(const std::string &key) const { return raw(key) != nullptr; }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto *value = raw(key);
  return value == nullptr ? fallback : decode_string(*value);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto *value = raw(key);
  if (value == nullptr) {
    return fallback;
  }
  if (*value == "true") {
    return true;
  }
  return *value == "false" ? false : fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto *value = raw(key);
  if (value == nullptr) {
    return fallback;
  }

  std::string digits;
  for (const char ch : *value) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  std::uint64_t parsed = 0;
  const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
  if (digits.empty() || ec != std::errc() || end != digits.data() + digits.size()) {
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto *value = raw(key);
  if (value == nullptr || value->empty()) {
    return fallback;
  }
  char *end = nullptr;
  const double parsed = std::strtod(value->c_str(), &end);
  return end == value->c_str() + value->size() ? parsed : fallback;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string body;
  std::string section;

  for (std::size_t line_number = 1; std::getline(stream, line); ++line_number) {
    if (!strip_comment(line, body)) {
      return Result<TomlDocument>::failure(line_error("Unterminated string", line_number));
    }
    body = trim(body);
    if (body.empty()) {
      continue;
    }

    if (body.front() == '[') {
      if (body.back() != ']' || (section = trim(body.substr(1, body.size() - 2))).empty()) {
        return Result<TomlDocument>::failure(line_error("Invalid section header", line_number));
      }
      continue;
    }

    const std::size_t equals = body.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(line_error("Expected key = value", line_number));
    }
    const std::string key = trim(body.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure(line_error("Missing key", line_number));
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (!document.values.emplace(full_key, trim(body.substr(equals + 1))).second) {
      return Result<TomlDocument>::failure(line_error("Duplicate key " + full_key, line_number));
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string quoted = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
      quoted += "\\\"";
      break;
    case '\\':
      quoted += "\\\\";
      break;
    case '\n':
      quoted += "\\n";
      break;
    case '\t':
      quoted += "\\t";
      break;
    default:
      quoted.push_back(ch);
    }
  }
  return quoted + "\"";
}

} // namespace semcache::common

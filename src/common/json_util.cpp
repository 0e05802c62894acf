#include "semcache/common/json_util.hpp"

#include "semcache/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <sstream>

namespace semcache::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool parse_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(raw.data() + pos, raw.data() + pos + 4, out, 16);
  return ec == std::errc() && ptr == raw.data() + pos + 4;
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
        escaped.push_back(kHex[(ch >> 4) & 0x0F]);
        escaped.push_back(kHex[ch & 0x0F]);
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
    const char next = raw[++i];
    switch (next) {
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
    case 'u': {
      std::uint32_t code_point = 0;
      if (!parse_hex4(raw, i + 1, code_point)) {
        out.push_back(next);
        break;
      }
      i += 4;
      // Surrogate pair.
      if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 6 < raw.size() &&
          raw[i + 1] == '\\' && raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_find_key(const std::string &json, const std::string &key, const std::size_t from) {
  const std::string quoted = "\"" + key + "\"";
  return json.find(quoted, from);
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, const std::size_t quote_pos) {
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

std::size_t json_find_matching_token(const std::string &json, const std::size_t open_pos,
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
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

namespace {

// Position just past the ':' of the first occurrence of `field` used as an object key.
std::size_t find_value_start(const std::string &json, const std::string &field) {
  std::size_t from = 0;
  while (true) {
    const auto key_pos = json_find_key(json, field, from);
    if (key_pos == std::string::npos) {
      return std::string::npos;
    }
    const auto colon = json_skip_ws(json, key_pos + field.size() + 2);
    if (colon < json.size() && json[colon] == ':') {
      return colon + 1;
    }
    from = key_pos + 1;
  }
}

} // namespace

std::optional<std::string> json_get_string(const std::string &json, const std::string &field) {
  const auto value_start = find_value_start(json, field);
  if (value_start == std::string::npos) {
    return std::nullopt;
  }
  const std::size_t pos = json_skip_ws(json, value_start);
  if (pos >= json.size() || json[pos] != '"') {
    return std::nullopt;
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos) {
    return std::nullopt;
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto value_start = find_value_start(json, field);
  if (value_start == std::string::npos) {
    return "";
  }
  const std::size_t pos = json_skip_ws(json, value_start);
  const auto end = json_find_matching_token(json, pos, '[', ']');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

Result<std::vector<float>> json_parse_float_array(const std::string &array_json) {
  const std::string raw = trim(array_json);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return Result<std::vector<float>>::failure(ErrorCode::InvalidArgument, "not a JSON array");
  }

  std::vector<float> values;
  std::stringstream stream(raw.substr(1, raw.size() - 2));
  std::string item;
  while (std::getline(stream, item, ',')) {
    const std::string number = trim(item);
    if (number.empty()) {
      continue;
    }
    try {
      std::size_t consumed = 0;
      values.push_back(static_cast<float>(std::stod(number, &consumed)));
      if (consumed != number.size()) {
        return Result<std::vector<float>>::failure(ErrorCode::InvalidArgument,
                                                   "invalid number: " + number);
      }
    } catch (const std::exception &) {
      return Result<std::vector<float>>::failure(ErrorCode::InvalidArgument,
                                                 "invalid number: " + number);
    }
  }

  return Result<std::vector<float>>::success(std::move(values));
}

} // namespace semcache::common

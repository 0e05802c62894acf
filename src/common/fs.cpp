#include "semcache/common/fs.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <system_error>

namespace semcache::common {

namespace {

constexpr const char *kWhitespace = " \t\r\n\f\v";

bool is_var_char(const char ch, const bool first) {
  const auto uch = static_cast<unsigned char>(ch);
  return std::isalpha(uch) != 0 || ch == '_' || (!first && std::isdigit(uch) != 0);
}

} // namespace

std::string trim(const std::string &input) {
  const auto first = input.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return "";
  }
  return input.substr(first, input.find_last_not_of(kWhitespace) - first + 1);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string value) {
  for (char &ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

Result<std::filesystem::path> home_dir() {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return Result<std::filesystem::path>::failure(ErrorCode::ConfigError, "HOME is not set");
  }
  return Result<std::filesystem::path>::success(std::filesystem::path(home));
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (!ec && !std::filesystem::is_directory(path, ec)) {
    ec = std::make_error_code(std::errc::not_a_directory);
  }
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorCode::ConfigError, "cannot create directory " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

// "~" at the start becomes $HOME; $NAME and ${NAME} expand from the environment,
// with unset variables expanding to nothing. A '$' not followed by a name stays.
std::string expand_path(std::string value) {
  if (!value.empty() && value.front() == '~') {
    if (const auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::string out;
  out.reserve(value.size());
  std::size_t i = 0;
  while (i < value.size()) {
    if (value[i] != '$') {
      out.push_back(value[i++]);
      continue;
    }

    const bool braced = i + 1 < value.size() && value[i + 1] == '{';
    const std::size_t name_begin = i + (braced ? 2 : 1);
    std::size_t name_end = name_begin;
    while (name_end < value.size() && is_var_char(value[name_end], name_end == name_begin)) {
      ++name_end;
    }
    if (name_end == name_begin || (braced && (name_end >= value.size() || value[name_end] != '}'))) {
      out.push_back(value[i++]);
      continue;
    }

    const std::string name = value.substr(name_begin, name_end - name_begin);
    if (const char *var = std::getenv(name.c_str()); var != nullptr) {
      out += var;
    }
    i = name_end + (braced ? 1 : 0);
  }
  return out;
}

std::string now_rfc3339() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  char buffer[sizeof("YYYY-MM-DDTHH:MM:SSZ")];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buffer;
}

} // namespace semcache::common

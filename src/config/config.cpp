#include "semcache/config/config.hpp"

#include "semcache/common/fs.hpp"
#include "semcache/common/toml.hpp"
#include "semcache/observability/factory.hpp"

#include <cstdlib>
#include <cctype>
#include <fstream>
#include <sstream>

namespace semcache::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".semcache";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("SEMCACHE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

// Values already present in the environment win over .env files.
void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("SEMCACHE_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

bool is_known(const std::string &value, std::initializer_list<const char *> known) {
  const std::string normalized = common::to_lower(common::trim(value));
  for (const char *candidate : known) {
    if (normalized == candidate) {
      return true;
    }
  }
  return false;
}

bool needs_api_key(const Config &config) {
  return common::to_lower(config.generation.provider) == "openai" ||
         common::to_lower(config.embedding.provider) == "openai";
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorCode::ConfigError, "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *api_key = std::getenv("SEMCACHE_API_KEY"); api_key != nullptr && *api_key) {
    config.api_key = std::string(api_key);
  } else if (!config.api_key.has_value() && needs_api_key(config)) {
    if (const char *openai_key = std::getenv("OPENAI_API_KEY");
        openai_key != nullptr && *openai_key) {
      config.api_key = std::string(openai_key);
    }
  }

  if (const char *model = std::getenv("SEMCACHE_MODEL"); model != nullptr && *model) {
    config.generation.model = model;
  }
  if (const char *db_path = std::getenv("SEMCACHE_DB_PATH"); db_path != nullptr && *db_path) {
    config.cache.db_path = db_path;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.code(), parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  if (doc.has("api_key")) {
    config.api_key = common::expand_path(doc.get_string("api_key"));
  }

  config.cache.db_path = doc.get_string("cache.db_path", config.cache.db_path);
  config.cache.fast_threshold = doc.get_double("cache.fast_threshold", config.cache.fast_threshold);
  config.cache.fallback_threshold =
      doc.get_double("cache.fallback_threshold", config.cache.fallback_threshold);
  config.cache.top_k = static_cast<std::size_t>(doc.get_u64("cache.top_k", config.cache.top_k));
  config.cache.refresh_stale_entries =
      doc.get_bool("cache.refresh_stale_entries", config.cache.refresh_stale_entries);

  config.embedding.provider = doc.get_string("embedding.provider", config.embedding.provider);
  config.embedding.model = doc.get_string("embedding.model", config.embedding.model);
  config.embedding.dimensions =
      static_cast<std::size_t>(doc.get_u64("embedding.dimensions", config.embedding.dimensions));
  config.embedding.base_url = doc.get_string("embedding.base_url", config.embedding.base_url);

  config.generation.provider = doc.get_string("generation.provider", config.generation.provider);
  config.generation.base_url = doc.get_string("generation.base_url", config.generation.base_url);
  config.generation.model = doc.get_string("generation.model", config.generation.model);
  config.generation.temperature =
      doc.get_double("generation.temperature", config.generation.temperature);
  config.generation.timeout_ms =
      doc.get_u64("generation.timeout_ms", config.generation.timeout_ms);
  config.generation.retries =
      static_cast<std::uint32_t>(doc.get_u64("generation.retries", config.generation.retries));
  config.generation.backoff_ms =
      doc.get_u64("generation.backoff_ms", config.generation.backoff_ms);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::failure(path_result.code(), path_result.error());
  }
  const auto &path = path_result.value();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorCode::ConfigError,
                                           "Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(config.code(),
                                           path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return path_result.status();
  }
  const std::filesystem::path path = path_result.value();
  if (!path.parent_path().empty()) {
    const auto dir = common::ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return dir.status();
    }
  }

  const std::filesystem::path tmp_path = path.string() + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      return common::Status::error(common::ErrorCode::ConfigError,
                                   "Unable to write temporary config file");
    }

    if (config.api_key.has_value()) {
      file << "api_key = " << common::quote_toml_string(*config.api_key) << "\n\n";
    }

    file << "[cache]\n";
    file << "db_path = " << common::quote_toml_string(config.cache.db_path) << "\n";
    file << "fast_threshold = " << config.cache.fast_threshold << "\n";
    file << "fallback_threshold = " << config.cache.fallback_threshold << "\n";
    file << "top_k = " << config.cache.top_k << "\n";
    file << "refresh_stale_entries = " << bool_to_toml(config.cache.refresh_stale_entries)
         << "\n";

    file << "\n[embedding]\n";
    file << "provider = " << common::quote_toml_string(config.embedding.provider) << "\n";
    file << "model = " << common::quote_toml_string(config.embedding.model) << "\n";
    file << "dimensions = " << config.embedding.dimensions << "\n";
    file << "base_url = " << common::quote_toml_string(config.embedding.base_url) << "\n";

    file << "\n[generation]\n";
    file << "provider = " << common::quote_toml_string(config.generation.provider) << "\n";
    file << "base_url = " << common::quote_toml_string(config.generation.base_url) << "\n";
    file << "model = " << common::quote_toml_string(config.generation.model) << "\n";
    file << "temperature = " << config.generation.temperature << "\n";
    file << "timeout_ms = " << config.generation.timeout_ms << "\n";
    file << "retries = " << config.generation.retries << "\n";
    file << "backoff_ms = " << config.generation.backoff_ms << "\n";

    file << "\n[observability]\n";
    file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

    if (!file) {
      return common::Status::error(common::ErrorCode::ConfigError,
                                   "Failed to write temporary config file");
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::ConfigError,
                                 "Failed to replace config file: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const auto in_unit_range = [](const double value) { return value >= -1.0 && value <= 1.0; };
  if (!in_unit_range(config.cache.fast_threshold) ||
      !in_unit_range(config.cache.fallback_threshold)) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "cache thresholds must lie within [-1, 1]");
  }
  if (config.cache.fast_threshold < config.cache.fallback_threshold) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "cache.fast_threshold must be >= cache.fallback_threshold");
  }
  if (config.cache.top_k == 0) {
    return Warnings::failure(common::ErrorCode::ConfigError, "cache.top_k must be at least 1");
  }
  if (common::trim(config.cache.db_path).empty()) {
    return Warnings::failure(common::ErrorCode::ConfigError, "cache.db_path is required");
  }
  if (config.embedding.dimensions == 0) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "embedding.dimensions must be at least 1");
  }
  if (!is_known(config.embedding.provider, {"local", "ollama", "openai", "noop", "none"})) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "unknown embedding.provider: " + config.embedding.provider);
  }
  if (!is_known(config.generation.provider, {"ollama", "openai", "compatible"})) {
    return Warnings::failure(common::ErrorCode::ConfigError,
                             "unknown generation.provider: " + config.generation.provider);
  }
  if (config.generation.temperature < 0.0 || config.generation.temperature > 2.0) {
    warnings.push_back("generation.temperature is outside the usual [0, 2] range");
  }
  if (is_known(config.embedding.provider, {"noop", "none"})) {
    warnings.push_back("embedding.provider=noop disables semantic matching");
  }
  if (needs_api_key(config) &&
      (!config.api_key.has_value() || common::trim(*config.api_key).empty())) {
    warnings.push_back("API key is missing (api_key, SEMCACHE_API_KEY, or OPENAI_API_KEY)");
  }
  if (const auto backends = observability::parse_backends(config.observability.backend);
      !backends.ok()) {
    warnings.push_back(backends.error() + "; logging to stderr instead");
  }

  return Warnings::success(std::move(warnings));
}

std::filesystem::path resolved_db_path(const Config &config) {
  if (config.cache.db_path == ":memory:") {
    return config.cache.db_path;
  }
  return common::expand_path(config.cache.db_path);
}

} // namespace semcache::config

#pragma once

#include "semcache/common/result.hpp"
#include "semcache/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace semcache::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

// Hard errors come back as a failure; soft problems are returned as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

// db_path with '~' and environment variables expanded.
[[nodiscard]] std::filesystem::path resolved_db_path(const Config &config);

} // namespace semcache::config

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace semcache::config {

struct CacheConfig {
  std::string db_path = "~/.semcache/cache.db";
  double fast_threshold = 0.75;
  double fallback_threshold = 0.60;
  std::size_t top_k = 5;
  bool refresh_stale_entries = true;
};

struct EmbeddingConfig {
  std::string provider = "local";
  std::string model = "all-minilm";
  std::size_t dimensions = 384;
  std::string base_url = "http://localhost:11434";
};

struct GenerationConfig {
  std::string provider = "ollama";
  std::string base_url = "http://localhost:11434";
  std::string model = "llama3.2";
  double temperature = 0.9;
  std::uint64_t timeout_ms = 60'000;
  std::uint32_t retries = 1;
  std::uint64_t backoff_ms = 500;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::optional<std::string> api_key;
  CacheConfig cache;
  EmbeddingConfig embedding;
  GenerationConfig generation;
  ObservabilityConfig observability;
};

} // namespace semcache::config

#pragma once

#include "semcache/cache/query_store.hpp"
#include "semcache/cache/vector_index.hpp"
#include "semcache/common/result.hpp"
#include "semcache/config/schema.hpp"
#include "semcache/embedding/embedder.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace semcache::cache {

struct CacheOptions {
  float fast_threshold = 0.75F;
  float fallback_threshold = 0.60F;
  std::size_t top_k = 5;
  bool refresh_stale_entries = true;
};

[[nodiscard]] CacheOptions options_from_config(const config::CacheConfig &config);
[[nodiscard]] common::Status validate_options(const CacheOptions &options);

enum class LookupPath {
  Fast,
  Fallback,
  Miss,
};

[[nodiscard]] std::string_view lookup_path_name(LookupPath path);

struct CacheLookup {
  std::optional<std::string> response;
  LookupPath path = LookupPath::Miss;
  float similarity = 0.0F;
  // The query embedding, handed back so a miss can be recorded without re-embedding.
  std::vector<float> embedding;

  [[nodiscard]] bool hit() const { return response.has_value(); }
};

struct CacheStats {
  std::uint64_t fast_hits = 0;
  std::uint64_t fallback_hits = 0;
  std::uint64_t misses = 0;
  std::uint64_t records_new = 0;
  std::uint64_t records_updated = 0;
  std::size_t index_size = 0;
};

// Two-tier semantic lookup over a durable query store. The fast tier searches the
// in-process vector index; the fallback tier scans the store in id order and
// copies an accepted record back into the index.
class SemanticCache {
  // Only create() can name this, so the constructor stays usable with make_unique.
  struct CreateKey {
    explicit CreateKey() = default;
  };

public:
  // Validates `options` and replays the store into a fresh index before returning.
  [[nodiscard]] static common::Result<std::unique_ptr<SemanticCache>>
  create(std::shared_ptr<IQueryStore> store, std::shared_ptr<embedding::IEmbedder> embedder,
         CacheOptions options = {});

  SemanticCache(CreateKey, std::shared_ptr<IQueryStore> store,
                std::shared_ptr<embedding::IEmbedder> embedder, CacheOptions options);

  [[nodiscard]] common::Result<CacheLookup> lookup(const std::string &query);
  [[nodiscard]] common::Result<bool> record(const std::string &query,
                                            const std::vector<float> &embedding,
                                            const std::string &response);
  [[nodiscard]] common::Status rebuild();

  [[nodiscard]] CacheStats stats() const;
  [[nodiscard]] std::size_t index_size() const { return index_.size(); }
  [[nodiscard]] const CacheOptions &options() const { return options_; }
  [[nodiscard]] IQueryStore &store() { return *store_; }
  [[nodiscard]] embedding::IEmbedder &embedder() { return *embedder_; }

private:
  [[nodiscard]] common::Result<std::vector<float>> embed_query(const std::string &query);
  [[nodiscard]] common::Result<std::optional<CacheLookup>>
  fast_lookup(const std::vector<float> &embedding) const;
  [[nodiscard]] common::Result<std::optional<CacheLookup>>
  fallback_lookup(const std::vector<float> &embedding);
  [[nodiscard]] common::Status ensure_ready() const;

  std::shared_ptr<IQueryStore> store_;
  std::shared_ptr<embedding::IEmbedder> embedder_;
  CacheOptions options_;
  VectorIndex index_;

  mutable std::mutex state_mutex_;
  bool ready_ = false;
  CacheStats stats_;
};

} // namespace semcache::cache

#include "semcache/cache/semantic_cache.hpp"

#include "semcache/common/hash.hpp"
#include "semcache/observability/global.hpp"

#include <chrono>
#include <utility>

namespace semcache::cache {

namespace {

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

CacheOptions options_from_config(const config::CacheConfig &config) {
  return CacheOptions{.fast_threshold = static_cast<float>(config.fast_threshold),
                      .fallback_threshold = static_cast<float>(config.fallback_threshold),
                      .top_k = config.top_k,
                      .refresh_stale_entries = config.refresh_stale_entries};
}

common::Status validate_options(const CacheOptions &options) {
  if (options.fast_threshold < options.fallback_threshold) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "fast threshold must be >= fallback threshold");
  }
  if (options.top_k == 0) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "top_k must be at least 1");
  }
  return common::Status::success();
}

std::string_view lookup_path_name(const LookupPath path) {
  switch (path) {
  case LookupPath::Fast:
    return "fast";
  case LookupPath::Fallback:
    return "fallback";
  case LookupPath::Miss:
    return "miss";
  }
  return "miss";
}

common::Result<std::unique_ptr<SemanticCache>>
SemanticCache::create(std::shared_ptr<IQueryStore> store,
                      std::shared_ptr<embedding::IEmbedder> embedder, CacheOptions options) {
  using CreateResult = common::Result<std::unique_ptr<SemanticCache>>;
  if (store == nullptr || embedder == nullptr) {
    return CreateResult::failure(common::ErrorCode::InvalidArgument,
                                 "semantic cache needs a store and an embedder");
  }
  if (embedder->dimensions() == 0) {
    return CreateResult::failure(common::ErrorCode::InvalidArgument,
                                 "embedder reports zero dimensions");
  }
  if (const auto status = validate_options(options); !status.ok()) {
    return CreateResult::failure(status);
  }

  auto cache =
      std::make_unique<SemanticCache>(CreateKey{}, std::move(store), std::move(embedder), options);
  if (const auto status = cache->rebuild(); !status.ok()) {
    return CreateResult::failure(status);
  }
  return CreateResult::success(std::move(cache));
}

SemanticCache::SemanticCache(CreateKey, std::shared_ptr<IQueryStore> store,
                             std::shared_ptr<embedding::IEmbedder> embedder, CacheOptions options)
    : store_(std::move(store)), embedder_(std::move(embedder)), options_(options),
      index_(embedder_->dimensions()) {}

common::Status SemanticCache::ensure_ready() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!ready_) {
    return common::Status::error(common::ErrorCode::InconsistentIndexState,
                                 "vector index has not been rebuilt from the store");
  }
  return common::Status::success();
}

common::Status SemanticCache::rebuild() {
  const auto start = std::chrono::steady_clock::now();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ready_ = false;
  }
  index_.clear();

  auto records = store_->all_records();
  if (!records.ok()) {
    observability::record_error("cache.rebuild", records.error());
    return records.status();
  }

  for (auto &record : records.value()) {
    auto added = index_.add(std::move(record.embedding), std::move(record.response),
                            std::move(record.query));
    if (!added.ok()) {
      index_.clear();
      const std::string message = "stored record " + std::to_string(record.id) +
                                  " does not fit the configured embedder: " + added.error();
      observability::record_error("cache.rebuild", message);
      return common::Status::error(common::ErrorCode::StoreFailure, message);
    }
  }

  const std::size_t entries = index_.size();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ready_ = true;
    stats_.index_size = entries;
  }
  observability::record_index_rebuild(entries, elapsed_since(start));
  observability::record_metric(observability::IndexSizeMetric{.entries = entries});
  return common::Status::success();
}

common::Result<std::vector<float>> SemanticCache::embed_query(const std::string &query) {
  auto embedded = embedder_->embed(query);
  if (!embedded.ok()) {
    return common::Result<std::vector<float>>::failure(common::ErrorCode::EmbeddingFailure,
                                                       embedded.error());
  }
  if (const auto status = embedding::check_dimensions(embedded.value(), index_.dimensions());
      !status.ok()) {
    return common::Result<std::vector<float>>::failure(status);
  }
  return embedded;
}

common::Result<std::optional<CacheLookup>>
SemanticCache::fast_lookup(const std::vector<float> &embedding) const {
  using FastResult = common::Result<std::optional<CacheLookup>>;
  if (index_.size() == 0) {
    return FastResult::success(std::nullopt);
  }

  auto hits = index_.search(embedding, options_.top_k);
  if (!hits.ok()) {
    return FastResult::failure(hits.status());
  }

  // Candidates in search order; the first occurrence of a response carries its best similarity.
  std::vector<std::pair<std::string, float>> candidates;
  std::vector<std::size_t> votes;
  for (const auto &hit : hits.value()) {
    if (!(hit.similarity > options_.fast_threshold)) {
      continue;
    }
    auto response = index_.response(hit.handle);
    if (!response.has_value()) {
      return FastResult::failure(common::ErrorCode::InconsistentIndexState,
                                 "search returned handle " + std::to_string(hit.handle) +
                                     " with no cached response");
    }

    bool counted = false;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
      if (candidates[i].first == *response) {
        ++votes[i];
        counted = true;
        break;
      }
    }
    if (!counted) {
      candidates.emplace_back(std::move(*response), hit.similarity);
      votes.push_back(1);
    }
  }

  if (candidates.empty()) {
    return FastResult::success(std::nullopt);
  }

  std::size_t winner = 0;
  for (std::size_t i = 1; i < candidates.size(); ++i) {
    if (votes[i] > votes[winner]) {
      winner = i;
    }
  }

  CacheLookup lookup;
  lookup.response = std::move(candidates[winner].first);
  lookup.path = LookupPath::Fast;
  lookup.similarity = candidates[winner].second;
  return FastResult::success(std::move(lookup));
}

common::Result<std::optional<CacheLookup>>
SemanticCache::fallback_lookup(const std::vector<float> &embedding) {
  using FallbackResult = common::Result<std::optional<CacheLookup>>;

  auto records = store_->all_records();
  if (!records.ok()) {
    return FallbackResult::failure(common::ErrorCode::StoreFailure, records.error());
  }

  for (auto &record : records.value()) {
    if (record.embedding.size() != embedding.size()) {
      return FallbackResult::failure(common::ErrorCode::StoreFailure,
                                     "stored record " + std::to_string(record.id) + " has " +
                                         std::to_string(record.embedding.size()) +
                                         " dimensions, expected " +
                                         std::to_string(embedding.size()));
    }
    const float similarity = inner_product(embedding, record.embedding);
    if (!(similarity > options_.fallback_threshold)) {
      continue;
    }

    CacheLookup lookup;
    lookup.response = record.response;
    lookup.path = LookupPath::Fallback;
    lookup.similarity = similarity;

    // Index the stored vector and the query vector so the same question hits the fast tier.
    auto added = index_.add(std::move(record.embedding), record.response, record.query);
    if (added.ok()) {
      added = index_.add(embedding, std::move(record.response), std::move(record.query));
    }
    if (!added.ok()) {
      return FallbackResult::failure(added.status());
    }
    return FallbackResult::success(std::move(lookup));
  }

  return FallbackResult::success(std::nullopt);
}

common::Result<CacheLookup> SemanticCache::lookup(const std::string &query) {
  const auto start = std::chrono::steady_clock::now();
  if (const auto ready = ensure_ready(); !ready.ok()) {
    return common::Result<CacheLookup>::failure(ready);
  }

  auto embedded = embed_query(query);
  if (!embedded.ok()) {
    observability::record_error("cache.lookup", embedded.error());
    return common::Result<CacheLookup>::failure(embedded.status());
  }

  auto found = fast_lookup(embedded.value());
  if (found.ok() && !found.value().has_value()) {
    found = fallback_lookup(embedded.value());
  }
  if (!found.ok()) {
    observability::record_error("cache.lookup", found.error());
    return common::Result<CacheLookup>::failure(found.status());
  }

  CacheLookup lookup = found.value().has_value() ? std::move(*found.value()) : CacheLookup{};
  lookup.embedding = std::move(embedded.value());

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    switch (lookup.path) {
    case LookupPath::Fast:
      ++stats_.fast_hits;
      break;
    case LookupPath::Fallback:
      ++stats_.fallback_hits;
      break;
    case LookupPath::Miss:
      ++stats_.misses;
      break;
    }
  }

  observability::record_cache_lookup(std::string(lookup_path_name(lookup.path)),
                                     common::short_digest(query), lookup.similarity,
                                     elapsed_since(start));
  return common::Result<CacheLookup>::success(std::move(lookup));
}

common::Result<bool> SemanticCache::record(const std::string &query,
                                           const std::vector<float> &embedding,
                                           const std::string &response) {
  if (const auto ready = ensure_ready(); !ready.ok()) {
    return common::Result<bool>::failure(ready);
  }
  if (embedding.size() != index_.dimensions()) {
    return common::Result<bool>::failure(
        common::ErrorCode::InvalidArgument,
        "embedding has " + std::to_string(embedding.size()) + " dimensions, expected " +
            std::to_string(index_.dimensions()));
  }

  auto upserted = store_->upsert(query, embedding, response);
  if (!upserted.ok()) {
    observability::record_error("cache.record", upserted.error());
    return common::Result<bool>::failure(common::ErrorCode::StoreFailure, upserted.error());
  }

  const bool was_new = upserted.value();
  if (was_new) {
    auto added = index_.add(embedding, response, query);
    if (!added.ok()) {
      return common::Result<bool>::failure(added.status());
    }
  } else if (options_.refresh_stale_entries) {
    index_.refresh_responses(query, response);
  }

  const std::size_t entries = index_.size();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (was_new) {
      ++stats_.records_new;
    } else {
      ++stats_.records_updated;
    }
    stats_.index_size = entries;
  }

  observability::record_cache_record(common::short_digest(query), was_new);
  observability::record_metric(observability::IndexSizeMetric{.entries = entries});
  return common::Result<bool>::success(was_new);
}

CacheStats SemanticCache::stats() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  CacheStats snapshot = stats_;
  snapshot.index_size = index_.size();
  return snapshot;
}

} // namespace semcache::cache

#include "semcache/cache/semantic_cache.hpp"
#include "semcache/cache/sqlite_store.hpp"
#include "semcache/embedding/embedder_local.hpp"
#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cmath>
#include <memory>
#include <mutex>
#include <thread>

namespace {

using semcache::tests::require;
using semcache::tests::require_ok;
namespace cache = semcache::cache;
namespace common = semcache::common;
namespace testing = semcache::testing;

constexpr std::size_t kDims = 4;

struct Fixture {
  std::shared_ptr<testing::FixedEmbedder> embedder =
      std::make_shared<testing::FixedEmbedder>(kDims);
  std::shared_ptr<cache::IQueryStore> sqlite;
  std::shared_ptr<testing::CountingStore> store;
  std::unique_ptr<cache::SemanticCache> semantic;

  explicit Fixture(cache::CacheOptions options = {}) {
    auto opened = cache::SqliteQueryStore::open(":memory:");
    require_ok(opened, "opened");
    sqlite = std::move(opened.value());
    store = std::make_shared<testing::CountingStore>(sqlite);
    auto created = cache::SemanticCache::create(store, embedder, options);
    require_ok(created, "created");
    semantic = std::move(created.value());
  }

  void record(const std::string &query, const std::vector<float> &vector,
              const std::string &response) {
    embedder->set(query, vector);
    auto recorded = semantic->record(query, vector, response);
    require_ok(recorded, "recorded");
  }

  // Writes straight to the store so only the fallback scan can find the record.
  void store_only(const std::string &query, const std::vector<float> &vector,
                  const std::string &response) {
    auto upserted = sqlite->upsert(query, vector, response);
    require_ok(upserted, "upserted");
  }
};

} // namespace

void register_semantic_cache_tests(std::vector<semcache::tests::TestCase> &tests) {
  tests.push_back({"semantic_cache_empty_store_is_miss_without_side_effects", [] {
                     Fixture fx;
                     fx.embedder->set("hello", testing::axis_vector(kDims, 0));
                     const std::size_t scans_before = fx.store->scan_calls;

                     auto lookup = fx.semantic->lookup("hello");
                     require_ok(lookup, "lookup");
                     require(!lookup.value().hit(), "empty cache should miss");
                     require(lookup.value().path == cache::LookupPath::Miss, "path should be miss");
                     require(lookup.value().embedding == testing::axis_vector(kDims, 0),
                             "lookup should hand back the query embedding");
                     require(fx.semantic->index_size() == 0, "miss must not grow the index");
                     require(fx.store->upsert_calls == 0, "miss must not write the store");
                     require(fx.store->scan_calls == scans_before + 1,
                             "miss should scan the store once");
                     require(fx.sqlite->count().value() == 0, "store should stay empty");
                   }});

  tests.push_back({"semantic_cache_exact_duplicate_hits_fast_path", [] {
                     Fixture fx;
                     fx.record("What is 2+2?", testing::axis_vector(kDims, 0), "4");
                     const std::size_t scans_before = fx.store->scan_calls;

                     auto lookup = fx.semantic->lookup("What is 2+2?");
                     require_ok(lookup, "lookup");
                     require(lookup.value().response == std::optional<std::string>("4"),
                             "duplicate should return the recorded answer");
                     require(lookup.value().path == cache::LookupPath::Fast, "should be fast path");
                     require(std::fabs(lookup.value().similarity - 1.0F) < 1e-6F,
                             "identical vectors should score 1");
                     require(fx.store->scan_calls == scans_before, "fast path must not scan");
                   }});

  tests.push_back({"semantic_cache_record_twice_is_idempotent", [] {
                     Fixture fx;
                     const auto vector = testing::axis_vector(kDims, 0);
                     auto first = fx.semantic->record("q", vector, "r");
                     auto second = fx.semantic->record("q", vector, "r");
                     require(first.ok() && first.value(), "first record should be new");
                     require(second.ok() && !second.value(), "second record should update");

                     require(fx.sqlite->count().value() == 1, "only one record expected");
                     auto found = fx.sqlite->find("q");
                     require(found.ok() && found.value().has_value(), "record should exist");
                     require(found.value()->usage_count == 2, "usage_count should be 2");
                     require(found.value()->response == "r", "response should be kept");
                     require(fx.semantic->index_size() == 1, "update must not add an index entry");
                   }});

  tests.push_back({"semantic_cache_fast_threshold_is_strict", [] {
                     Fixture fx;
                     fx.record("stored", testing::axis_vector(kDims, 0), "A");
                     fx.embedder->set("at", testing::vector_with_similarity(kDims, 0.75F));

                     auto at = fx.semantic->lookup("at");
                     require_ok(at, "at");
                     require(at.value().path == cache::LookupPath::Fallback,
                             "similarity equal to the fast threshold must skip the fast path");

                     Fixture fresh;
                     fresh.record("stored", testing::axis_vector(kDims, 0), "A");
                     fresh.embedder->set("above", testing::vector_with_similarity(
                                                      kDims, std::nextafter(0.75F, 1.0F)));
                     auto above = fresh.semantic->lookup("above");
                     require_ok(above, "above");
                     require(above.value().path == cache::LookupPath::Fast,
                             "similarity just above the fast threshold should hit");
                     require(above.value().response == std::optional<std::string>("A"),
                             "fast hit should return A");
                   }});

  tests.push_back({"semantic_cache_fallback_threshold_is_strict", [] {
                     Fixture fx;
                     fx.store_only("stored", testing::axis_vector(kDims, 0), "A");
                     fx.embedder->set("at", testing::vector_with_similarity(kDims, 0.60F));
                     fx.embedder->set("above", testing::vector_with_similarity(
                                                   kDims, std::nextafter(0.60F, 1.0F), 2));

                     auto at = fx.semantic->lookup("at");
                     require_ok(at, "at");
                     require(!at.value().hit(), "similarity equal to the fallback threshold misses");
                     require(fx.semantic->index_size() == 0, "miss must not touch the index");

                     auto above = fx.semantic->lookup("above");
                     require_ok(above, "above");
                     require(above.value().path == cache::LookupPath::Fallback,
                             "just above the fallback threshold should be a fallback hit");
                   }});

  tests.push_back({"semantic_cache_fallback_heals_index", [] {
                     Fixture fx;
                     fx.store_only("What's two plus two?", testing::axis_vector(kDims, 0), "4");
                     fx.embedder->set("What is 2+2?", testing::vector_with_similarity(kDims, 0.7F));
                     require(fx.semantic->index_size() == 0, "record was written behind the cache");

                     const std::size_t scans_before = fx.store->scan_calls;
                     auto first = fx.semantic->lookup("What is 2+2?");
                     require_ok(first, "first");
                     require(first.value().path == cache::LookupPath::Fallback,
                             "first near-duplicate should use the fallback scan");
                     require(first.value().response == std::optional<std::string>("4"),
                             "fallback should return the stored answer");
                     require(fx.store->scan_calls == scans_before + 1, "one scan expected");
                     require(fx.semantic->index_size() == 2,
                             "stored and query vectors should both be indexed");

                     auto second = fx.semantic->lookup("What is 2+2?");
                     require_ok(second, "second");
                     require(second.value().path == cache::LookupPath::Fast,
                             "repeat lookup should hit the fast path");
                     require(second.value().response == std::optional<std::string>("4"),
                             "repeat lookup should return the same answer");
                     require(fx.store->scan_calls == scans_before + 1,
                             "repeat lookup must not scan the store again");
                   }});

  tests.push_back({"semantic_cache_fallback_takes_first_match_in_store_order", [] {
                     Fixture fx;
                     fx.store_only("older", testing::vector_with_similarity(kDims, 0.65F, 1), "old");
                     fx.store_only("newer", testing::vector_with_similarity(kDims, 0.70F, 2), "new");
                     fx.embedder->set("lookup text", testing::axis_vector(kDims, 0));

                     auto lookup = fx.semantic->lookup("lookup text");
                     require_ok(lookup, "lookup");
                     require(lookup.value().response == std::optional<std::string>("old"),
                             "first acceptable record wins, not the best one");
                     require(std::fabs(lookup.value().similarity - 0.65F) < 1e-6F,
                             "similarity of the accepted record expected");
                   }});

  tests.push_back({"semantic_cache_majority_vote_beats_top_hit", [] {
                     Fixture fx;
                     fx.record("b", testing::vector_with_similarity(kDims, 0.95F, 1), "B");
                     fx.record("a1", testing::vector_with_similarity(kDims, 0.90F, 2), "A");
                     fx.record("a2", testing::vector_with_similarity(kDims, 0.85F, 3), "A");
                     fx.embedder->set("lookup text", testing::axis_vector(kDims, 0));

                     auto lookup = fx.semantic->lookup("lookup text");
                     require_ok(lookup, "lookup");
                     require(lookup.value().path == cache::LookupPath::Fast, "should be fast path");
                     require(lookup.value().response == std::optional<std::string>("A"),
                             "two votes for A should beat one for B");
                     require(std::fabs(lookup.value().similarity - 0.90F) < 1e-6F,
                             "winner reports its best supporting similarity");
                   }});

  tests.push_back({"semantic_cache_vote_tie_prefers_search_order", [] {
                     Fixture fx;
                     fx.record("a", testing::vector_with_similarity(kDims, 0.80F, 1), "A");
                     fx.record("b", testing::vector_with_similarity(kDims, 0.95F, 2), "B");
                     fx.embedder->set("lookup text", testing::axis_vector(kDims, 0));

                     auto lookup = fx.semantic->lookup("lookup text");
                     require_ok(lookup, "lookup");
                     require(lookup.value().response == std::optional<std::string>("B"),
                             "tie should go to the higher ranked response");
                   }});

  tests.push_back({"semantic_cache_top_k_limits_voters", [] {
                     Fixture fx(cache::CacheOptions{.top_k = 1});
                     fx.record("b", testing::vector_with_similarity(kDims, 0.95F, 1), "B");
                     fx.record("a1", testing::vector_with_similarity(kDims, 0.90F, 2), "A");
                     fx.record("a2", testing::vector_with_similarity(kDims, 0.85F, 3), "A");
                     fx.embedder->set("lookup text", testing::axis_vector(kDims, 0));

                     auto lookup = fx.semantic->lookup("lookup text");
                     require_ok(lookup, "lookup");
                     require(lookup.value().response == std::optional<std::string>("B"),
                             "only the top hit may vote when top_k is 1");
                   }});

  tests.push_back({"semantic_cache_unrelated_query_misses", [] {
                     Fixture fx;
                     fx.record("stored", testing::axis_vector(kDims, 0), "A");
                     fx.embedder->set("other", testing::axis_vector(kDims, 1));

                     auto lookup = fx.semantic->lookup("other");
                     require_ok(lookup, "lookup");
                     require(!lookup.value().hit(), "orthogonal query should miss");
                     require(fx.semantic->index_size() == 1, "miss must not grow the index");
                     require(fx.sqlite->count().value() == 1, "miss must not write the store");
                   }});

  tests.push_back({"semantic_cache_rebuild_survives_restart", [] {
                     testing::TempWorkspace workspace;
                     const auto db_path = workspace.path() / "cache.db";
                     auto embedder = std::make_shared<testing::FixedEmbedder>(kDims);
                     embedder->set("one", testing::axis_vector(kDims, 0));
                     embedder->set("two", testing::axis_vector(kDims, 1));
                     embedder->set("three", testing::axis_vector(kDims, 2));

                     {
                       auto store = cache::SqliteQueryStore::open(db_path);
                       require_ok(store, "store");
                       auto created = cache::SemanticCache::create(
                           std::shared_ptr<cache::IQueryStore>(std::move(store.value())), embedder);
                       require_ok(created, "created");
                       auto &first = *created.value();
                       require(first.record("one", testing::axis_vector(kDims, 0), "1").ok(),
                               "record one");
                       require(first.record("two", testing::axis_vector(kDims, 1), "2").ok(),
                               "record two");
                       require(first.record("three", testing::axis_vector(kDims, 2), "3").ok(),
                               "record three");
                       require(first.record("two", testing::axis_vector(kDims, 1), "two").ok(),
                               "update two");
                     }

                     auto store = cache::SqliteQueryStore::open(db_path);
                     require_ok(store, "store");
                     auto created = cache::SemanticCache::create(
                         std::shared_ptr<cache::IQueryStore>(std::move(store.value())), embedder);
                     require_ok(created, "created");
                     auto &second = *created.value();
                     require(second.index_size() == 3, "rebuild should restore every record");

                     const std::vector<std::pair<std::string, std::string>> expected = {
                         {"one", "1"}, {"two", "two"}, {"three", "3"}};
                     for (const auto &[query, response] : expected) {
                       auto lookup = second.lookup(query);
                       require_ok(lookup, "lookup");
                       require(lookup.value().path == cache::LookupPath::Fast,
                               query + " should hit the rebuilt index");
                       require(lookup.value().response == std::optional<std::string>(response),
                               query + " returned the wrong answer after restart");
                     }
                   }});

  tests.push_back({"semantic_cache_refreshes_stale_entries", [] {
                     Fixture fx;
                     fx.record("q", testing::axis_vector(kDims, 0), "old");
                     fx.record("q", testing::axis_vector(kDims, 0), "new");

                     auto lookup = fx.semantic->lookup("q");
                     require_ok(lookup, "lookup");
                     require(lookup.value().response == std::optional<std::string>("new"),
                             "fast path should see the refreshed answer");
                     require(fx.semantic->index_size() == 1, "refresh must not add entries");
                   }});

  tests.push_back({"semantic_cache_keeps_stale_entries_when_refresh_disabled", [] {
                     Fixture fx(cache::CacheOptions{.refresh_stale_entries = false});
                     fx.record("q", testing::axis_vector(kDims, 0), "old");
                     fx.record("q", testing::axis_vector(kDims, 0), "new");

                     auto lookup = fx.semantic->lookup("q");
                     require_ok(lookup, "lookup");
                     require(lookup.value().response == std::optional<std::string>("old"),
                             "fast path should keep the stale answer");
                     require(fx.sqlite->find("q").value()->response == "new",
                             "store should still hold the new answer");

                     require(fx.semantic->rebuild().ok(), "rebuild should succeed");
                     auto rebuilt = fx.semantic->lookup("q");
                     require_ok(rebuilt, "rebuilt");
                     require(rebuilt.value().response == std::optional<std::string>("new"),
                             "rebuild should pick up the stored answer");
                   }});

  tests.push_back({"semantic_cache_refresh_covers_healed_entries", [] {
                     Fixture fx;
                     fx.store_only("stored", testing::axis_vector(kDims, 0), "old");
                     fx.embedder->set("near", testing::vector_with_similarity(kDims, 0.7F));
                     require(fx.semantic->lookup("near").ok(), "fallback lookup should succeed");
                     require(fx.semantic->index_size() == 2, "fallback should index two vectors");

                     auto updated = fx.semantic->record("stored", testing::axis_vector(kDims, 0), "new");
                     require(updated.ok() && !updated.value(), "record should update");

                     auto lookup = fx.semantic->lookup("near");
                     require_ok(lookup, "lookup");
                     require(lookup.value().response == std::optional<std::string>("new"),
                             "healed entries should follow the stored query's answer");
                   }});

  tests.push_back({"semantic_cache_embedding_failure_is_not_a_miss", [] {
                     Fixture fx;
                     fx.embedder->fail_with("connection refused");
                     auto lookup = fx.semantic->lookup("anything");
                     require(!lookup.ok(), "embedding failure should fail the lookup");
                     require(lookup.code() == common::ErrorCode::EmbeddingFailure,
                             "expected EmbeddingFailure");
                     require(fx.semantic->stats().misses == 0, "failure must not count as a miss");
                   }});

  tests.push_back({"semantic_cache_rejects_wrong_embedding_dimension", [] {
                     Fixture fx;
                     fx.embedder->set("short", {1.0F, 0.0F});
                     auto lookup = fx.semantic->lookup("short");
                     require(!lookup.ok(), "wrong dimension should fail");
                     require(lookup.code() == common::ErrorCode::EmbeddingFailure,
                             "expected EmbeddingFailure");

                     auto recorded = fx.semantic->record("short", {1.0F, 0.0F}, "r");
                     require(!recorded.ok(), "record with wrong dimension should fail");
                     require(recorded.code() == common::ErrorCode::InvalidArgument,
                             "expected InvalidArgument");
                     require(fx.sqlite->count().value() == 0, "nothing should be stored");
                   }});

  tests.push_back({"semantic_cache_store_scan_failure_surfaces", [] {
                     Fixture fx;
                     fx.embedder->set("q", testing::axis_vector(kDims, 0));
                     fx.store->fail_scan = true;
                     auto lookup = fx.semantic->lookup("q");
                     require(!lookup.ok(), "scan failure should fail the lookup");
                     require(lookup.code() == common::ErrorCode::StoreFailure,
                             "expected StoreFailure");
                   }});

  tests.push_back({"semantic_cache_store_write_failure_leaves_index_untouched", [] {
                     Fixture fx;
                     fx.store->fail_upsert = true;
                     auto recorded = fx.semantic->record("q", testing::axis_vector(kDims, 0), "r");
                     require(!recorded.ok(), "write failure should surface");
                     require(recorded.code() == common::ErrorCode::StoreFailure,
                             "expected StoreFailure");
                     require(fx.semantic->index_size() == 0, "index must not change");
                   }});

  tests.push_back({"semantic_cache_failed_rebuild_blocks_lookups", [] {
                     Fixture fx;
                     fx.record("q", testing::axis_vector(kDims, 0), "r");
                     fx.store->fail_scan = true;
                     auto rebuilt = fx.semantic->rebuild();
                     require(!rebuilt.ok(), "rebuild should fail");
                     require(rebuilt.code() == common::ErrorCode::StoreFailure,
                             "expected StoreFailure");

                     auto lookup = fx.semantic->lookup("q");
                     require(!lookup.ok(), "lookup before a successful rebuild should fail");
                     require(lookup.code() == common::ErrorCode::InconsistentIndexState,
                             "expected InconsistentIndexState");

                     fx.store->fail_scan = false;
                     require(fx.semantic->rebuild().ok(), "rebuild should recover");
                     require(fx.semantic->lookup("q").ok(), "lookup should work again");
                   }});

  tests.push_back({"semantic_cache_create_rejects_mismatched_store", [] {
                     auto opened = cache::SqliteQueryStore::open(":memory:");
                     require_ok(opened, "opened");
                     std::shared_ptr<cache::IQueryStore> store = std::move(opened.value());
                     require(store->upsert("q", {1.0F, 0.0F, 0.0F}, "r").ok(), "seed store");

                     auto created = cache::SemanticCache::create(
                         store, std::make_shared<testing::FixedEmbedder>(kDims));
                     require(!created.ok(), "dimension mismatch should fail creation");
                     require(created.code() == common::ErrorCode::StoreFailure,
                             "expected StoreFailure");
                   }});

  tests.push_back({"semantic_cache_create_validates_options", [] {
                     auto opened = cache::SqliteQueryStore::open(":memory:");
                     require_ok(opened, "opened");
                     std::shared_ptr<cache::IQueryStore> store = std::move(opened.value());
                     auto embedder = std::make_shared<testing::FixedEmbedder>(kDims);

                     auto inverted = cache::SemanticCache::create(
                         store, embedder,
                         cache::CacheOptions{.fast_threshold = 0.5F, .fallback_threshold = 0.7F});
                     require(!inverted.ok(), "fast below fallback should fail");
                     require(inverted.code() == common::ErrorCode::InvalidArgument,
                             "expected InvalidArgument");

                     auto no_k = cache::SemanticCache::create(store, embedder,
                                                              cache::CacheOptions{.top_k = 0});
                     require(!no_k.ok(), "top_k of zero should fail");
                     require(no_k.code() == common::ErrorCode::InvalidArgument,
                             "expected InvalidArgument");

                     auto equal = cache::SemanticCache::create(
                         store, embedder,
                         cache::CacheOptions{.fast_threshold = 0.7F, .fallback_threshold = 0.7F});
                     require(equal.ok(), "equal thresholds are allowed");
                   }});

  tests.push_back({"semantic_cache_stats_count_paths", [] {
                     Fixture fx;
                     fx.record("q", testing::axis_vector(kDims, 0), "r");
                     fx.record("q", testing::axis_vector(kDims, 0), "r2");
                     fx.store_only("far", testing::axis_vector(kDims, 1), "f");
                     fx.embedder->set("near-far", testing::vector_with_similarity(kDims, 0.1F, 1));
                     fx.embedder->set("unrelated", testing::axis_vector(kDims, 3));

                     require(fx.semantic->lookup("q").ok(), "fast lookup");
                     require(fx.semantic->lookup("unrelated").ok(), "miss lookup");
                     require(fx.semantic->lookup("near-far").ok(), "fallback lookup");

                     const auto stats = fx.semantic->stats();
                     require(stats.fast_hits == 1, "one fast hit expected");
                     require(stats.fallback_hits == 1, "one fallback hit expected");
                     require(stats.misses == 1, "one miss expected");
                     require(stats.records_new == 1, "one new record expected");
                     require(stats.records_updated == 1, "one update expected");
                     require(stats.index_size == fx.semantic->index_size(), "index size mismatch");
                   }});

  tests.push_back({"semantic_cache_options_follow_config", [] {
                     semcache::config::CacheConfig config;
                     config.fast_threshold = 0.9;
                     config.fallback_threshold = 0.5;
                     config.top_k = 3;
                     config.refresh_stale_entries = false;
                     const auto options = cache::options_from_config(config);
                     require(options.fast_threshold == 0.9F, "fast threshold");
                     require(options.fallback_threshold == 0.5F, "fallback threshold");
                     require(options.top_k == 3, "top_k");
                     require(!options.refresh_stale_entries, "refresh flag");
                     require(cache::lookup_path_name(cache::LookupPath::Fallback) == "fallback",
                             "path name");
                   }});

  tests.push_back({"semantic_cache_concurrent_lookup_and_record", [] {
                     auto opened = cache::SqliteQueryStore::open(":memory:");
                     require_ok(opened, "opened");
                     auto embedder = std::make_shared<semcache::embedding::LocalEmbedder>(64);
                     auto created = cache::SemanticCache::create(
                         std::shared_ptr<cache::IQueryStore>(std::move(opened.value())), embedder);
                     require_ok(created, "created");
                     cache::SemanticCache &semantic = *created.value();

                     const auto prompt = [](int writer, int i) {
                       return "writer " + std::to_string(writer) + " asks question " +
                              std::to_string(i);
                     };
                     std::mutex failures_mutex;
                     std::vector<std::string> failures;
                     const auto fail = [&](std::string message) {
                       std::lock_guard<std::mutex> lock(failures_mutex);
                       failures.push_back(std::move(message));
                     };

                     std::vector<std::thread> workers;
                     for (int w = 0; w < 2; ++w) {
                       workers.emplace_back([&, w] {
                         for (int i = 0; i < 25; ++i) {
                           const auto query = prompt(w, i);
                           auto vector = embedder->embed(query);
                           if (!vector.ok()) {
                             fail(vector.error());
                             continue;
                           }
                           auto recorded = semantic.record(query, vector.value(),
                                                           "answer " + std::to_string(w) + "/" +
                                                               std::to_string(i));
                           if (!recorded.ok()) {
                             fail(recorded.error());
                           }
                         }
                       });
                     }
                     for (int r = 0; r < 2; ++r) {
                       workers.emplace_back([&, r] {
                         for (int i = 0; i < 25; ++i) {
                           auto lookup = semantic.lookup(prompt(r, i));
                           if (!lookup.ok()) {
                             fail(std::string(common::error_code_name(lookup.code())) + ": " +
                                  lookup.error());
                             continue;
                           }
                           if (lookup.value().hit() &&
                               lookup.value().response->rfind("answer ", 0) != 0) {
                             fail("hit resolved to an unknown response");
                           }
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }

                     require(failures.empty(), failures.empty() ? "" : failures.front());
                     require(semantic.stats().records_new == 50, "every record should land");
                     require(semantic.store().count().value() == 50, "store holds every record");
                     require(semantic.index_size() >= 50, "index holds at least every record");
                     for (int w = 0; w < 2; ++w) {
                       for (int i = 0; i < 25; ++i) {
                         auto lookup = semantic.lookup(prompt(w, i));
                         require_ok(lookup, "lookup");
                         require(lookup.value().hit(), "recorded prompt should hit");
                         require(lookup.value().path == cache::LookupPath::Fast,
                                 "recorded prompt should be served from the index");
                       }
                     }
                   }});
}

#pragma once

#include "semcache/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace semcache::cache {

struct QueryRecord {
  std::int64_t id = 0;
  std::string query;
  std::vector<float> embedding;
  std::string response;
  std::uint64_t usage_count = 1;
  std::string created_at;
  std::string updated_at;
};

// Durable, query-keyed record of every answer the cache has seen.
class IQueryStore {
public:
  virtual ~IQueryStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  // Inserts with usage_count = 1 and returns true, or replaces the response of the
  // existing record, bumps its usage_count and returns false. The stored embedding
  // is never replaced.
  [[nodiscard]] virtual common::Result<bool> upsert(const std::string &query,
                                                    const std::vector<float> &embedding,
                                                    const std::string &response) = 0;

  // Every record in insertion (id) order.
  [[nodiscard]] virtual common::Result<std::vector<QueryRecord>> all_records() = 0;
  [[nodiscard]] virtual common::Result<std::optional<QueryRecord>>
  find(const std::string &query) = 0;
  [[nodiscard]] virtual common::Result<std::size_t> count() = 0;
  [[nodiscard]] virtual bool health_check() = 0;
};

} // namespace semcache::cache

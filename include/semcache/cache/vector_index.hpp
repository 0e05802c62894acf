#pragma once

#include "semcache/common/result.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace semcache::cache {

using Handle = std::size_t;

struct SearchHit {
  Handle handle = 0;
  float similarity = 0.0F;
};

// One arena slot: the vector, the response it currently maps to, and the query text
// it was created from. Vector and response are always added together.
struct VolatileEntry {
  std::vector<float> vector;
  std::string response;
  std::string query;
};

// Append-only, in-process exact inner-product index. Handles are dense and
// assigned in insertion order starting from 0.
class VectorIndex {
public:
  explicit VectorIndex(std::size_t dimensions);

  [[nodiscard]] common::Result<Handle> add(std::vector<float> vector, std::string response,
                                           std::string query);

  // At most `k` hits, best first; equal similarities keep ascending handle order.
  [[nodiscard]] common::Result<std::vector<SearchHit>> search(const std::vector<float> &query,
                                                              std::size_t k) const;

  [[nodiscard]] std::optional<std::string> response(Handle handle) const;
  [[nodiscard]] common::Status set_response(Handle handle, std::string response);

  // Points every entry created from `query` at `response`; returns how many changed.
  std::size_t refresh_responses(const std::string &query, const std::string &response);

  void clear();
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t dimensions() const { return dimensions_; }

private:
  std::size_t dimensions_;
  mutable std::mutex mutex_;
  std::vector<VolatileEntry> entries_;
};

[[nodiscard]] float inner_product(const std::vector<float> &a, const std::vector<float> &b);

} // namespace semcache::cache

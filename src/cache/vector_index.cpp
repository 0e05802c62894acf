#include "semcache/cache/vector_index.hpp"

#include <algorithm>

namespace semcache::cache {

float inner_product(const std::vector<float> &a, const std::vector<float> &b) {
  const std::size_t n = std::min(a.size(), b.size());
  double dot = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return static_cast<float>(dot);
}

VectorIndex::VectorIndex(const std::size_t dimensions) : dimensions_(dimensions) {}

common::Result<Handle> VectorIndex::add(std::vector<float> vector, std::string response,
                                        std::string query) {
  if (vector.size() != dimensions_) {
    return common::Result<Handle>::failure(
        common::ErrorCode::InvalidArgument,
        "vector has " + std::to_string(vector.size()) + " dimensions, index expects " +
            std::to_string(dimensions_));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(VolatileEntry{
      .vector = std::move(vector), .response = std::move(response), .query = std::move(query)});
  return common::Result<Handle>::success(entries_.size() - 1);
}

common::Result<std::vector<SearchHit>> VectorIndex::search(const std::vector<float> &query,
                                                           const std::size_t k) const {
  if (query.size() != dimensions_) {
    return common::Result<std::vector<SearchHit>>::failure(
        common::ErrorCode::InvalidArgument,
        "query has " + std::to_string(query.size()) + " dimensions, index expects " +
            std::to_string(dimensions_));
  }

  std::vector<SearchHit> hits;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hits.reserve(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i) {
      hits.push_back(SearchHit{.handle = i, .similarity = inner_product(query, entries_[i].vector)});
    }
  }

  const std::size_t limit = std::min(k, hits.size());
  std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(limit), hits.end(),
                    [](const SearchHit &lhs, const SearchHit &rhs) {
                      if (lhs.similarity != rhs.similarity) {
                        return lhs.similarity > rhs.similarity;
                      }
                      return lhs.handle < rhs.handle;
                    });
  hits.resize(limit);
  return common::Result<std::vector<SearchHit>>::success(std::move(hits));
}

std::optional<std::string> VectorIndex::response(const Handle handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handle >= entries_.size()) {
    return std::nullopt;
  }
  return entries_[handle].response;
}

common::Status VectorIndex::set_response(const Handle handle, std::string response) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handle >= entries_.size()) {
    return common::Status::error(common::ErrorCode::InconsistentIndexState,
                                 "no index entry for handle " + std::to_string(handle));
  }
  entries_[handle].response = std::move(response);
  return common::Status::success();
}

std::size_t VectorIndex::refresh_responses(const std::string &query, const std::string &response) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t changed = 0;
  for (auto &entry : entries_) {
    if (entry.query == query && entry.response != response) {
      entry.response = response;
      ++changed;
    }
  }
  return changed;
}

void VectorIndex::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

std::size_t VectorIndex::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace semcache::cache

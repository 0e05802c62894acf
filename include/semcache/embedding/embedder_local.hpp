#pragma once

#include "semcache/embedding/embedder.hpp"

namespace semcache::embedding {

// Offline embedder: hashes lower-cased words and character trigrams into a
// fixed number of buckets, then L2-normalises. Deterministic across runs.
class LocalEmbedder final : public IEmbedder {
public:
  explicit LocalEmbedder(std::size_t dimensions = 384);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::size_t dimensions_;
};

} // namespace semcache::embedding

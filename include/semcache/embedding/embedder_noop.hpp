#pragma once

#include "semcache/embedding/embedder.hpp"

namespace semcache::embedding {

class NoopEmbedder final : public IEmbedder {
public:
  explicit NoopEmbedder(std::size_t dimensions);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::size_t dimensions_;
};

} // namespace semcache::embedding

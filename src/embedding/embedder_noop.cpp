#include "semcache/embedding/embedder_noop.hpp"

namespace semcache::embedding {

NoopEmbedder::NoopEmbedder(const std::size_t dimensions) : dimensions_(dimensions) {}

std::string_view NoopEmbedder::name() const { return "noop"; }

common::Result<std::vector<float>> NoopEmbedder::embed(std::string_view) {
  return common::Result<std::vector<float>>::success(std::vector<float>(dimensions_, 0.0F));
}

std::size_t NoopEmbedder::dimensions() const { return dimensions_; }

} // namespace semcache::embedding

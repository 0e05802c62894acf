#pragma once

#include "semcache/embedding/embedder.hpp"
#include "semcache/providers/traits.hpp"

namespace semcache::embedding {

// Uses Ollama's /api/embeddings endpoint, e.g. with the all-minilm model (384 dims).
class OllamaEmbedder final : public IEmbedder {
public:
  OllamaEmbedder(std::string base_url, std::string model, std::size_t dimensions,
                 std::shared_ptr<providers::HttpClient> http_client =
                     std::make_shared<providers::CurlHttpClient>(),
                 std::uint64_t timeout_ms = 30'000);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::string base_url_;
  std::string model_;
  std::size_t dimensions_;
  std::shared_ptr<providers::HttpClient> http_client_;
  std::uint64_t timeout_ms_;
};

} // namespace semcache::embedding

#include "semcache/embedding/embedder.hpp"

#include "semcache/common/fs.hpp"
#include "semcache/embedding/embedder_local.hpp"
#include "semcache/embedding/embedder_noop.hpp"
#include "semcache/embedding/embedder_ollama.hpp"
#include "semcache/embedding/embedder_openai.hpp"

#include <cmath>

namespace semcache::embedding {

common::Result<std::vector<std::vector<float>>>
IEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = embed(text);
    if (!emb.ok()) {
      return common::Result<std::vector<std::vector<float>>>::failure(emb.status());
    }
    out.push_back(std::move(emb.value()));
  }
  return common::Result<std::vector<std::vector<float>>>::success(std::move(out));
}

void l2_normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (const float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-12) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

common::Status check_dimensions(const std::vector<float> &values, const std::size_t expected) {
  if (values.size() != expected) {
    return common::Status::error(common::ErrorCode::EmbeddingFailure,
                                 "embedding has " + std::to_string(values.size()) +
                                     " dimensions, expected " + std::to_string(expected));
  }
  return common::Status::success();
}

common::Result<std::unique_ptr<IEmbedder>> create_embedder(const config::Config &config) {
  using EmbedderResult = common::Result<std::unique_ptr<IEmbedder>>;
  const auto &settings = config.embedding;
  const std::string provider = common::to_lower(common::trim(settings.provider));

  if (settings.dimensions == 0) {
    return EmbedderResult::failure(common::ErrorCode::ConfigError,
                                   "embedding.dimensions must be at least 1");
  }

  if (provider == "local") {
    return EmbedderResult::success(std::make_unique<LocalEmbedder>(settings.dimensions));
  }
  if (provider == "noop" || provider == "none") {
    return EmbedderResult::success(std::make_unique<NoopEmbedder>(settings.dimensions));
  }
  if (provider == "ollama") {
    return EmbedderResult::success(
        std::make_unique<OllamaEmbedder>(settings.base_url, settings.model, settings.dimensions));
  }
  if (provider == "openai") {
    const std::string key = config.api_key.value_or("");
    if (common::trim(key).empty()) {
      return EmbedderResult::failure(common::ErrorCode::ConfigError,
                                     "openai embedder requires an API key");
    }
    return EmbedderResult::success(
        std::make_unique<OpenAiEmbedder>(key, settings.model, settings.dimensions));
  }

  return EmbedderResult::failure(common::ErrorCode::ConfigError,
                                 "unknown embedding provider: " + settings.provider);
}

} // namespace semcache::embedding

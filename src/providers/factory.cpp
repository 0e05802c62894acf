#include "semcache/providers/factory.hpp"

#include "semcache/common/fs.hpp"
#include "semcache/providers/compatible.hpp"
#include "semcache/providers/ollama.hpp"
#include "semcache/providers/openai.hpp"
#include "semcache/providers/reliable.hpp"

namespace semcache::providers {

common::Result<std::shared_ptr<Provider>> create_provider(const config::Config &config,
                                                          std::shared_ptr<HttpClient> http_client) {
  using ProviderResult = common::Result<std::shared_ptr<Provider>>;
  const auto &generation = config.generation;
  const std::string name = common::to_lower(common::trim(generation.provider));
  const std::string api_key = config.api_key.value_or("");

  std::shared_ptr<Provider> provider;
  if (name == "ollama") {
    provider = std::make_shared<OllamaProvider>(generation.base_url, std::move(http_client),
                                                generation.timeout_ms);
  } else if (name == "openai") {
    if (common::trim(api_key).empty()) {
      return ProviderResult::failure(common::ErrorCode::ConfigError,
                                     "openai provider requires an API key");
    }
    provider = std::make_shared<OpenAiProvider>(api_key, std::move(http_client),
                                                generation.timeout_ms);
  } else if (name == "compatible") {
    if (common::trim(generation.base_url).empty()) {
      return ProviderResult::failure(common::ErrorCode::ConfigError,
                                     "compatible provider requires generation.base_url");
    }
    provider = std::make_shared<CompatibleProvider>("compatible", generation.base_url, api_key,
                                                    std::move(http_client), false,
                                                    generation.timeout_ms);
  } else {
    return ProviderResult::failure(common::ErrorCode::ConfigError,
                                   "unknown generation provider: " + generation.provider);
  }

  if (generation.retries == 0) {
    return ProviderResult::success(std::move(provider));
  }
  return ProviderResult::success(std::make_shared<ReliableProvider>(
      std::move(provider), generation.retries, generation.backoff_ms));
}

} // namespace semcache::providers

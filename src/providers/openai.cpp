#include "semcache/providers/openai.hpp"

namespace semcache::providers {

OpenAiProvider::OpenAiProvider(const std::string &api_key, std::shared_ptr<HttpClient> http_client,
                               const std::uint64_t timeout_ms)
    : CompatibleProvider("openai", "https://api.openai.com/v1", api_key, std::move(http_client),
                         true, timeout_ms) {}

} // namespace semcache::providers

#pragma once

#include "semcache/providers/compatible.hpp"

namespace semcache::providers {

class OpenAiProvider final : public CompatibleProvider {
public:
  explicit OpenAiProvider(const std::string &api_key,
                          std::shared_ptr<HttpClient> http_client =
                              std::make_shared<CurlHttpClient>(),
                          std::uint64_t timeout_ms = 60'000);
};

} // namespace semcache::providers

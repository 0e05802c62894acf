#pragma once

#include "semcache/common/result.hpp"
#include "semcache/config/schema.hpp"
#include "semcache/providers/traits.hpp"

#include <memory>

namespace semcache::providers {

// Builds the generation provider named by config.generation.provider, wrapped in a
// ReliableProvider when retries are configured.
[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_provider(const config::Config &config,
                std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

} // namespace semcache::providers

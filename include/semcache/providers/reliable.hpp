#pragma once

#include "semcache/providers/traits.hpp"

#include <memory>

namespace semcache::providers {

// Retries the wrapped provider with exponential backoff (backoff_ms, 2x, 4x, ...).
// The last failure is returned unchanged once every attempt has failed.
class ReliableProvider final : public Provider {
public:
  ReliableProvider(std::shared_ptr<Provider> inner, std::uint32_t max_retries,
                   std::uint64_t backoff_ms);

  [[nodiscard]] common::Result<std::string>
  generate(const std::string &prompt, const std::vector<ChatMessage> &history,
           const std::string &model, double temperature) override;

  [[nodiscard]] std::string name() const override;

private:
  std::shared_ptr<Provider> inner_;
  std::uint32_t max_retries_;
  std::uint64_t backoff_ms_;
};

} // namespace semcache::providers

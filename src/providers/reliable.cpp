#include "semcache/providers/reliable.hpp"

#include <chrono>
#include <thread>

namespace semcache::providers {

ReliableProvider::ReliableProvider(std::shared_ptr<Provider> inner,
                                   const std::uint32_t max_retries, const std::uint64_t backoff_ms)
    : inner_(std::move(inner)), max_retries_(max_retries), backoff_ms_(backoff_ms) {}

common::Result<std::string> ReliableProvider::generate(const std::string &prompt,
                                                       const std::vector<ChatMessage> &history,
                                                       const std::string &model,
                                                       const double temperature) {
  if (inner_ == nullptr) {
    return common::Result<std::string>::failure(common::ErrorCode::ServiceUnavailable,
                                                "no generation provider configured");
  }

  auto result = inner_->generate(prompt, history, model, temperature);
  for (std::uint32_t attempt = 0; !result.ok() && attempt < max_retries_; ++attempt) {
    if (backoff_ms_ > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms_ << attempt));
    }
    result = inner_->generate(prompt, history, model, temperature);
  }
  return result;
}

std::string ReliableProvider::name() const {
  return inner_ != nullptr ? inner_->name() : "reliable";
}

} // namespace semcache::providers

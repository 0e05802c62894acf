#pragma once

#include "semcache/providers/traits.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace semcache::providers {

// Any server that speaks the OpenAI chat-completions protocol.
class CompatibleProvider : public Provider {
public:
  CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                     std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>(),
                     bool require_api_key = true, std::uint64_t timeout_ms = 60'000,
                     std::unordered_map<std::string, std::string> extra_headers = {});

  [[nodiscard]] common::Result<std::string>
  generate(const std::string &prompt, const std::vector<ChatMessage> &history,
           const std::string &model, double temperature) override;

  [[nodiscard]] std::string name() const override;

  [[nodiscard]] static std::string build_body(const std::string &prompt,
                                              const std::vector<ChatMessage> &history,
                                              const std::string &model, double temperature);

private:
  std::string name_;
  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
  bool require_api_key_ = true;
  std::uint64_t timeout_ms_ = 60'000;
  std::unordered_map<std::string, std::string> extra_headers_;
};

} // namespace semcache::providers

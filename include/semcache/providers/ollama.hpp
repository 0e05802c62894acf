#pragma once

#include "semcache/providers/traits.hpp"

#include <memory>
#include <string>

namespace semcache::providers {

// Talks to Ollama's native /api/generate endpoint. The conversation is flattened
// into a single "role: content" transcript ending with "assistant:".
class OllamaProvider final : public Provider {
public:
  explicit OllamaProvider(std::string base_url = "http://localhost:11434",
                          std::shared_ptr<HttpClient> http_client =
                              std::make_shared<CurlHttpClient>(),
                          std::uint64_t timeout_ms = 60'000);

  [[nodiscard]] common::Result<std::string>
  generate(const std::string &prompt, const std::vector<ChatMessage> &history,
           const std::string &model, double temperature) override;

  [[nodiscard]] std::string name() const override;

  [[nodiscard]] static std::string build_transcript(const std::string &prompt,
                                                    const std::vector<ChatMessage> &history);
  [[nodiscard]] static std::string build_body(const std::string &prompt,
                                              const std::vector<ChatMessage> &history,
                                              const std::string &model, double temperature);

private:
  std::string base_url_;
  std::shared_ptr<HttpClient> http_client_;
  std::uint64_t timeout_ms_ = 60'000;
};

} // namespace semcache::providers

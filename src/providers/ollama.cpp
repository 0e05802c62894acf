#include "semcache/providers/ollama.hpp"

#include "semcache/common/json_util.hpp"

#include <sstream>

namespace semcache::providers {

OllamaProvider::OllamaProvider(std::string base_url, std::shared_ptr<HttpClient> http_client,
                               const std::uint64_t timeout_ms)
    : base_url_(std::move(base_url)), http_client_(std::move(http_client)),
      timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string OllamaProvider::build_transcript(const std::string &prompt,
                                             const std::vector<ChatMessage> &history) {
  std::string transcript;
  for (const auto &message : history) {
    transcript += message.role + ": " + message.content + "\n";
  }
  transcript += "user: " + prompt + "\nassistant:";
  return transcript;
}

std::string OllamaProvider::build_body(const std::string &prompt,
                                       const std::vector<ChatMessage> &history,
                                       const std::string &model, const double temperature) {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model) << "\",";
  body << "\"prompt\":\"" << common::json_escape(build_transcript(prompt, history)) << "\",";
  body << "\"stream\":false,";
  body << "\"options\":{\"temperature\":" << temperature << "}";
  body << "}";
  return body.str();
}

common::Result<std::string> OllamaProvider::generate(const std::string &prompt,
                                                     const std::vector<ChatMessage> &history,
                                                     const std::string &model,
                                                     const double temperature) {
  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
  };
  const auto response = http_client_->post_json(
      base_url_ + "/api/generate", headers, build_body(prompt, history, model, temperature),
      timeout_ms_);
  if (const auto error = classify_response(response); error.has_value()) {
    return provider_failure(*error);
  }

  auto parsed = parse_ollama_content(response.body);
  if (!parsed.ok()) {
    return provider_failure(
        {.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()});
  }
  return parsed;
}

std::string OllamaProvider::name() const { return "ollama"; }

} // namespace semcache::providers

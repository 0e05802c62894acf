#include "semcache/providers/compatible.hpp"

#include "semcache/common/json_util.hpp"

#include <sstream>

namespace semcache::providers {

CompatibleProvider::CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                                       std::shared_ptr<HttpClient> http_client,
                                       const bool require_api_key, const std::uint64_t timeout_ms,
                                       std::unordered_map<std::string, std::string> extra_headers)
    : name_(std::move(name)), base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)), require_api_key_(require_api_key),
      timeout_ms_(timeout_ms), extra_headers_(std::move(extra_headers)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string CompatibleProvider::build_body(const std::string &prompt,
                                           const std::vector<ChatMessage> &history,
                                           const std::string &model, const double temperature) {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model) << "\",";
  body << "\"messages\":[";
  for (const auto &message : history) {
    body << "{\"role\":\"" << common::json_escape(message.role) << "\",\"content\":\""
         << common::json_escape(message.content) << "\"},";
  }
  body << "{\"role\":\"user\",\"content\":\"" << common::json_escape(prompt) << "\"}";
  body << "],";
  body << "\"temperature\":" << temperature << ",";
  body << "\"stream\":false";
  body << "}";
  return body.str();
}

common::Result<std::string> CompatibleProvider::generate(const std::string &prompt,
                                                         const std::vector<ChatMessage> &history,
                                                         const std::string &model,
                                                         const double temperature) {
  if (require_api_key_ && api_key_.empty()) {
    return provider_failure({.code = ProviderErrorCode::AuthError, .message = "missing API key"});
  }

  std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
  };
  if (!api_key_.empty()) {
    headers["Authorization"] = "Bearer " + api_key_;
  }
  for (const auto &[key, value] : extra_headers_) {
    headers[key] = value;
  }

  const auto response = http_client_->post_json(base_url_ + "/chat/completions", headers,
                                                build_body(prompt, history, model, temperature),
                                                timeout_ms_);
  if (const auto error = classify_response(response); error.has_value()) {
    return provider_failure(*error);
  }

  auto parsed = parse_openai_content(response.body);
  if (!parsed.ok()) {
    return provider_failure(
        {.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()});
  }
  return parsed;
}

std::string CompatibleProvider::name() const { return name_; }

} // namespace semcache::providers

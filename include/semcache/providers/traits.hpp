#pragma once

#include "semcache/common/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace semcache::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
  // Timeouts and transport failures are ServiceUnavailable, everything else ServiceError.
  [[nodiscard]] common::ErrorCode error_code() const;
};

struct ChatMessage {
  std::string role;
  std::string content;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
};

class Provider {
public:
  virtual ~Provider() = default;

  // `history` holds the earlier turns of the conversation, oldest first.
  [[nodiscard]] virtual common::Result<std::string>
  generate(const std::string &prompt, const std::vector<ChatMessage> &history,
           const std::string &model, double temperature) = 0;

  [[nodiscard]] virtual std::string name() const = 0;
};

[[nodiscard]] common::Result<std::string> provider_failure(const ProviderError &error);

// Maps transport failures and non-2xx statuses to a ProviderError; nullopt on success.
[[nodiscard]] std::optional<ProviderError> classify_response(const HttpResponse &response);

[[nodiscard]] common::Result<std::string> parse_openai_content(const std::string &response);
[[nodiscard]] common::Result<std::string> parse_ollama_content(const std::string &response);

} // namespace semcache::providers

#include "semcache/providers/traits.hpp"

#include "semcache/common/fs.hpp"
#include "semcache/common/json_util.hpp"

#include <curl/curl.h>

#include <sstream>

namespace semcache::providers {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

} // namespace

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  stream << "Provider error [";
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network";
    break;
  case ProviderErrorCode::AuthError:
    stream << "auth";
    break;
  case ProviderErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model_not_found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "timeout";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

common::ErrorCode ProviderError::error_code() const {
  if (code == ProviderErrorCode::Timeout || code == ProviderErrorCode::NetworkError) {
    return common::ErrorCode::ServiceUnavailable;
  }
  return common::ErrorCode::ServiceError;
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(
    const std::string &url, const std::unordered_map<std::string, std::string> &headers,
    const std::string &body, const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "semcache");
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

common::Result<std::string> provider_failure(const ProviderError &error) {
  return common::Result<std::string>::failure(error.error_code(), error.to_string());
}

std::optional<ProviderError> classify_response(const HttpResponse &response) {
  if (response.timeout) {
    return ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"};
  }
  if (response.network_error) {
    return ProviderError{.code = ProviderErrorCode::NetworkError,
                         .message = response.network_error_message};
  }
  if (response.status == 401 || response.status == 403) {
    return ProviderError{
        .code = ProviderErrorCode::AuthError, .status = response.status, .message = response.body};
  }
  if (response.status == 404) {
    return ProviderError{.code = ProviderErrorCode::ModelNotFound,
                         .status = response.status,
                         .message = response.body};
  }
  if (response.status == 429) {
    ProviderError error{.code = ProviderErrorCode::RateLimitError,
                        .status = response.status,
                        .message = response.body};
    if (const auto it = response.headers.find("retry-after"); it != response.headers.end()) {
      try {
        error.retry_after = static_cast<std::uint64_t>(std::stoull(it->second));
      } catch (const std::exception &) {
        error.retry_after = std::nullopt;
      }
    }
    return error;
  }
  if (response.status < 200 || response.status >= 300) {
    return ProviderError{
        .code = ProviderErrorCode::ApiError, .status = response.status, .message = response.body};
  }
  return std::nullopt;
}

common::Result<std::string> parse_openai_content(const std::string &response) {
  const std::string choices = common::json_get_array(response, "choices");
  if (choices.empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::ServiceError,
                                                "choices field missing");
  }
  const auto content = common::json_get_string(choices, "content");
  if (!content.has_value() || common::trim(*content).empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::ServiceError,
                                                "choices[0].message.content missing");
  }
  return common::Result<std::string>::success(*content);
}

common::Result<std::string> parse_ollama_content(const std::string &response) {
  const auto content = common::json_get_string(response, "response");
  if (!content.has_value()) {
    return common::Result<std::string>::failure(common::ErrorCode::ServiceError,
                                                "response field missing");
  }
  if (common::trim(*content).empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::ServiceError,
                                                "response field empty");
  }
  return common::Result<std::string>::success(*content);
}

} // namespace semcache::providers

#include "semcache/embedding/embedder_ollama.hpp"

#include "semcache/common/json_util.hpp"

#include <sstream>

namespace semcache::embedding {

namespace {

common::Result<std::vector<float>> embedding_failure(const std::string &message) {
  return common::Result<std::vector<float>>::failure(common::ErrorCode::EmbeddingFailure,
                                                     "ollama embedder: " + message);
}

} // namespace

OllamaEmbedder::OllamaEmbedder(std::string base_url, std::string model,
                               const std::size_t dimensions,
                               std::shared_ptr<providers::HttpClient> http_client,
                               const std::uint64_t timeout_ms)
    : base_url_(std::move(base_url)), model_(std::move(model)), dimensions_(dimensions),
      http_client_(std::move(http_client)), timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string_view OllamaEmbedder::name() const { return "ollama"; }

common::Result<std::vector<float>> OllamaEmbedder::embed(const std::string_view text) {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model_) << "\",";
  body << "\"prompt\":\"" << common::json_escape(std::string(text)) << "\"";
  body << "}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
  };

  const auto response =
      http_client_->post_json(base_url_ + "/api/embeddings", headers, body.str(), timeout_ms_);
  if (const auto error = providers::classify_response(response); error.has_value()) {
    return embedding_failure(error->to_string());
  }

  const std::string array = common::json_get_array(response.body, "embedding");
  if (array.empty()) {
    return embedding_failure("embedding field missing");
  }
  auto parsed = common::json_parse_float_array(array);
  if (!parsed.ok()) {
    return embedding_failure(parsed.error());
  }
  if (const auto status = check_dimensions(parsed.value(), dimensions_); !status.ok()) {
    return common::Result<std::vector<float>>::failure(status);
  }

  l2_normalize(parsed.value());
  return parsed;
}

std::size_t OllamaEmbedder::dimensions() const { return dimensions_; }

} // namespace semcache::embedding

#include "semcache/embedding/embedder_openai.hpp"

#include "semcache/common/json_util.hpp"

#include <sstream>

namespace semcache::embedding {

namespace {

common::Result<std::vector<float>> embedding_failure(const std::string &message) {
  return common::Result<std::vector<float>>::failure(common::ErrorCode::EmbeddingFailure,
                                                     "openai embedder: " + message);
}

} // namespace

OpenAiEmbedder::OpenAiEmbedder(std::string api_key, std::string model, const std::size_t dimensions,
                               std::shared_ptr<providers::HttpClient> http_client)
    : api_key_(std::move(api_key)), model_(std::move(model)), dimensions_(dimensions),
      http_client_(std::move(http_client)) {}

std::string_view OpenAiEmbedder::name() const { return "openai"; }

common::Result<std::vector<float>> OpenAiEmbedder::embed(const std::string_view text) {
  if (api_key_.empty()) {
    return embedding_failure("missing API key");
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model_) << "\",";
  body << "\"input\":\"" << common::json_escape(std::string(text)) << "\",";
  body << "\"dimensions\":" << dimensions_;
  body << "}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };

  const auto response =
      http_client_->post_json("https://api.openai.com/v1/embeddings", headers, body.str(), 30'000);
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

std::size_t OpenAiEmbedder::dimensions() const { return dimensions_; }

} // namespace semcache::embedding

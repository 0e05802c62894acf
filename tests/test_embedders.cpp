#include "semcache/cache/vector_index.hpp"
#include "semcache/embedding/embedder_local.hpp"
#include "semcache/embedding/embedder_noop.hpp"
#include "semcache/embedding/embedder_ollama.hpp"
#include "semcache/embedding/embedder_openai.hpp"
#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cmath>

namespace {

using semcache::tests::require;
using semcache::tests::require_ok;
namespace common = semcache::common;
namespace embedding = semcache::embedding;
namespace testing = semcache::testing;

double norm_of(const std::vector<float> &values) {
  double sum = 0.0;
  for (const float v : values) {
    sum += static_cast<double>(v) * static_cast<double>(v);
  }
  return std::sqrt(sum);
}

} // namespace

void register_embedding_tests(std::vector<semcache::tests::TestCase> &tests) {
  tests.push_back({"local_embedder_is_deterministic_and_normalized", [] {
                     embedding::LocalEmbedder embedder(128);
                     auto first = embedder.embed("What is the capital of France?");
                     auto second = embedder.embed("What is the capital of France?");
                     require(first.ok() && second.ok(), "embedding should succeed");
                     require(first.value() == second.value(), "same text, same vector");
                     require(first.value().size() == 128, "dimension should match");
                     require(std::fabs(norm_of(first.value()) - 1.0) < 1e-5, "unit length");
                   }});

  tests.push_back({"local_embedder_ranks_paraphrases_above_unrelated_text", [] {
                     embedding::LocalEmbedder embedder(384);
                     const auto base = embedder.embed("What is the capital of France?").value();
                     const auto close = embedder.embed("what is the capital of france").value();
                     const auto far = embedder.embed("Recipe for banana bread").value();
                     const float near_score = semcache::cache::inner_product(base, close);
                     const float far_score = semcache::cache::inner_product(base, far);
                     require(near_score > 0.99F, "case and punctuation should not matter");
                     require(near_score > far_score, "paraphrase should beat unrelated text");
                   }});

  tests.push_back({"local_embedder_handles_empty_text", [] {
                     embedding::LocalEmbedder embedder(16);
                     auto empty = embedder.embed("");
                     require_ok(empty, "empty");
                     require(empty.value() == std::vector<float>(16, 0.0F),
                             "empty text embeds to the zero vector");
                   }});

  tests.push_back({"noop_embedder_returns_zero_vectors", [] {
                     embedding::NoopEmbedder embedder(8);
                     auto values = embedder.embed("anything");
                     require(values.ok() && values.value() == std::vector<float>(8, 0.0F),
                             "noop should return zeros");
                     require(embedder.name() == "noop", "name");
                   }});

  tests.push_back({"embed_batch_stops_at_first_failure", [] {
                     testing::FixedEmbedder embedder(2);
                     embedder.set("a", {1.0F, 0.0F});
                     auto batch = embedder.embed_batch({"a", "a"});
                     require(batch.ok() && batch.value().size() == 2, "batch should succeed");
                     auto failed = embedder.embed_batch({"a", "missing", "a"});
                     require(!failed.ok(), "unknown text should fail the batch");
                     require(embedder.calls == 4, "batch should stop after the failure");
                   }});

  tests.push_back({"l2_normalize_and_dimension_check", [] {
                     std::vector<float> values = {3.0F, 4.0F};
                     embedding::l2_normalize(values);
                     require(std::fabs(values[0] - 0.6F) < 1e-6F && std::fabs(values[1] - 0.8F) < 1e-6F,
                             "3-4-5 triangle");
                     std::vector<float> zeros = {0.0F, 0.0F};
                     embedding::l2_normalize(zeros);
                     require(zeros == std::vector<float>({0.0F, 0.0F}), "zeros stay zero");

                     const auto status = embedding::check_dimensions(values, 3);
                     require(!status.ok(), "wrong dimension should fail");
                     require(status.code() == common::ErrorCode::EmbeddingFailure,
                             "expected EmbeddingFailure");
                   }});

  tests.push_back({"ollama_embedder_posts_prompt_and_normalizes", [] {
                     auto http = std::make_shared<testing::MockHttpClient>();
                     http->next_post.status = 200;
                     http->next_post.body = R"({"embedding":[3.0, 0.0, 4.0]})";
                     embedding::OllamaEmbedder embedder("http://localhost:11434/", "all-minilm", 3,
                                                        http);
                     auto values = embedder.embed("hi \"there\"");
                     require_ok(values, "values");
                     require(http->last_url == "http://localhost:11434/api/embeddings",
                             "trailing slash should be trimmed");
                     require(http->last_body.find("\"model\":\"all-minilm\"") != std::string::npos,
                             "model should be sent");
                     require(http->last_body.find("hi \\\"there\\\"") != std::string::npos,
                             "prompt should be escaped");
                     require(std::fabs(values.value()[0] - 0.6F) < 1e-6F, "vector normalized");
                   }});

  tests.push_back({"ollama_embedder_failures_are_embedding_failures", [] {
                     auto http = std::make_shared<testing::MockHttpClient>();
                     embedding::OllamaEmbedder embedder("http://localhost:11434", "m", 3, http);

                     http->next_post.network_error = true;
                     http->next_post.network_error_message = "connection refused";
                     auto offline = embedder.embed("x");
                     require(!offline.ok() && offline.code() == common::ErrorCode::EmbeddingFailure,
                             "transport failure should be EmbeddingFailure");

                     http->next_post = {};
                     http->next_post.status = 200;
                     http->next_post.body = R"({"embedding":[1.0, 0.0]})";
                     auto wrong = embedder.embed("x");
                     require(!wrong.ok() && wrong.code() == common::ErrorCode::EmbeddingFailure,
                             "wrong dimension should be EmbeddingFailure");

                     http->next_post.body = R"({"error":"model not found"})";
                     auto missing = embedder.embed("x");
                     require(!missing.ok() && missing.code() == common::ErrorCode::EmbeddingFailure,
                             "missing field should be EmbeddingFailure");
                   }});

  tests.push_back({"openai_embedder_sends_key_and_dimensions", [] {
                     auto http = std::make_shared<testing::MockHttpClient>();
                     http->next_post.status = 200;
                     http->next_post.body =
                         R"({"object":"list","data":[{"object":"embedding","embedding":[0.0, 2.0]}]})";
                     embedding::OpenAiEmbedder embedder("sk-test", "text-embedding-3-small", 2,
                                                        http);
                     auto values = embedder.embed("hello");
                     require_ok(values, "values");
                     require(values.value() == std::vector<float>({0.0F, 1.0F}), "normalized");
                     require(http->last_url == "https://api.openai.com/v1/embeddings", "url");
                     require(http->last_headers.at("Authorization") == "Bearer sk-test", "auth");
                     require(http->last_body.find("\"dimensions\":2") != std::string::npos,
                             "dimensions should be requested");

                     http->next_post.status = 401;
                     http->next_post.body = R"({"error":{"message":"bad key"}})";
                     auto denied = embedder.embed("hello");
                     require(!denied.ok() && denied.code() == common::ErrorCode::EmbeddingFailure,
                             "auth error should be EmbeddingFailure");
                   }});

  tests.push_back({"create_embedder_follows_config", [] {
                     semcache::config::Config config;
                     config.embedding.dimensions = 32;
                     auto local = embedding::create_embedder(config);
                     require(local.ok() && local.value()->name() == "local", "local default");
                     require(local.value()->dimensions() == 32, "dimensions from config");

                     config.embedding.provider = "ollama";
                     auto ollama = embedding::create_embedder(config);
                     require(ollama.ok() && ollama.value()->name() == "ollama", "ollama");

                     config.embedding.provider = "openai";
                     auto no_key = embedding::create_embedder(config);
                     require(!no_key.ok() && no_key.code() == common::ErrorCode::ConfigError,
                             "openai without a key should fail");
                     config.api_key = "sk";
                     require(embedding::create_embedder(config).ok(), "openai with a key");

                     config.embedding.provider = "unknown";
                     require(!embedding::create_embedder(config).ok(), "unknown provider fails");
                   }});
}

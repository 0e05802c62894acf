#include "semcache/embedding/embedder_local.hpp"

#include <cctype>
#include <cstdint>

namespace semcache::embedding {

namespace {

constexpr float kWordWeight = 1.0F;
constexpr float kTrigramWeight = 0.5F;

std::uint64_t fnv1a(const std::string_view text) {
  std::uint64_t hash = 14695981039346656037ULL;
  for (const char ch : text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::vector<std::string> tokenize(const std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (const char ch : text) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) != 0 || uch >= 0x80) {
      current.push_back(static_cast<char>(std::tolower(uch)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

} // namespace

LocalEmbedder::LocalEmbedder(const std::size_t dimensions) : dimensions_(dimensions) {}

std::string_view LocalEmbedder::name() const { return "local"; }

common::Result<std::vector<float>> LocalEmbedder::embed(const std::string_view text) {
  if (dimensions_ == 0) {
    return common::Result<std::vector<float>>::failure(common::ErrorCode::EmbeddingFailure,
                                                       "embedder has zero dimensions");
  }
  std::vector<float> values(dimensions_, 0.0F);

  const auto accumulate = [&](const std::string_view feature, const float weight) {
    const std::uint64_t hash = fnv1a(feature);
    const std::size_t idx = static_cast<std::size_t>(hash % dimensions_);
    values[idx] += (hash >> 63) != 0 ? -weight : weight;
  };

  for (const auto &token : tokenize(text)) {
    accumulate(token, kWordWeight);
    const std::string padded = " " + token + " ";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      accumulate(std::string_view(padded).substr(i, 3), kTrigramWeight);
    }
  }

  l2_normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

std::size_t LocalEmbedder::dimensions() const { return dimensions_; }

} // namespace semcache::embedding

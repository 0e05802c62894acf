#pragma once

#include "semcache/common/result.hpp"
#include "semcache/config/schema.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace semcache::embedding {

class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts);
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

// Scales `values` to unit length in place; all-zero vectors are left untouched.
void l2_normalize(std::vector<float> &values);

// EmbeddingFailure unless `values` has exactly `expected` entries.
[[nodiscard]] common::Status check_dimensions(const std::vector<float> &values,
                                              std::size_t expected);

[[nodiscard]] common::Result<std::unique_ptr<IEmbedder>>
create_embedder(const config::Config &config);

} // namespace semcache::embedding

#pragma once

#include "semcache/cache/query_store.hpp"
#include "semcache/config/schema.hpp"
#include "semcache/embedding/embedder.hpp"
#include "semcache/providers/traits.hpp"

#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace semcache::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

// Sets (or unsets, for nullopt) an environment variable for the guard's lifetime.
struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

// Points config lookups at `next` (or clears the override) and restores on exit.
struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt);
  ~ConfigOverrideGuard();
};

// Defaults with the database inside `workspace` and logging switched off.
config::Config temp_config(const TempWorkspace &workspace);

// Unit vector along `axis`.
std::vector<float> axis_vector(std::size_t dimensions, std::size_t axis);

// Unit vector whose inner product with axis_vector(dimensions, 0) is exactly `similarity`.
std::vector<float> vector_with_similarity(std::size_t dimensions, float similarity,
                                          std::size_t other_axis = 1);

// Embedder returning vectors registered per text; unknown text is an error.
class FixedEmbedder final : public embedding::IEmbedder {
public:
  explicit FixedEmbedder(std::size_t dimensions) : dimensions_(dimensions) {}

  void set(const std::string &text, std::vector<float> vector);
  void fail_with(std::string message) { failure_ = std::move(message); }
  void clear_failure() { failure_.reset(); }

  [[nodiscard]] std::string_view name() const override { return "fixed"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

  std::size_t calls = 0;

private:
  std::size_t dimensions_;
  std::unordered_map<std::string, std::vector<float>> vectors_;
  std::optional<std::string> failure_;
};

class MockProvider final : public providers::Provider {
public:
  void set_response(std::string response);
  void set_error(common::ErrorCode code, std::string error_message);

  [[nodiscard]] common::Result<std::string>
  generate(const std::string &prompt, const std::vector<providers::ChatMessage> &history,
           const std::string &model, double temperature) override;
  [[nodiscard]] std::string name() const override { return "mock"; }

  // When non-zero, set_error applies only to the first `failing_calls` calls.
  std::size_t failing_calls = 0;
  std::size_t calls = 0;
  std::string last_prompt;
  std::vector<providers::ChatMessage> last_history;
  std::string last_model;
  double last_temperature = 0.0;

private:
  std::optional<std::string> response_;
  std::optional<common::Status> error_;
};

class MockHttpClient final : public providers::HttpClient {
public:
  // Returned in order; once drained, `next_post` is returned.
  std::deque<providers::HttpResponse> queued;
  providers::HttpResponse next_post;
  std::string last_url;
  std::unordered_map<std::string, std::string> last_headers;
  std::string last_body;
  std::uint64_t last_timeout_ms = 0;
  std::size_t post_count = 0;

  [[nodiscard]] providers::HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
};

// Forwards to a real store while counting calls; failures can be forced per operation.
class CountingStore final : public cache::IQueryStore {
public:
  explicit CountingStore(std::shared_ptr<cache::IQueryStore> inner) : inner_(std::move(inner)) {}

  [[nodiscard]] std::string_view name() const override { return "counting"; }
  [[nodiscard]] common::Result<bool> upsert(const std::string &query,
                                            const std::vector<float> &embedding,
                                            const std::string &response) override;
  [[nodiscard]] common::Result<std::vector<cache::QueryRecord>> all_records() override;
  [[nodiscard]] common::Result<std::optional<cache::QueryRecord>>
  find(const std::string &query) override;
  [[nodiscard]] common::Result<std::size_t> count() override;
  [[nodiscard]] bool health_check() override;

  std::size_t upsert_calls = 0;
  std::size_t scan_calls = 0;
  bool fail_upsert = false;
  bool fail_scan = false;

private:
  std::shared_ptr<cache::IQueryStore> inner_;
};

} // namespace semcache::testing

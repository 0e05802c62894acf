#pragma once

#include "semcache/cache/semantic_cache.hpp"
#include "semcache/chat/chat_service.hpp"
#include "semcache/chat/chat_store.hpp"
#include "semcache/common/result.hpp"
#include "semcache/config/schema.hpp"
#include "semcache/providers/traits.hpp"

#include <memory>
#include <string>
#include <vector>

namespace semcache::runtime {

// Wires configuration into the store, embedder, cache and generation provider.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  // Loads and validates the configuration; validation warnings are kept in warnings().
  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();
  [[nodiscard]] const std::vector<std::string> &warnings() const { return warnings_; }

  [[nodiscard]] common::Result<std::shared_ptr<cache::SemanticCache>> create_cache();

  // Uses `provider` when given, otherwise builds one from the [generation] section.
  [[nodiscard]] common::Result<std::shared_ptr<chat::ChatService>>
  create_chat_service(std::shared_ptr<providers::Provider> provider = nullptr);

  // Saved conversations live in the same database file as the query cache.
  [[nodiscard]] common::Result<std::shared_ptr<chat::SqliteChatStore>> create_chat_store();

private:
  config::Config config_;
  std::vector<std::string> warnings_;
};

} // namespace semcache::runtime

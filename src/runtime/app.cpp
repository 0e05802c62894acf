#include "semcache/runtime/app.hpp"

#include "semcache/cache/sqlite_store.hpp"
#include "semcache/config/config.hpp"
#include "semcache/embedding/embedder.hpp"
#include "semcache/observability/factory.hpp"
#include "semcache/observability/global.hpp"
#include "semcache/providers/factory.hpp"

namespace semcache::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.status());
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<RuntimeContext>::failure(validated.status());
  }

  RuntimeContext context(std::move(loaded.value()));
  context.warnings_ = std::move(validated.value());
  return common::Result<RuntimeContext>::success(std::move(context));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

common::Result<std::shared_ptr<cache::SemanticCache>> RuntimeContext::create_cache() {
  using CacheResult = common::Result<std::shared_ptr<cache::SemanticCache>>;
  observability::set_global_observer(observability::create_observer(config_));

  auto embedder = embedding::create_embedder(config_);
  if (!embedder.ok()) {
    return CacheResult::failure(embedder.status());
  }

  auto store = cache::SqliteQueryStore::open(config::resolved_db_path(config_));
  if (!store.ok()) {
    return CacheResult::failure(store.status());
  }

  auto created = cache::SemanticCache::create(
      std::shared_ptr<cache::IQueryStore>(std::move(store.value())),
      std::shared_ptr<embedding::IEmbedder>(std::move(embedder.value())),
      cache::options_from_config(config_.cache));
  if (!created.ok()) {
    return CacheResult::failure(created.status());
  }
  return CacheResult::success(std::shared_ptr<cache::SemanticCache>(std::move(created.value())));
}

common::Result<std::shared_ptr<chat::ChatService>>
RuntimeContext::create_chat_service(std::shared_ptr<providers::Provider> provider) {
  using ServiceResult = common::Result<std::shared_ptr<chat::ChatService>>;

  if (provider == nullptr) {
    auto created = providers::create_provider(config_);
    if (!created.ok()) {
      return ServiceResult::failure(created.status());
    }
    provider = created.value();
  }

  auto cache = create_cache();
  if (!cache.ok()) {
    return ServiceResult::failure(cache.status());
  }

  return ServiceResult::success(std::make_shared<chat::ChatService>(
      cache.value(), std::move(provider),
      chat::ChatOptions{.model = config_.generation.model,
                        .temperature = config_.generation.temperature}));
}

common::Result<std::shared_ptr<chat::SqliteChatStore>> RuntimeContext::create_chat_store() {
  using StoreResult = common::Result<std::shared_ptr<chat::SqliteChatStore>>;
  auto store = chat::SqliteChatStore::open(config::resolved_db_path(config_));
  if (!store.ok()) {
    return StoreResult::failure(store.status());
  }
  return StoreResult::success(std::shared_ptr<chat::SqliteChatStore>(std::move(store.value())));
}

} // namespace semcache::runtime

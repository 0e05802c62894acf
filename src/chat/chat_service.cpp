#include "semcache/chat/chat_service.hpp"

#include "semcache/common/fs.hpp"
#include "semcache/observability/global.hpp"

#include <chrono>

namespace semcache::chat {

namespace {

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

ChatService::ChatService(std::shared_ptr<cache::SemanticCache> cache,
                         std::shared_ptr<providers::Provider> provider, ChatOptions options)
    : cache_(std::move(cache)), provider_(std::move(provider)), options_(std::move(options)) {}

common::Result<ChatReply> ChatService::ask(const std::string &prompt,
                                           const std::vector<providers::ChatMessage> &history) {
  const auto start = std::chrono::steady_clock::now();
  if (common::trim(prompt).empty()) {
    return common::Result<ChatReply>::failure(common::ErrorCode::InvalidArgument,
                                              "prompt is empty");
  }

  auto lookup = cache_->lookup(prompt);
  if (!lookup.ok()) {
    return common::Result<ChatReply>::failure(lookup.status());
  }

  if (lookup.value().hit()) {
    observability::record_metric(
        observability::RequestLatencyMetric{.latency = elapsed_since(start)});
    return common::Result<ChatReply>::success(ChatReply{.content = *lookup.value().response,
                                                        .from_cache = true,
                                                        .path = lookup.value().path});
  }

  const auto generation_start = std::chrono::steady_clock::now();
  auto generated = provider_->generate(prompt, history, options_.model, options_.temperature);
  observability::record_generation(provider_->name(), options_.model,
                                   elapsed_since(generation_start), generated.ok());
  if (!generated.ok()) {
    observability::record_error("chat.generate", generated.error());
    return common::Result<ChatReply>::failure(generated.status());
  }

  auto recorded = cache_->record(prompt, lookup.value().embedding, generated.value());
  if (!recorded.ok()) {
    return common::Result<ChatReply>::failure(recorded.status());
  }

  observability::record_metric(
      observability::RequestLatencyMetric{.latency = elapsed_since(start)});
  return common::Result<ChatReply>::success(ChatReply{
      .content = std::move(generated.value()), .from_cache = false, .path = cache::LookupPath::Miss});
}

} // namespace semcache::chat

#pragma once

#include "semcache/cache/semantic_cache.hpp"
#include "semcache/providers/traits.hpp"

#include <memory>
#include <string>
#include <vector>

namespace semcache::chat {

struct ChatOptions {
  std::string model = "llama3.2";
  double temperature = 0.9;
};

struct ChatReply {
  std::string content;
  bool from_cache = false;
  cache::LookupPath path = cache::LookupPath::Miss;
};

// One request end to end: cache lookup, generation on a miss, then write-back.
class ChatService {
public:
  ChatService(std::shared_ptr<cache::SemanticCache> cache,
              std::shared_ptr<providers::Provider> provider, ChatOptions options = {});

  [[nodiscard]] common::Result<ChatReply> ask(const std::string &prompt,
                                              const std::vector<providers::ChatMessage> &history);

  [[nodiscard]] cache::SemanticCache &cache() { return *cache_; }
  [[nodiscard]] const ChatOptions &options() const { return options_; }

private:
  std::shared_ptr<cache::SemanticCache> cache_;
  std::shared_ptr<providers::Provider> provider_;
  ChatOptions options_;
};

} // namespace semcache::chat

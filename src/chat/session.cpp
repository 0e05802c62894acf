#include "semcache/chat/session.hpp"

#include "semcache/common/fs.hpp"
#include "semcache/observability/global.hpp"

namespace semcache::chat {

ChatSession::ChatSession(ChatService &service) : service_(service) {}

ChatSession::ChatSession(ChatService &service, std::shared_ptr<SqliteChatStore> store,
                         std::string chat_id, std::vector<providers::ChatMessage> history)
    : service_(service), store_(std::move(store)), chat_id_(std::move(chat_id)),
      history_(std::move(history)) {}

common::Result<ChatSession> ChatSession::open(ChatService &service,
                                              std::shared_ptr<SqliteChatStore> store,
                                              const std::string &chat_id) {
  if (store == nullptr) {
    return common::Result<ChatSession>::failure(common::ErrorCode::InvalidArgument,
                                                 "saved chat sessions need a chat store");
  }
  if (common::trim(chat_id).empty()) {
    return common::Result<ChatSession>::success(
        ChatSession(service, std::move(store), new_chat_id(), {}));
  }

  auto messages = store->load_messages(chat_id);
  if (!messages.ok()) {
    return common::Result<ChatSession>::failure(messages.status());
  }
  return common::Result<ChatSession>::success(
      ChatSession(service, std::move(store), chat_id, std::move(messages.value())));
}

common::Result<ChatReply> ChatSession::send(const std::string &prompt) {
  auto reply = service_.ask(prompt, history_);
  if (!reply.ok()) {
    return reply;
  }

  if (store_ != nullptr) {
    const auto saved = store_->append_exchange(chat_id_, prompt, reply.value().content);
    if (!saved.ok()) {
      observability::record_error("chat.session", saved.error());
      return common::Result<ChatReply>::failure(saved);
    }
  }

  history_.push_back({.role = "user", .content = prompt});
  history_.push_back({.role = "assistant", .content = reply.value().content});
  return reply;
}

void ChatSession::clear() {
  history_.clear();
  if (store_ != nullptr) {
    chat_id_ = new_chat_id();
  }
}

} // namespace semcache::chat

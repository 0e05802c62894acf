#pragma once

#include "semcache/chat/chat_service.hpp"
#include "semcache/chat/chat_store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace semcache::chat {

// One conversation. Every successful exchange appends the user turn and the
// assistant turn; failed requests leave the history untouched. With a store the
// exchange is saved before it enters the history, so a save failure is
// reported and the turn is dropped.
class ChatSession {
public:
  // History kept in memory only.
  explicit ChatSession(ChatService &service);

  // Resumes saved chat `chat_id`, loading its messages as history. A blank id
  // starts a new chat that is written on its first exchange. An unknown id is
  // InvalidArgument.
  [[nodiscard]] static common::Result<ChatSession> open(ChatService &service,
                                                        std::shared_ptr<SqliteChatStore> store,
                                                        const std::string &chat_id = "");

  [[nodiscard]] common::Result<ChatReply> send(const std::string &prompt);

  // Forgets the history. A saved session moves on to a fresh chat id; the old
  // chat stays in the store.
  void clear();

  [[nodiscard]] const std::vector<providers::ChatMessage> &history() const { return history_; }
  // Empty for an in-memory session.
  [[nodiscard]] const std::string &chat_id() const { return chat_id_; }

private:
  ChatSession(ChatService &service, std::shared_ptr<SqliteChatStore> store, std::string chat_id,
              std::vector<providers::ChatMessage> history);

  ChatService &service_;
  std::shared_ptr<SqliteChatStore> store_;
  std::string chat_id_;
  std::vector<providers::ChatMessage> history_;
};

} // namespace semcache::chat

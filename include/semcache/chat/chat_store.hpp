#pragma once

#include "semcache/common/result.hpp"
#include "semcache/providers/traits.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace semcache::chat {

inline constexpr const char *kDefaultChatTitle = "New Chat";
inline constexpr std::size_t kChatTitleLength = 30;

struct ChatThread {
  std::string id;
  std::string title;
  std::string created_at;
  std::string updated_at;
  std::size_t message_count = 0;
};

// First line of `prompt`, trimmed and cut to kChatTitleLength bytes without
// splitting a UTF-8 sequence. A blank prompt gives kDefaultChatTitle.
[[nodiscard]] std::string title_from_prompt(const std::string &prompt);

// Sortable, collision-resistant id: UTC timestamp plus a random suffix.
[[nodiscard]] std::string new_chat_id();

// Saved conversations: a `chats` row per thread and its `messages` in order.
// Deleting a thread deletes its messages.
class SqliteChatStore {
  struct OpenKey {
    explicit OpenKey() = default;
  };

public:
  [[nodiscard]] static common::Result<std::unique_ptr<SqliteChatStore>>
  open(const std::filesystem::path &db_path);

  SqliteChatStore(OpenKey, sqlite3 *db);
  ~SqliteChatStore();
  SqliteChatStore(const SqliteChatStore &) = delete;
  SqliteChatStore &operator=(const SqliteChatStore &) = delete;

  // InvalidArgument for a blank id, an id already in use or a blank title.
  [[nodiscard]] common::Status create_chat(const std::string &id,
                                           const std::string &title = kDefaultChatTitle);
  [[nodiscard]] common::Result<std::optional<ChatThread>> find_chat(const std::string &id);
  // Newest first.
  [[nodiscard]] common::Result<std::vector<ChatThread>> list_chats();
  // Oldest first; an unknown id is InvalidArgument.
  [[nodiscard]] common::Result<std::vector<providers::ChatMessage>>
  load_messages(const std::string &id);

  // Saves one user/assistant exchange atomically, creating the thread when it
  // does not exist. A thread still titled kDefaultChatTitle with no messages
  // takes its title from `prompt`.
  [[nodiscard]] common::Status append_exchange(const std::string &id, const std::string &prompt,
                                               const std::string &reply);

  [[nodiscard]] common::Status rename_chat(const std::string &id, const std::string &title);
  // False when no such thread existed.
  [[nodiscard]] common::Result<bool> delete_chat(const std::string &id);
  // Number of threads removed.
  [[nodiscard]] common::Result<std::size_t> delete_all_chats();

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::optional<ChatThread>> find_chat_locked(const std::string &id);
  [[nodiscard]] common::Status insert_message(const std::string &id, const std::string &role,
                                              const std::string &content,
                                              const std::string &now);

  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace semcache::chat

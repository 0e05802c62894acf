#include "semcache/chat/chat_store.hpp"

#include "semcache/common/fs.hpp"
#include "semcache/common/sqlite.hpp"

#include <chrono>
#include <ctime>
#include <random>

namespace semcache::chat {

namespace {

constexpr const char *kThreadColumns =
    "SELECT c.id, c.title, c.created_at, c.updated_at, COUNT(m.id) FROM chats c "
    "LEFT JOIN messages m ON m.chat_id = c.id ";

ChatThread row_to_thread(sqlite3_stmt *stmt) {
  ChatThread thread;
  thread.id = common::sqlite_column_text(stmt, 0);
  thread.title = common::sqlite_column_text(stmt, 1);
  thread.created_at = common::sqlite_column_text(stmt, 2);
  thread.updated_at = common::sqlite_column_text(stmt, 3);
  thread.message_count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 4));
  return thread;
}

common::Status unknown_chat(const std::string &id) {
  return common::Status::error(common::ErrorCode::InvalidArgument, "no saved chat with id " + id);
}

common::Status blank_id() {
  return common::Status::error(common::ErrorCode::InvalidArgument, "chat id is empty");
}

} // namespace

std::string title_from_prompt(const std::string &prompt) {
  std::string title = common::trim(prompt.substr(0, prompt.find('\n')));
  if (title.empty()) {
    return kDefaultChatTitle;
  }
  if (title.size() > kChatTitleLength) {
    std::size_t cut = kChatTitleLength;
    while (cut > 0 && (static_cast<unsigned char>(title[cut]) & 0xC0U) == 0x80U) {
      --cut;
    }
    title = common::trim(title.substr(0, cut));
  }
  return title;
}

std::string new_chat_id() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm utc{};
  gmtime_r(&now, &utc);
  char stamp[sizeof("YYYYMMDDTHHMMSSZ")];
  std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%SZ", &utc);

  static constexpr char kHex[] = "0123456789abcdef";
  std::random_device device;
  std::uniform_int_distribution<int> nibble(0, 15);
  std::string id = std::string(stamp) + "-";
  for (int i = 0; i < 6; ++i) {
    id.push_back(kHex[nibble(device)]);
  }
  return id;
}

common::Result<std::unique_ptr<SqliteChatStore>>
SqliteChatStore::open(const std::filesystem::path &db_path) {
  using OpenResult = common::Result<std::unique_ptr<SqliteChatStore>>;

  auto db = common::open_sqlite(db_path);
  if (!db.ok()) {
    return OpenResult::failure(db.status());
  }
  auto store = std::make_unique<SqliteChatStore>(OpenKey{}, db.value());
  if (const auto status = store->init_schema(); !status.ok()) {
    return OpenResult::failure(status);
  }
  return OpenResult::success(std::move(store));
}

SqliteChatStore::SqliteChatStore(OpenKey, sqlite3 *db) : db_(db) {}

SqliteChatStore::~SqliteChatStore() { sqlite3_close(db_); }

common::Status SqliteChatStore::init_schema() {
  return common::sqlite_exec(db_, R"(
PRAGMA foreign_keys = ON;
CREATE TABLE IF NOT EXISTS chats (
  id TEXT PRIMARY KEY,
  title TEXT NOT NULL,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS messages (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  chat_id TEXT NOT NULL REFERENCES chats(id) ON DELETE CASCADE,
  role TEXT NOT NULL,
  content TEXT NOT NULL,
  created_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS messages_by_chat ON messages(chat_id, id);
)");
}

common::Result<std::optional<ChatThread>>
SqliteChatStore::find_chat_locked(const std::string &id) {
  using FindResult = common::Result<std::optional<ChatThread>>;

  const std::string sql = std::string(kThreadColumns) + "WHERE c.id = ?1 GROUP BY c.id";
  common::SqliteStatement select;
  if (auto prepared = select.prepare(db_, sql.c_str(), "find chat"); !prepared.ok()) {
    return FindResult::failure(prepared);
  }
  select.bind_text(1, id);

  const int rc = sqlite3_step(select.get());
  if (rc == SQLITE_DONE) {
    return FindResult::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return FindResult::failure(common::sqlite_error(db_, "find chat"));
  }
  return FindResult::success(row_to_thread(select.get()));
}

common::Result<std::optional<ChatThread>> SqliteChatStore::find_chat(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return find_chat_locked(id);
}

common::Status SqliteChatStore::create_chat(const std::string &id, const std::string &title) {
  if (common::trim(id).empty()) {
    return blank_id();
  }
  if (common::trim(title).empty()) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "chat title is empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  common::SqliteStatement insert;
  if (auto prepared = insert.prepare(
          db_,
          "INSERT INTO chats(id, title, created_at, updated_at) VALUES(?1, ?2, ?3, ?3) "
          "ON CONFLICT(id) DO NOTHING",
          "create chat");
      !prepared.ok()) {
    return prepared;
  }
  insert.bind_text(1, id);
  insert.bind_text(2, title);
  insert.bind_text(3, common::now_rfc3339());
  if (sqlite3_step(insert.get()) != SQLITE_DONE) {
    return common::sqlite_error(db_, "create chat");
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "a chat with id " + id + " already exists");
  }
  return common::Status::success();
}

common::Result<std::vector<ChatThread>> SqliteChatStore::list_chats() {
  using ListResult = common::Result<std::vector<ChatThread>>;
  std::lock_guard<std::mutex> lock(mutex_);

  const std::string sql =
      std::string(kThreadColumns) + "GROUP BY c.id ORDER BY c.created_at DESC, c.rowid DESC";
  common::SqliteStatement select;
  if (auto prepared = select.prepare(db_, sql.c_str(), "list chats"); !prepared.ok()) {
    return ListResult::failure(prepared);
  }

  std::vector<ChatThread> threads;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
    threads.push_back(row_to_thread(select.get()));
  }
  if (rc != SQLITE_DONE) {
    return ListResult::failure(common::sqlite_error(db_, "list chats"));
  }
  return ListResult::success(std::move(threads));
}

common::Result<std::vector<providers::ChatMessage>>
SqliteChatStore::load_messages(const std::string &id) {
  using MessagesResult = common::Result<std::vector<providers::ChatMessage>>;
  std::lock_guard<std::mutex> lock(mutex_);

  auto thread = find_chat_locked(id);
  if (!thread.ok()) {
    return MessagesResult::failure(thread.status());
  }
  if (!thread.value().has_value()) {
    return MessagesResult::failure(unknown_chat(id));
  }

  common::SqliteStatement select;
  if (auto prepared = select.prepare(
          db_, "SELECT role, content FROM messages WHERE chat_id = ?1 ORDER BY id ASC",
          "load messages");
      !prepared.ok()) {
    return MessagesResult::failure(prepared);
  }
  select.bind_text(1, id);

  std::vector<providers::ChatMessage> messages;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
    messages.push_back({.role = common::sqlite_column_text(select.get(), 0),
                        .content = common::sqlite_column_text(select.get(), 1)});
  }
  if (rc != SQLITE_DONE) {
    return MessagesResult::failure(common::sqlite_error(db_, "load messages"));
  }
  return MessagesResult::success(std::move(messages));
}

common::Status SqliteChatStore::insert_message(const std::string &id, const std::string &role,
                                               const std::string &content,
                                               const std::string &now) {
  common::SqliteStatement insert;
  if (auto prepared = insert.prepare(
          db_,
          "INSERT INTO messages(chat_id, role, content, created_at) VALUES(?1, ?2, ?3, ?4)",
          "save message");
      !prepared.ok()) {
    return prepared;
  }
  insert.bind_text(1, id);
  insert.bind_text(2, role);
  insert.bind_text(3, content);
  insert.bind_text(4, now);
  if (sqlite3_step(insert.get()) != SQLITE_DONE) {
    return common::sqlite_error(db_, "save " + role + " message");
  }
  return common::Status::success();
}

common::Status SqliteChatStore::append_exchange(const std::string &id, const std::string &prompt,
                                                const std::string &reply) {
  if (common::trim(id).empty()) {
    return blank_id();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto begin = common::sqlite_exec(db_, "BEGIN IMMEDIATE"); !begin.ok()) {
    return begin;
  }

  auto thread = find_chat_locked(id);
  if (!thread.ok()) {
    return common::sqlite_abort(db_, thread.status());
  }

  const std::string now = common::now_rfc3339();
  const bool exists = thread.value().has_value();
  const bool retitle = !exists || (thread.value()->message_count == 0 &&
                                   thread.value()->title == kDefaultChatTitle);

  common::SqliteStatement upsert;
  if (auto prepared = upsert.prepare(
          db_,
          "INSERT INTO chats(id, title, created_at, updated_at) VALUES(?1, ?2, ?3, ?3) "
          "ON CONFLICT(id) DO UPDATE SET updated_at = excluded.updated_at, "
          "title = CASE WHEN ?4 THEN excluded.title ELSE chats.title END",
          "touch chat");
      !prepared.ok()) {
    return common::sqlite_abort(db_, prepared);
  }
  upsert.bind_text(1, id);
  upsert.bind_text(2, title_from_prompt(prompt));
  upsert.bind_text(3, now);
  sqlite3_bind_int(upsert.get(), 4, retitle ? 1 : 0);
  if (sqlite3_step(upsert.get()) != SQLITE_DONE) {
    return common::sqlite_abort(db_, common::sqlite_error(db_, "touch chat"));
  }

  if (auto saved = insert_message(id, "user", prompt, now); !saved.ok()) {
    return common::sqlite_abort(db_, saved);
  }
  if (auto saved = insert_message(id, "assistant", reply, now); !saved.ok()) {
    return common::sqlite_abort(db_, saved);
  }

  if (auto commit = common::sqlite_exec(db_, "COMMIT"); !commit.ok()) {
    return common::sqlite_abort(db_, commit);
  }
  return common::Status::success();
}

common::Status SqliteChatStore::rename_chat(const std::string &id, const std::string &title) {
  if (common::trim(title).empty()) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "chat title is empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  common::SqliteStatement update;
  if (auto prepared = update.prepare(
          db_, "UPDATE chats SET title = ?1, updated_at = ?2 WHERE id = ?3", "rename chat");
      !prepared.ok()) {
    return prepared;
  }
  update.bind_text(1, common::trim(title));
  update.bind_text(2, common::now_rfc3339());
  update.bind_text(3, id);
  if (sqlite3_step(update.get()) != SQLITE_DONE) {
    return common::sqlite_error(db_, "rename chat");
  }
  return sqlite3_changes(db_) == 0 ? unknown_chat(id) : common::Status::success();
}

common::Result<bool> SqliteChatStore::delete_chat(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  common::SqliteStatement remove;
  if (auto prepared = remove.prepare(db_, "DELETE FROM chats WHERE id = ?1", "delete chat");
      !prepared.ok()) {
    return common::Result<bool>::failure(prepared);
  }
  remove.bind_text(1, id);
  if (sqlite3_step(remove.get()) != SQLITE_DONE) {
    return common::Result<bool>::failure(common::sqlite_error(db_, "delete chat"));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<std::size_t> SqliteChatStore::delete_all_chats() {
  std::lock_guard<std::mutex> lock(mutex_);
  common::SqliteStatement remove;
  if (auto prepared = remove.prepare(db_, "DELETE FROM chats", "delete chats");
      !prepared.ok()) {
    return common::Result<std::size_t>::failure(prepared);
  }
  if (sqlite3_step(remove.get()) != SQLITE_DONE) {
    return common::Result<std::size_t>::failure(common::sqlite_error(db_, "delete chats"));
  }
  return common::Result<std::size_t>::success(static_cast<std::size_t>(sqlite3_changes(db_)));
}

} // namespace semcache::chat

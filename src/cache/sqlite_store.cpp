#include "semcache/cache/sqlite_store.hpp"

#include "semcache/common/fs.hpp"
#include "semcache/common/sqlite.hpp"

#include <cstring>

namespace semcache::cache {

std::vector<unsigned char> encode_embedding(const std::vector<float> &values) {
  std::vector<unsigned char> blob;
  blob.reserve(values.size() * 4);
  for (const float value : values) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    blob.push_back(static_cast<unsigned char>(bits & 0xFFU));
    blob.push_back(static_cast<unsigned char>((bits >> 8) & 0xFFU));
    blob.push_back(static_cast<unsigned char>((bits >> 16) & 0xFFU));
    blob.push_back(static_cast<unsigned char>((bits >> 24) & 0xFFU));
  }
  return blob;
}

common::Result<std::vector<float>> decode_embedding(const void *blob, const std::size_t bytes) {
  if (blob == nullptr || bytes == 0) {
    return common::Result<std::vector<float>>::failure(common::ErrorCode::StoreFailure,
                                                       "embedding blob is empty");
  }
  if (bytes % 4 != 0) {
    return common::Result<std::vector<float>>::failure(
        common::ErrorCode::StoreFailure,
        "embedding blob length " + std::to_string(bytes) + " is not a multiple of 4");
  }

  const auto *data = static_cast<const unsigned char *>(blob);
  std::vector<float> values(bytes / 4);
  for (std::size_t i = 0; i < values.size(); ++i) {
    const unsigned char *p = data + i * 4;
    const std::uint32_t bits = static_cast<std::uint32_t>(p[0]) |
                               (static_cast<std::uint32_t>(p[1]) << 8) |
                               (static_cast<std::uint32_t>(p[2]) << 16) |
                               (static_cast<std::uint32_t>(p[3]) << 24);
    std::memcpy(&values[i], &bits, sizeof(bits));
  }
  return common::Result<std::vector<float>>::success(std::move(values));
}

common::Result<std::unique_ptr<SqliteQueryStore>>
SqliteQueryStore::open(const std::filesystem::path &db_path) {
  using OpenResult = common::Result<std::unique_ptr<SqliteQueryStore>>;

  auto db = common::open_sqlite(db_path);
  if (!db.ok()) {
    return OpenResult::failure(db.status());
  }
  auto store = std::make_unique<SqliteQueryStore>(OpenKey{}, db_path, db.value());
  if (const auto status = store->init_schema(); !status.ok()) {
    return OpenResult::failure(status);
  }
  return OpenResult::success(std::move(store));
}

SqliteQueryStore::SqliteQueryStore(OpenKey, std::filesystem::path db_path, sqlite3 *db)
    : db_path_(std::move(db_path)), db_(db) {}

SqliteQueryStore::~SqliteQueryStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

std::string_view SqliteQueryStore::name() const { return "sqlite"; }

common::Status SqliteQueryStore::store_error(const std::string &context) const {
  return common::sqlite_error(db_, context);
}

common::Status SqliteQueryStore::init_schema() {
  return common::sqlite_exec(db_, R"(
CREATE TABLE IF NOT EXISTS queries (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  query TEXT NOT NULL UNIQUE,
  embedding BLOB NOT NULL,
  response TEXT NOT NULL,
  usage_count INTEGER NOT NULL DEFAULT 1,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
)");
}

common::Result<bool> SqliteQueryStore::upsert(const std::string &query,
                                              const std::vector<float> &embedding,
                                              const std::string &response) {
  if (embedding.empty()) {
    return common::Result<bool>::failure(common::ErrorCode::InvalidArgument,
                                         "refusing to store an empty embedding");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto begin = common::sqlite_exec(db_, "BEGIN IMMEDIATE"); !begin.ok()) {
    return common::Result<bool>::failure(begin);
  }
  const auto fail = [this](const common::Status &cause) {
    return common::Result<bool>::failure(common::sqlite_abort(db_, cause));
  };

  const std::string now = common::now_rfc3339();
  common::SqliteStatement update;
  if (auto prepared = update.prepare(db_,
                                     "UPDATE queries SET response = ?1, usage_count = usage_count "
                                     "+ 1, updated_at = ?2 WHERE query = ?3",
                                     "update");
      !prepared.ok()) {
    return fail(prepared);
  }
  update.bind_text(1, response);
  update.bind_text(2, now);
  update.bind_text(3, query);
  if (sqlite3_step(update.get()) != SQLITE_DONE) {
    return fail(store_error("update query"));
  }
  const bool was_new = sqlite3_changes(db_) == 0;

  if (was_new) {
    common::SqliteStatement insert;
    if (auto prepared = insert.prepare(db_,
                                       "INSERT INTO queries(query, embedding, response, "
                                       "usage_count, created_at, updated_at) "
                                       "VALUES(?1, ?2, ?3, 1, ?4, ?4)",
                                       "insert");
        !prepared.ok()) {
      return fail(prepared);
    }
    const auto blob = encode_embedding(embedding);
    insert.bind_text(1, query);
    sqlite3_bind_blob(insert.get(), 2, blob.data(), static_cast<int>(blob.size()),
                      SQLITE_TRANSIENT);
    insert.bind_text(3, response);
    insert.bind_text(4, now);
    if (sqlite3_step(insert.get()) != SQLITE_DONE) {
      return fail(store_error("insert query"));
    }
  }

  if (auto commit = common::sqlite_exec(db_, "COMMIT"); !commit.ok()) {
    return fail(commit);
  }
  return common::Result<bool>::success(was_new);
}

common::Result<QueryRecord> SqliteQueryStore::row_to_record(sqlite3_stmt *stmt) const {
  QueryRecord record;
  record.id = sqlite3_column_int64(stmt, 0);
  record.query = common::sqlite_column_text(stmt, 1);

  const void *blob = sqlite3_column_blob(stmt, 2);
  const int bytes = sqlite3_column_bytes(stmt, 2);
  auto embedding = decode_embedding(blob, bytes < 0 ? 0 : static_cast<std::size_t>(bytes));
  if (!embedding.ok()) {
    return common::Result<QueryRecord>::failure(
        common::ErrorCode::StoreFailure,
        "record " + std::to_string(record.id) + ": " + embedding.error());
  }
  record.embedding = std::move(embedding.value());

  record.response = common::sqlite_column_text(stmt, 3);
  record.usage_count = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 4));
  record.created_at = common::sqlite_column_text(stmt, 5);
  record.updated_at = common::sqlite_column_text(stmt, 6);
  return common::Result<QueryRecord>::success(std::move(record));
}

common::Result<std::vector<QueryRecord>> SqliteQueryStore::all_records() {
  using RecordsResult = common::Result<std::vector<QueryRecord>>;
  std::lock_guard<std::mutex> lock(mutex_);

  common::SqliteStatement select;
  if (auto prepared = select.prepare(db_,
                                     "SELECT id, query, embedding, response, usage_count, "
                                     "created_at, updated_at FROM queries ORDER BY id ASC",
                                     "scan");
      !prepared.ok()) {
    return RecordsResult::failure(prepared);
  }

  std::vector<QueryRecord> records;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
    auto record = row_to_record(select.get());
    if (!record.ok()) {
      return RecordsResult::failure(record.status());
    }
    records.push_back(std::move(record.value()));
  }
  if (rc != SQLITE_DONE) {
    return RecordsResult::failure(store_error("scan queries"));
  }
  return RecordsResult::success(std::move(records));
}

common::Result<std::optional<QueryRecord>> SqliteQueryStore::find(const std::string &query) {
  using FindResult = common::Result<std::optional<QueryRecord>>;
  std::lock_guard<std::mutex> lock(mutex_);

  common::SqliteStatement select;
  if (auto prepared = select.prepare(db_,
                                     "SELECT id, query, embedding, response, usage_count, "
                                     "created_at, updated_at FROM queries WHERE query = ?1",
                                     "find");
      !prepared.ok()) {
    return FindResult::failure(prepared);
  }
  select.bind_text(1, query);

  const int rc = sqlite3_step(select.get());
  if (rc == SQLITE_DONE) {
    return FindResult::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return FindResult::failure(store_error("find query"));
  }
  auto record = row_to_record(select.get());
  if (!record.ok()) {
    return FindResult::failure(record.status());
  }
  return FindResult::success(std::move(record.value()));
}

common::Result<std::size_t> SqliteQueryStore::count() {
  std::lock_guard<std::mutex> lock(mutex_);

  common::SqliteStatement select;
  if (auto prepared = select.prepare(db_, "SELECT COUNT(*) FROM queries", "count");
      !prepared.ok()) {
    return common::Result<std::size_t>::failure(prepared);
  }
  if (sqlite3_step(select.get()) != SQLITE_ROW) {
    return common::Result<std::size_t>::failure(store_error("count queries"));
  }
  return common::Result<std::size_t>::success(
      static_cast<std::size_t>(sqlite3_column_int64(select.get(), 0)));
}

bool SqliteQueryStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  common::SqliteStatement select;
  return select.prepare(db_, "SELECT 1", "health check").ok() &&
         sqlite3_step(select.get()) == SQLITE_ROW;
}

} // namespace semcache::cache

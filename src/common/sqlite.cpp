#include "semcache/common/sqlite.hpp"

#include "semcache/common/fs.hpp"

namespace semcache::common {

namespace {

constexpr int kBusyTimeoutMs = 5'000;

} // namespace

Result<sqlite3 *> open_sqlite(const std::filesystem::path &path) {
  const bool in_memory = path == ":memory:";
  if (!in_memory && !path.parent_path().empty()) {
    const auto dir = ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return Result<sqlite3 *>::failure(ErrorCode::StoreFailure, dir.error());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(path.string().c_str(), &db) != SQLITE_OK) {
    const std::string msg = db == nullptr ? "out of memory" : sqlite3_errmsg(db);
    sqlite3_close(db);
    return Result<sqlite3 *>::failure(ErrorCode::StoreFailure,
                                      "unable to open " + path.string() + ": " + msg);
  }
  sqlite3_busy_timeout(db, kBusyTimeoutMs);

  if (!in_memory) {
    if (const auto wal = sqlite_exec(db, "PRAGMA journal_mode=WAL;"); !wal.ok()) {
      sqlite3_close(db);
      return Result<sqlite3 *>::failure(wal);
    }
  }
  return Result<sqlite3 *>::success(db);
}

Status sqlite_exec(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) {
    return Status::success();
  }
  const std::string msg = err == nullptr ? "sqlite error" : err;
  sqlite3_free(err);
  return Status::error(ErrorCode::StoreFailure, msg);
}

Status sqlite_error(sqlite3 *db, const std::string &context) {
  return Status::error(ErrorCode::StoreFailure, context + ": " + sqlite3_errmsg(db));
}

Status sqlite_abort(sqlite3 *db, const Status &cause) {
  const auto rollback = sqlite_exec(db, "ROLLBACK");
  if (!rollback.ok()) {
    return Status::error(cause.code(),
                         cause.error() + " (rollback failed: " + rollback.error() + ")");
  }
  return cause;
}

std::string sqlite_column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : reinterpret_cast<const char *>(text);
}

SqliteStatement::~SqliteStatement() { sqlite3_finalize(stmt_); }

Status SqliteStatement::prepare(sqlite3 *db, const char *sql, const std::string &what) {
  sqlite3_finalize(stmt_);
  stmt_ = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    return sqlite_error(db, "prepare " + what);
  }
  return Status::success();
}

void SqliteStatement::bind_text(const int index, const std::string &value) {
  sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

} // namespace semcache::common

#pragma once

#include "semcache/common/result.hpp"

#include <filesystem>
#include <sqlite3.h>
#include <string>

namespace semcache::common {

// Opens (creating the parent directory if needed) the database at `path` with a
// busy timeout; on-disk files are switched to WAL. ":memory:" is accepted.
// Failures are StoreFailure. The caller owns the handle.
[[nodiscard]] Result<sqlite3 *> open_sqlite(const std::filesystem::path &path);

[[nodiscard]] Status sqlite_exec(sqlite3 *db, const std::string &sql);

// StoreFailure carrying `context` and the connection's last error message.
[[nodiscard]] Status sqlite_error(sqlite3 *db, const std::string &context);

// Rolls back the open transaction and returns `cause`, noting a failed rollback.
[[nodiscard]] Status sqlite_abort(sqlite3 *db, const Status &cause);

[[nodiscard]] std::string sqlite_column_text(sqlite3_stmt *stmt, int column);

// Prepared statement finalized when leaving scope.
class SqliteStatement {
public:
  SqliteStatement() = default;
  ~SqliteStatement();
  SqliteStatement(const SqliteStatement &) = delete;
  SqliteStatement &operator=(const SqliteStatement &) = delete;

  // On failure the StoreFailure reads "prepare <what>: <sqlite message>".
  [[nodiscard]] Status prepare(sqlite3 *db, const char *sql, const std::string &what);
  void bind_text(int index, const std::string &value);
  [[nodiscard]] sqlite3_stmt *get() const { return stmt_; }

private:
  sqlite3_stmt *stmt_ = nullptr;
};

} // namespace semcache::common

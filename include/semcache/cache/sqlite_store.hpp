#pragma once

#include "semcache/cache/query_store.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <sqlite3.h>

namespace semcache::cache {

class SqliteQueryStore final : public IQueryStore {
  struct OpenKey {
    explicit OpenKey() = default;
  };

public:
  // Opens (creating if needed) the database at `db_path`; ":memory:" is accepted.
  [[nodiscard]] static common::Result<std::unique_ptr<SqliteQueryStore>>
  open(const std::filesystem::path &db_path);

  SqliteQueryStore(OpenKey, std::filesystem::path db_path, sqlite3 *db);
  ~SqliteQueryStore() override;
  SqliteQueryStore(const SqliteQueryStore &) = delete;
  SqliteQueryStore &operator=(const SqliteQueryStore &) = delete;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<bool> upsert(const std::string &query,
                                            const std::vector<float> &embedding,
                                            const std::string &response) override;
  [[nodiscard]] common::Result<std::vector<QueryRecord>> all_records() override;
  [[nodiscard]] common::Result<std::optional<QueryRecord>> find(const std::string &query) override;
  [[nodiscard]] common::Result<std::size_t> count() override;
  [[nodiscard]] bool health_check() override;

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status store_error(const std::string &context) const;
  [[nodiscard]] common::Result<QueryRecord> row_to_record(sqlite3_stmt *stmt) const;

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

// Packed little-endian IEEE-754 floats, no header.
[[nodiscard]] std::vector<unsigned char> encode_embedding(const std::vector<float> &values);
[[nodiscard]] common::Result<std::vector<float>> decode_embedding(const void *blob,
                                                                  std::size_t bytes);

} // namespace semcache::cache

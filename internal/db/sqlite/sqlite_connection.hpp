#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/api/connection.hpp"

namespace muse::db::sqlite {

struct SqliteOptions {
  std::string               path;
  bool                      wal_mode = true;
  std::chrono::milliseconds busy_timeout{5000};
};

/*
  RAII wrapper around one sqlite3* handle.

  Each pooled connection opens its own handle; WAL lets readers
  proceed while one writer holds the lock.
*/
class SqliteConnection final : public db::Connection {
 public:
  explicit SqliteConnection(SqliteOptions options);
  ~SqliteConnection() override;

  SqliteConnection(const SqliteConnection&)            = delete;
  SqliteConnection& operator=(const SqliteConnection&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  Dialect GetDialect() const override {
    return Dialect::kSqlite;
  }

  Result  Run(const std::string& sql, const sql::Params& params = {}) override;
  Result  Query(const std::string& sql, const sql::Params& params, const RowCallback& on_row) override;
  int64_t Changes() const override;

  std::unique_ptr<Transaction> Begin() override;
  bool                         InTransaction() const override;

  bool IsHealthy() const override;
  void Close() override;

  // Execute a raw SQL string (pragmas, transaction control).
  Result Exec(const std::string& sql);

  static Result Translate(sqlite3* db, int rc);

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  Result Prepare(const std::string& sql, const sql::Params& params, sqlite3_stmt** out);

  SqliteOptions options_;
  sqlite3*      db_     = nullptr;
  bool          broken_ = false;
};

} // namespace muse::db::sqlite

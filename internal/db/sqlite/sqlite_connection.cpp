#include "sqlite_connection.hpp"

#include <stdexcept>
#include <type_traits>
#include <variant>

#include "internal/util/errors.hpp"
#include "sqlite_tx.hpp"

namespace muse::db::sqlite {

namespace {

class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }

  int GetInt(int col) const override {
    return sqlite3_column_int(st_, col);
  }

  int64_t GetInt64(int col) const override {
    return static_cast<int64_t>(sqlite3_column_int64(st_, col));
  }

  double GetDouble(int col) const override {
    return sqlite3_column_double(st_, col);
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

int Bind(sqlite3_stmt* st, int idx, const sql::Param& param) {
  return std::visit(
      [&](const auto& value) -> int {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return sqlite3_bind_null(st, idx);
        } else if constexpr (std::is_same_v<T, int32_t>) {
          return sqlite3_bind_int(st, idx, value);
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
          return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(value));
        } else if constexpr (std::is_same_v<T, double>) {
          return sqlite3_bind_double(st, idx, value);
        } else {
          return sqlite3_bind_text(st, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        }
      },
      param);
}

} // namespace

SqliteConnection::SqliteConnection(SqliteOptions options) : options_(std::move(options)) {
  int rc = sqlite3_open_v2(options_.path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::TransientStoreError("sqlite open " + options_.path + ": " + msg);
  }

  Configure();
}

SqliteConnection::~SqliteConnection() {
  Close();
}

void SqliteConnection::Close() {
  if (db_) {
    sqlite3_close_v2(db_);
    db_ = nullptr;
  }
}

bool SqliteConnection::IsHealthy() const {
  return db_ != nullptr && !broken_;
}

bool SqliteConnection::InTransaction() const {
  return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
}

int64_t SqliteConnection::Changes() const {
  return db_ ? sqlite3_changes(db_) : 0;
}

Result SqliteConnection::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const char* msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, msg);
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, msg);
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, msg);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, msg);
    default:
      return Result::Err(ErrorCode::InternalError, msg);
  }
}

Result SqliteConnection::Exec(const std::string& sql) {
  if (!db_) return Result::Err(ErrorCode::IOError, "connection closed");

  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    auto result = Translate(db_, rc);
    result.message = msg;
    if (result.code == ErrorCode::Corruption) broken_ = true;
    return result;
  }
  return Result::Ok();
}

Result SqliteConnection::Prepare(const std::string& sql, const sql::Params& params, sqlite3_stmt** out) {
  *out = nullptr;
  if (!db_) return Result::Err(ErrorCode::IOError, "connection closed");

  sqlite3_stmt* st = nullptr;
  int           rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &st, nullptr);
  if (rc != SQLITE_OK) return Translate(db_, rc);

  for (std::size_t i = 0; i < params.size(); ++i) {
    rc = Bind(st, static_cast<int>(i + 1), params[i]);
    if (rc != SQLITE_OK) {
      auto result = Translate(db_, rc);
      sqlite3_finalize(st);
      return result;
    }
  }

  *out = st;
  return Result::Ok();
}

Result SqliteConnection::Run(const std::string& sql, const sql::Params& params) {
  sqlite3_stmt* st     = nullptr;
  auto          result = Prepare(sql, params, &st);
  if (!result) return result;

  int rc = SQLITE_ROW;
  while (rc == SQLITE_ROW) rc = sqlite3_step(st);

  result = Translate(db_, rc);
  sqlite3_finalize(st);
  if (result.code == ErrorCode::Corruption) broken_ = true;
  return result;
}

Result SqliteConnection::Query(const std::string& sql, const sql::Params& params, const RowCallback& on_row) {
  sqlite3_stmt* st     = nullptr;
  auto          result = Prepare(sql, params, &st);
  if (!result) return result;

  SqliteRow row(st);
  int       rc = sqlite3_step(st);
  while (rc == SQLITE_ROW) {
    try {
      on_row(row);
    } catch (...) {
      sqlite3_finalize(st);
      throw;
    }
    rc = sqlite3_step(st);
  }

  result = Translate(db_, rc);
  sqlite3_finalize(st);
  if (result.code == ErrorCode::Corruption) broken_ = true;
  return result;
}

std::unique_ptr<Transaction> SqliteConnection::Begin() {
  if (InTransaction()) throw util::InvalidState("sqlite connection already has an open transaction");
  return std::make_unique<SqliteTransaction>(*this);
}

void SqliteConnection::Configure() {
  if (options_.wal_mode) {
    // IMPORTANT: WAL enables concurrent readers while writer holds lock
    ThrowIfError(Exec("PRAGMA journal_mode=WAL;"), "sqlite journal_mode");
  }

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  ThrowIfError(Exec("PRAGMA synchronous=NORMAL;"), "sqlite synchronous");

  // foreign keys are OFF by default in sqlite
  ThrowIfError(Exec("PRAGMA foreign_keys=ON;"), "sqlite foreign_keys");

  // wait for locks instead of failing immediately
  ThrowIfError(Translate(db_, sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout.count()))), "sqlite busy_timeout");

  ThrowIfError(Exec("PRAGMA temp_store=MEMORY;"), "sqlite temp_store");
}

} // namespace muse::db::sqlite

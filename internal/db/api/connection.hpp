#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace muse::db {

enum class Dialect { kSqlite, kPostgres };

using RowCallback = std::function<void(const sql::Row&)>;

/*
  One live datastore handle.

  A connection is used by exactly one lessee at a time: the pool hands
  it out, the lessee runs statements, the lease returns it. Statements
  use '?' placeholders; drivers rewrite them when their backend needs
  another form.
*/
class Connection {
 public:
  virtual ~Connection() = default;

  virtual Dialect GetDialect() const = 0;

  // Execute a statement that returns no rows.
  virtual Result Run(const std::string& sql, const sql::Params& params = {}) = 0;

  // Execute a statement and feed each row to on_row.
  virtual Result Query(const std::string& sql, const sql::Params& params, const RowCallback& on_row) = 0;

  // Rows changed by the last Run().
  virtual int64_t Changes() const = 0;

  // Opens a transaction on this connection. Throws InvalidState when one
  // is already open.
  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual bool InTransaction() const = 0;

  virtual bool IsHealthy() const = 0;

  virtual void Close() = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<Connection>()>;

} // namespace muse::db

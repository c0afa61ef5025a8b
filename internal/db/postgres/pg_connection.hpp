#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/connection.hpp"

namespace muse::db::postgres {

/*
  PgConnection

  One pqxx::connection. libpqxx connections are NOT thread-safe, the
  pool guarantees a single lessee at a time.

  Outside Begin() each statement runs in its own pqxx::nontransaction;
  inside, statements run on the open pqxx::work.
*/
class PgConnection final : public db::Connection {
 public:
  explicit PgConnection(const std::string& conninfo);
  ~PgConnection() override;

  Dialect GetDialect() const override {
    return Dialect::kPostgres;
  }

  Result  Run(const std::string& sql, const sql::Params& params = {}) override;
  Result  Query(const std::string& sql, const sql::Params& params, const RowCallback& on_row) override;
  int64_t Changes() const override {
    return changes_;
  }

  std::unique_ptr<Transaction> Begin() override;
  bool                         InTransaction() const override {
    return work_ != nullptr;
  }

  bool IsHealthy() const override;
  void Close() override;

  // Used by PgTransaction.
  void CommitWork();
  void AbortWork();

  // '?' -> '$n', leaving quoted literals alone.
  static std::string RewritePlaceholders(const std::string& sql);

 private:
  Result Translate(const std::exception& e);

  template <typename Fn>
  Result Execute(const std::string& sql, const sql::Params& params, Fn&& on_result);

  std::unique_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  int64_t                           changes_ = 0;
  bool                              broken_  = false;
};

} // namespace muse::db::postgres

#pragma once

#include "internal/db/api/transaction.hpp"

namespace muse::db::postgres {

class PgConnection;

class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(PgConnection& conn);
  ~PgTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  PgConnection& conn_;
  bool finished_ = false;
};

}

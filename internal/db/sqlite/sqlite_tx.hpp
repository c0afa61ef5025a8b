#pragma once

#include "internal/db/api/transaction.hpp"

namespace muse::db::sqlite {

class SqliteConnection;

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(SqliteConnection& conn);
  ~SqliteTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  SqliteConnection& conn_;
  bool finished_ = false;
};

}

#pragma once

namespace muse::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other connections until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if neither Commit() nor Rollback() ran

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically; throws TransientStoreError on lock/IO failure
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsFinished() const = 0;
};

}

#pragma once

#include <functional>
#include <memory>

#include "internal/db/api/connection.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/repository/activity_log_repository.hpp"
#include "internal/db/repository/config_repository.hpp"
#include "internal/db/repository/content_repository.hpp"
#include "internal/db/repository/event_store.hpp"
#include "internal/db/repository/operation_repository.hpp"
#include "internal/util/retry.hpp"

namespace muse::db {

class ConnectionPool;

/*
  UnitOfWork

  One leased connection, one explicit transaction.

    UnitOfWork uow(pool);
    uow.Begin();
    uow.Operations().Insert(...);
    uow.Events().Append(...);
    uow.Commit();

  - Begin() leases a connection and opens the transaction. Begin() on an
    open unit throws InvalidState; units do not nest.
  - Commit()/Rollback() end the transaction and return the connection to
    the pool. Calling either without an open transaction throws.
  - A unit destroyed while open rolls back.
  - Repository accessors are valid only between Begin and Commit/Rollback.
  - Begin() retries transient datastore errors (busy, locked, pool
    exhausted) under the unit's RetryOptions. Transaction(fn) retries the
    whole attempt, so fn may run more than once.
*/
class UnitOfWork {
 public:
  explicit UnitOfWork(std::shared_ptr<ConnectionPool> pool, util::RetryOptions retry = {});
  ~UnitOfWork();

  UnitOfWork(const UnitOfWork&)            = delete;
  UnitOfWork& operator=(const UnitOfWork&) = delete;

  void Begin();
  void Commit();
  void Rollback();

  bool IsActive() const {
    return tx_ != nullptr;
  }

  repository::OperationRepository&   Operations();
  repository::ActivityLogRepository& Logs();
  repository::ContentRepository&     Content();
  repository::ConfigRepository&      Configs();
  repository::EventStore&            Events();

  Connection& Conn();

  // Begin, fn(*this), Commit. Rolls back and rethrows if fn throws with a
  // non-transient error.
  void Transaction(const std::function<void(UnitOfWork&)>& fn);

 private:
  struct Repositories {
    explicit Repositories(Connection& conn) : operations(conn), logs(conn), content(conn), configs(conn), events(conn) {
    }

    repository::OperationRepository   operations;
    repository::ActivityLogRepository logs;
    repository::ContentRepository     content;
    repository::ConfigRepository      configs;
    repository::EventStore            events;
  };

  void Open();
  void RequireActive(const char* what) const;
  void Release();

  std::shared_ptr<ConnectionPool> pool_;
  util::RetryOptions              retry_;
  std::shared_ptr<Connection>     conn_;
  std::unique_ptr<db::Transaction> tx_;
  std::unique_ptr<Repositories>   repos_;
};

} // namespace muse::db

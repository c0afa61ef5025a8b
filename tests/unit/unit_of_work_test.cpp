#include "internal/db/unit_of_work.hpp"

#include <cassert>
#include <chrono>
#include <memory>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/events/domain_event.hpp"
#include "internal/util/errors.hpp"
#include "internal/db/pool/connection_pool.hpp"
#include "tests/support/fake_connection.hpp"
#include "tests/support/sqlite_test_pool.hpp"

namespace {

namespace v1 = muse::autonomous::v1;
using muse::db::UnitOfWork;

constexpr const char* kSuite = "unit_of_work_tests";

muse::db::model::OperationRecord MakeOperation(const std::string& id) {
  muse::db::model::OperationRecord op;
  op.id            = id;
  op.type          = v1::CONTENT_TYPE_PLOT;
  op.status        = v1::OPERATION_STATUS_PENDING;
  op.start_time_ms = 1;
  return op;
}

template <typename Fn>
bool ThrowsInvalidState(Fn&& fn) {
  try {
    fn();
  } catch (const muse::util::InvalidState&) {
    return true;
  }
  return false;
}

void TestCommitWritesEntityAndEventTogether() {
  auto pool = muse::testing::MakeSqlitePool(kSuite, "commit");

  UnitOfWork uow(pool);
  uow.Begin();
  uow.Operations().Insert(MakeOperation("op-1"));
  uow.Events().Append(muse::events::MakeEvent("operation.updated", "op-1", "operation", {}));
  uow.Commit();
  assert(!uow.IsActive());

  auto conn = pool->Acquire();
  assert(muse::db::repository::OperationRepository(*conn).Get("op-1").has_value());
  assert(muse::db::repository::EventStore(*conn).ByAggregate("op-1").size() == 1);
}

void TestNestedBeginIsRejected() {
  auto pool = muse::testing::MakeSqlitePool(kSuite, "nested_begin");

  UnitOfWork uow(pool);
  uow.Begin();
  assert(ThrowsInvalidState([&] { uow.Begin(); }));
  assert(uow.IsActive());
  uow.Rollback();
}

void TestCommitOrRollbackWithoutTransactionThrows() {
  auto pool = muse::testing::MakeSqlitePool(kSuite, "double_commit");

  UnitOfWork uow(pool);
  assert(ThrowsInvalidState([&] { uow.Commit(); }));
  assert(ThrowsInvalidState([&] { uow.Rollback(); }));
  assert(ThrowsInvalidState([&] { (void)uow.Operations(); }));

  uow.Begin();
  uow.Commit();
  assert(ThrowsInvalidState([&] { uow.Commit(); }));
}

void TestRollbackDiscardsWrites() {
  auto pool = muse::testing::MakeSqlitePool(kSuite, "rollback");

  UnitOfWork uow(pool);
  uow.Begin();
  uow.Operations().Insert(MakeOperation("discarded"));
  uow.Rollback();

  auto conn = pool->Acquire();
  assert(!muse::db::repository::OperationRepository(*conn).Get("discarded").has_value());
}

void TestDestructorRollsBackOpenUnit() {
  auto pool = muse::testing::MakeSqlitePool(kSuite, "destructor");
  {
    UnitOfWork uow(pool);
    uow.Begin();
    uow.Operations().Insert(MakeOperation("abandoned"));
  }

  auto conn = pool->Acquire();
  assert(!muse::db::repository::OperationRepository(*conn).Get("abandoned").has_value());
  assert(pool->Stats().leased == 1);
}

void TestTransactionHelperRollsBackAndRethrows() {
  auto pool = muse::testing::MakeSqlitePool(kSuite, "transaction_helper");

  UnitOfWork uow(pool);
  bool       rethrown = false;
  try {
    uow.Transaction([](UnitOfWork& unit) {
      unit.Operations().Insert(MakeOperation("half-done"));
      throw std::runtime_error("step two failed");
    });
  } catch (const std::runtime_error& e) {
    rethrown = std::string(e.what()) == "step two failed";
  }
  assert(rethrown);
  assert(!uow.IsActive());

  uow.Transaction([](UnitOfWork& unit) { unit.Operations().Insert(MakeOperation("done")); });

  auto conn = pool->Acquire();
  muse::db::repository::OperationRepository ops(*conn);
  assert(!ops.Get("half-done").has_value());
  assert(ops.Get("done").has_value());
}

void TestUnitIsReusableAfterCommit() {
  auto pool = muse::testing::MakeSqlitePool(kSuite, "reuse");

  UnitOfWork uow(pool);
  uow.Begin();
  uow.Configs().Insert(v1::AutonomousConfig{}, 1);
  uow.Commit();
  uow.Begin();
  assert(uow.Configs().Latest().has_value());
  uow.Commit();
  assert(pool->Stats().leased == 0);
}

muse::util::RetryOptions FastRetry() {
  muse::util::RetryOptions retry;
  retry.max_attempts = 3;
  retry.sleep        = [](std::chrono::milliseconds) {};
  return retry;
}

std::shared_ptr<muse::db::ConnectionPool> FakePool(const std::shared_ptr<muse::testing::FakeBackend>& backend) {
  muse::db::PoolOptions options;
  options.min_connections = 0;
  options.max_connections = 2;
  options.idle_timeout    = std::chrono::milliseconds(0);
  options.acquire_timeout = std::chrono::milliseconds(50);
  return std::make_shared<muse::db::ConnectionPool>(muse::testing::FakeFactory(backend), options);
}

void TestBeginRetriesLockedDatastore() {
  auto backend            = std::make_shared<muse::testing::FakeBackend>();
  auto pool               = FakePool(backend);
  backend->failing_begins = 1;

  UnitOfWork uow(pool, FastRetry());
  uow.Begin();
  assert(uow.IsActive());
  uow.Commit();
  assert(backend->commits == 1);
  assert(pool->Stats().leased == 0);
}

void TestTransactionRetriesLockedDatastore() {
  auto backend            = std::make_shared<muse::testing::FakeBackend>();
  auto pool               = FakePool(backend);
  backend->failing_begins = 2;

  int        runs = 0;
  UnitOfWork uow(pool, FastRetry());
  uow.Transaction([&](UnitOfWork&) { ++runs; });
  assert(runs == 1);
  assert(backend->commits == 1);
  assert(pool->Stats().leased == 0);
}

void TestTransientErrorsStopAfterBudget() {
  auto backend            = std::make_shared<muse::testing::FakeBackend>();
  auto pool               = FakePool(backend);
  backend->failing_begins = 5;

  bool threw = false;
  UnitOfWork uow(pool, FastRetry());
  try {
    uow.Begin();
  } catch (const muse::util::TransientStoreError&) {
    threw = true;
  }
  assert(threw);
  assert(!uow.IsActive());
  assert(backend->failing_begins == 2);
  assert(pool->Stats().leased == 0);
}

void TestFailingBodyIsNotRetried() {
  auto backend = std::make_shared<muse::testing::FakeBackend>();
  auto pool    = FakePool(backend);

  int        runs  = 0;
  bool       threw = false;
  UnitOfWork uow(pool, FastRetry());
  try {
    uow.Transaction([&](UnitOfWork&) {
      ++runs;
      throw std::logic_error("bad input");
    });
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(runs == 1);
  assert(backend->rollbacks == 1);
  assert(backend->commits == 0);
}

} // namespace

int main() {
  TestCommitWritesEntityAndEventTogether();
  TestNestedBeginIsRejected();
  TestCommitOrRollbackWithoutTransactionThrows();
  TestRollbackDiscardsWrites();
  TestDestructorRollsBackOpenUnit();
  TestTransactionHelperRollsBackAndRethrows();
  TestUnitIsReusableAfterCommit();
  TestBeginRetriesLockedDatastore();
  TestTransactionRetriesLockedDatastore();
  TestTransientErrorsStopAfterBudget();
  TestFailingBodyIsNotRetried();

  std::cout << "muse_unit_unit_of_work: pass\n";
  return 0;
}

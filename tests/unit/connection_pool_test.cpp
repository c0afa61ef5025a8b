#include "internal/db/pool/connection_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/fake_connection.hpp"

namespace {

using muse::db::ConnectionPool;
using muse::db::PoolOptions;
using muse::testing::FakeBackend;
using muse::testing::FakeConnection;
using muse::testing::FakeFactory;

PoolOptions SmallPool(std::size_t max_connections) {
  PoolOptions options;
  options.min_connections = 0;
  options.max_connections = max_connections;
  options.idle_timeout    = std::chrono::milliseconds(0);
  options.acquire_timeout = std::chrono::milliseconds(50);
  return options;
}

void TestAcquireBeyondMaxTimesOut() {
  auto backend = std::make_shared<FakeBackend>();
  auto pool    = std::make_shared<ConnectionPool>(FakeFactory(backend), SmallPool(2));

  auto a = pool->Acquire();
  auto b = pool->Acquire();
  assert(pool->Stats().leased == 2);

  bool exhausted = false;
  try {
    (void)pool->Acquire();
  } catch (const muse::util::PoolExhausted&) {
    exhausted = true;
  }
  assert(exhausted);
  assert(backend->opened == 2);
}

void TestReleasedHandleIsReused() {
  auto backend = std::make_shared<FakeBackend>();
  auto pool    = std::make_shared<ConnectionPool>(FakeFactory(backend), SmallPool(1));

  muse::db::Connection* first = nullptr;
  {
    auto lease = pool->Acquire();
    first      = lease.get();
  }
  auto again = pool->Acquire();
  assert(again.get() == first);
  assert(backend->opened == 1);
}

void TestWaiterGetsReleasedHandle() {
  auto backend            = std::make_shared<FakeBackend>();
  auto options            = SmallPool(1);
  options.acquire_timeout = std::chrono::milliseconds(2000);
  auto pool               = std::make_shared<ConnectionPool>(FakeFactory(backend), options);

  auto lease = pool->Acquire();

  std::atomic<bool> acquired{false};
  std::thread       waiter([&] {
    auto conn = pool->Acquire();
    acquired  = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!acquired);
  lease.reset();
  waiter.join();
  assert(acquired);
}

void TestUnhealthyHandleIsDiscarded() {
  auto backend = std::make_shared<FakeBackend>();
  auto pool    = std::make_shared<ConnectionPool>(FakeFactory(backend), SmallPool(1));

  {
    auto lease = pool->Acquire();
    static_cast<FakeConnection*>(lease.get())->MarkUnhealthy();
  }
  assert(backend->closed == 1);
  assert(pool->Stats().total == 0);

  auto fresh = pool->Acquire();
  assert(backend->opened == 2);
}

void TestHandleReturnedMidTransactionIsDiscarded() {
  auto backend = std::make_shared<FakeBackend>();
  auto pool    = std::make_shared<ConnectionPool>(FakeFactory(backend), SmallPool(1));

  {
    auto lease = pool->Acquire();
    static_cast<FakeConnection*>(lease.get())->LeaveTransactionOpen();
  }
  assert(backend->closed == 1);
  assert(pool->Stats().idle == 0);
}

void TestCloseWaitsForOutstandingLease() {
  auto backend = std::make_shared<FakeBackend>();
  auto pool    = std::make_shared<ConnectionPool>(FakeFactory(backend), SmallPool(2));

  auto              lease = pool->Acquire();
  std::atomic<bool> closed{false};
  std::thread       closer([&] {
    pool->Close();
    closed = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!closed);
  assert(backend->closed == 0);

  lease.reset();
  closer.join();
  assert(closed);
  assert(backend->closed == 1);

  bool rejected = false;
  try {
    (void)pool->Acquire();
  } catch (const muse::util::InvalidState&) {
    rejected = true;
  }
  assert(rejected);
}

void TestMinConnectionsOpenedUpFront() {
  auto backend            = std::make_shared<FakeBackend>();
  auto options            = SmallPool(4);
  options.min_connections = 2;
  auto pool               = std::make_shared<ConnectionPool>(FakeFactory(backend), options);

  assert(backend->opened == 2);
  assert(pool->Stats().idle == 2);
}

void TestIdleConnectionsAboveMinAreEvicted() {
  auto backend            = std::make_shared<FakeBackend>();
  auto options            = SmallPool(3);
  options.min_connections = 1;
  options.idle_timeout    = std::chrono::milliseconds(30);
  auto pool               = std::make_shared<ConnectionPool>(FakeFactory(backend), options);

  {
    auto a = pool->Acquire();
    auto b = pool->Acquire();
    auto c = pool->Acquire();
    assert(pool->Stats().total == 3);
    assert(backend->opened == 3);
  }
  assert(pool->Stats().idle == 3);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (pool->Stats().total > 1 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  auto stats = pool->Stats();
  assert(stats.total == 1);
  assert(stats.idle == 1);
  assert(backend->closed == 2);

  // The floor holds across further sweeps.
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  assert(pool->Stats().total == 1);
  assert(backend->closed == 2);
}

} // namespace

int main() {
  TestAcquireBeyondMaxTimesOut();
  TestReleasedHandleIsReused();
  TestWaiterGetsReleasedHandle();
  TestUnhealthyHandleIsDiscarded();
  TestHandleReturnedMidTransactionIsDiscarded();
  TestCloseWaitsForOutstandingLease();
  TestMinConnectionsOpenedUpFront();
  TestIdleConnectionsAboveMinAreEvicted();

  std::cout << "muse_unit_connection_pool: pass\n";
  return 0;
}

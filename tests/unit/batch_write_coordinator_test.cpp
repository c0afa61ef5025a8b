#include "internal/batch/batch_write_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/events/event_bus.hpp"
#include "tests/support/fake_connection.hpp"

namespace {

using muse::batch::BatchOptions;
using muse::batch::BatchPersister;
using muse::batch::BatchWriteCoordinator;
using muse::testing::FakeBackend;
using muse::testing::FakeConnection;
using muse::testing::FakeFactory;

// Not a std::exception, so nothing inside the writer handles it.
struct FlushAborted {};

/*
  Stages every item on the fake connection. Items named "invalid" are
  rejected, and the first transient_failures calls fail the chunk.
*/
class RecordingPersister final : public BatchPersister<std::string> {
 public:
  std::string Name() const override {
    return "recording";
  }

  std::optional<muse::db::model::DomainEvent> Persist(muse::db::Connection& conn, const std::string& item) override {
    if (transient_failures > 0) {
      --transient_failures;
      throw muse::util::TransientStoreError("database is locked");
    }
    if (abort_next.exchange(false)) throw FlushAborted{};
    if (always_fail) throw std::runtime_error("disk full");
    if (item == "invalid") throw muse::util::ValidationError("invalid item");

    static_cast<FakeConnection&>(conn).Stage();
    ++persisted;

    if (!emit_events) return std::nullopt;
    muse::db::model::DomainEvent event;
    event.event_id     = item;
    event.event_type   = "item.saved";
    event.aggregate_id = item;
    return event;
  }

  std::atomic<int> transient_failures{0};
  std::atomic<int> persisted{0};
  std::atomic<bool> abort_next{false};
  bool             always_fail = false;
  bool             emit_events = false;
};

std::shared_ptr<muse::db::ConnectionPool> MakePool(const std::shared_ptr<FakeBackend>& backend) {
  muse::db::PoolOptions options;
  options.min_connections = 0;
  options.max_connections = 4;
  options.idle_timeout    = std::chrono::milliseconds(0);
  return std::make_shared<muse::db::ConnectionPool>(FakeFactory(backend), options);
}

BatchOptions QuietOptions() {
  BatchOptions options;
  options.batch_size               = 100;
  options.flush_interval           = std::chrono::hours(1);
  options.max_retries              = 3;
  options.chunk_retry.max_attempts = 3;
  options.chunk_retry.sleep        = [](std::chrono::milliseconds) {};
  return options;
}

std::vector<std::string> Items(int count) {
  std::vector<std::string> items;
  for (int i = 0; i < count; ++i) items.push_back("item-" + std::to_string(i));
  return items;
}

void TestSnapshotSplitsIntoBatchSizedChunks() {
  auto backend   = std::make_shared<FakeBackend>();
  auto persister = std::make_shared<RecordingPersister>();
  BatchWriteCoordinator<std::string> writer(MakePool(backend), persister, QuietOptions());

  auto futures = writer.AddMany(Items(250));
  writer.Flush();
  for (auto& future : futures) future.get();

  const auto stats = writer.Stats();
  assert(stats.chunks == 3);
  assert(stats.written == 250);
  assert(stats.rejected == 0);
  assert(stats.queued == 0);
  assert((backend->committed_sizes == std::vector<std::size_t>{100, 100, 50}));
}

void TestConcurrentChunksAllCommit() {
  auto backend        = std::make_shared<FakeBackend>();
  auto persister      = std::make_shared<RecordingPersister>();
  auto options        = QuietOptions();
  options.batch_size  = 10;
  options.concurrency = 3;
  BatchWriteCoordinator<std::string> writer(MakePool(backend), persister, options);

  auto futures = writer.AddMany(Items(95));
  writer.Flush();
  for (auto& future : futures) future.get();

  assert(writer.Stats().chunks == 10);
  assert(persister->persisted == 95);
}

void TestTimerFlushesPartialBatch() {
  auto backend           = std::make_shared<FakeBackend>();
  auto persister         = std::make_shared<RecordingPersister>();
  auto options           = QuietOptions();
  options.flush_interval = std::chrono::milliseconds(20);
  BatchWriteCoordinator<std::string> writer(MakePool(backend), persister, options);

  auto future = writer.Add("lonely");
  assert(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
  future.get();
  assert(writer.Stats().written == 1);
}

void TestTransientFailureIsRetriedInsideChunk() {
  auto backend                  = std::make_shared<FakeBackend>();
  auto persister                = std::make_shared<RecordingPersister>();
  persister->transient_failures = 2;
  BatchWriteCoordinator<std::string> writer(MakePool(backend), persister, QuietOptions());

  auto futures = writer.AddMany(Items(5));
  writer.Flush();
  for (auto& future : futures) future.get();

  assert(writer.Stats().chunks == 1);
  assert(backend->rollbacks == 2);
  assert(backend->commits == 1);
}

void TestInvalidItemIsRejectedAlone() {
  auto backend   = std::make_shared<FakeBackend>();
  auto persister = std::make_shared<RecordingPersister>();
  BatchWriteCoordinator<std::string> writer(MakePool(backend), persister, QuietOptions());

  auto good_a = writer.Add("a");
  auto bad    = writer.Add("invalid");
  auto good_b = writer.Add("b");
  writer.Close();

  good_a.get();
  good_b.get();

  bool rejected = false;
  try {
    bad.get();
  } catch (const muse::util::ValidationError&) {
    rejected = true;
  }
  assert(rejected);

  const auto stats = writer.Stats();
  assert(stats.rejected == 1);
  assert(stats.written == 2);
}

void TestPersistentFailureRejectedAfterMaxRetries() {
  auto backend           = std::make_shared<FakeBackend>();
  auto persister         = std::make_shared<RecordingPersister>();
  persister->always_fail = true;
  auto options           = QuietOptions();
  options.max_retries    = 2;
  BatchWriteCoordinator<std::string> writer(MakePool(backend), persister, options);

  auto futures = writer.AddMany(Items(3));
  writer.Close();

  for (auto& future : futures) {
    bool failed = false;
    try {
      future.get();
    } catch (const std::runtime_error& e) {
      failed = std::string(e.what()) == "disk full";
    }
    assert(failed);
  }

  const auto stats = writer.Stats();
  assert(stats.rejected == 3);
  assert(stats.written == 0);
  // first attempt plus max_retries flushes
  assert(backend->rollbacks == 3);
}

void TestEventsPublishedOnChunkConnection() {
  auto backend           = std::make_shared<FakeBackend>();
  auto persister         = std::make_shared<RecordingPersister>();
  persister->emit_events = true;
  auto bus               = std::make_shared<muse::events::EventBus>();

  std::atomic<int>  seen{0};
  std::atomic<bool> had_connection{true};
  bus->Use([&](const muse::events::DomainEvent&, const muse::events::PublishContext& context) {
    if (context.connection == nullptr || !context.connection->InTransaction()) had_connection = false;
  });
  auto unsubscribe = bus->Subscribe("item.saved", [&](const muse::events::DomainEvent&) { ++seen; });

  BatchWriteCoordinator<std::string> writer(MakePool(backend), persister, QuietOptions(), bus);
  auto                               futures = writer.AddMany(Items(4));
  writer.Flush();
  for (auto& future : futures) future.get();

  assert(seen == 4);
  assert(had_connection);
  unsubscribe();
}

void TestAddAfterCloseThrows() {
  auto backend   = std::make_shared<FakeBackend>();
  auto persister = std::make_shared<RecordingPersister>();
  BatchWriteCoordinator<std::string> writer(MakePool(backend), persister, QuietOptions());

  auto pending = writer.Add("last");
  writer.Close();
  pending.get();
  writer.Close();

  bool threw = false;
  try {
    (void)writer.Add("late");
  } catch (const muse::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestRejectedItemDoesNotSpendChunkMatesRetries() {
  auto backend        = std::make_shared<FakeBackend>();
  auto persister      = std::make_shared<RecordingPersister>();
  auto options        = QuietOptions();
  options.max_retries = 0;
  BatchWriteCoordinator<std::string> writer(MakePool(backend), persister, options);

  auto good_a = writer.Add("a");
  auto bad_a  = writer.Add("invalid");
  auto bad_b  = writer.Add("invalid");
  auto good_b = writer.Add("b");
  writer.Close();

  good_a.get();
  good_b.get();
  for (auto* bad : {&bad_a, &bad_b}) {
    bool rejected = false;
    try {
      bad->get();
    } catch (const muse::util::ValidationError&) {
      rejected = true;
    }
    assert(rejected);
  }

  const auto stats = writer.Stats();
  assert(stats.rejected == 2);
  assert(stats.written == 2);
}

void TestAbortedFlushLeavesWriterUsable() {
  auto backend          = std::make_shared<FakeBackend>();
  auto persister        = std::make_shared<RecordingPersister>();
  persister->abort_next = true;
  BatchWriteCoordinator<std::string> writer(MakePool(backend), persister, QuietOptions());

  auto lost    = writer.Add("a");
  bool aborted = false;
  try {
    writer.Flush();
  } catch (const FlushAborted&) {
    aborted = true;
  }
  assert(aborted);
  assert(!writer.Stats().flushing);

  bool broken = false;
  try {
    lost.get();
  } catch (const std::future_error&) {
    broken = true;
  }
  assert(broken);

  auto next = writer.Add("b");
  writer.Flush();
  next.get();
  writer.Close();
  assert(writer.Stats().written == 1);
  assert(backend->rollbacks == 1);
}

} // namespace

int main() {
  TestSnapshotSplitsIntoBatchSizedChunks();
  TestConcurrentChunksAllCommit();
  TestTimerFlushesPartialBatch();
  TestTransientFailureIsRetriedInsideChunk();
  TestInvalidItemIsRejectedAlone();
  TestPersistentFailureRejectedAfterMaxRetries();
  TestEventsPublishedOnChunkConnection();
  TestAddAfterCloseThrows();
  TestRejectedItemDoesNotSpendChunkMatesRetries();
  TestAbortedFlushLeavesWriterUsable();

  std::cout << "muse_unit_batch_write_coordinator: pass\n";
  return 0;
}

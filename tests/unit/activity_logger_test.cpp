#include "internal/autonomous/activity_logger.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/data_store.hpp"
#include "internal/events/event_bus.hpp"
#include "tests/support/sqlite_test_pool.hpp"

namespace {

using muse::autonomous::ActivityLogger;
using muse::model::LogCategory;
using muse::model::LogLevel;

constexpr const char* kSuite = "activity_logger_tests";

// Fixed wall clock, one day past the epoch.
muse::util::TimePoint FixedNow() {
  return muse::util::FromUnixMillis(86'400'000);
}

std::shared_ptr<muse::db::DataStore> MakeStore(const std::string& test_name) {
  muse::batch::BatchOptions options;
  options.batch_size               = 20;
  options.flush_interval           = std::chrono::milliseconds(10'000);
  options.chunk_retry.sleep        = [](std::chrono::milliseconds) {};
  auto pool                        = muse::testing::MakeSqlitePool(kSuite, test_name);
  return std::make_shared<muse::db::DataStore>(pool, std::make_shared<muse::events::EventBus>(), options);
}

void TestQuerySeesBufferedEntries() {
  auto           store = MakeStore("buffered");
  ActivityLogger logger(store, FixedNow);

  logger.Info(LogCategory::kSystem, "Autonomous mode started");
  logger.Warn(LogCategory::kResource, "System health check failed", std::nullopt, {{"cpu_usage", "93.0"}});
  logger.Error(LogCategory::kOperation, "Operation failed: timeout", std::string("op-7"));

  // The flush interval is far away; Query must still see all three.
  muse::db::model::LogFilter filter;
  auto                       entries = logger.Query(filter);
  assert(entries.size() == 3);

  for (const auto& entry : entries) {
    assert(!entry.id.empty());
    assert(entry.timestamp_ms == 86'400'000);
  }
}

void TestMetadataAndOperationIdRoundTrip() {
  auto           store = MakeStore("metadata");
  ActivityLogger logger(store, FixedNow);

  logger.Info(LogCategory::kQuality, "High quality plot saved", std::string("op-1"), {{"quality_score", "82"}, {"threshold", "65"}});
  logger.Info(LogCategory::kQuality, "character discarded due to low quality", std::string("op-2"));

  muse::db::model::LogFilter filter;
  filter.operation_id = "op-1";
  auto entries        = logger.Query(filter);

  assert(entries.size() == 1);
  assert(entries[0].message == "High quality plot saved");
  assert(entries[0].operation_id == std::optional<std::string>("op-1"));
  assert(entries[0].level == LogLevel::kInfo);
  assert(entries[0].category == LogCategory::kQuality);
  assert(entries[0].metadata.at("quality_score") == "82");
  assert(entries[0].metadata.at("threshold") == "65");
}

void TestLevelAndCategoryFilters() {
  auto           store = MakeStore("filters");
  ActivityLogger logger(store, FixedNow);

  logger.Info(LogCategory::kSystem, "a");
  logger.Warn(LogCategory::kSystem, "b");
  logger.Warn(LogCategory::kResource, "c");
  logger.Log(LogLevel::kDebug, LogCategory::kOperation, "d");

  muse::db::model::LogFilter warnings;
  warnings.level = LogLevel::kWarn;
  assert(logger.Query(warnings).size() == 2);

  muse::db::model::LogFilter system_warnings;
  system_warnings.level    = LogLevel::kWarn;
  system_warnings.category = LogCategory::kSystem;
  auto entries             = logger.Query(system_warnings);
  assert(entries.size() == 1);
  assert(entries[0].message == "b");

  muse::db::model::LogFilter limited;
  limited.limit = 2;
  assert(logger.Query(limited).size() == 2);
}

void TestSummaryCountsLevelsAndCategories() {
  auto           store = MakeStore("summary");
  ActivityLogger logger(store, FixedNow);

  logger.Info(LogCategory::kSystem, "started");
  logger.Info(LogCategory::kOperation, "Starting plot operation", std::string("op-1"));
  logger.Error(LogCategory::kOperation, "Operation failed: boom", std::string("op-1"));

  auto summary = logger.Summary(7);
  assert(summary.total == 3);
  assert(summary.by_level.at("info") == 2);
  assert(summary.by_level.at("error") == 1);
  assert(summary.by_category.at("operation") == 2);
  assert(summary.by_category.at("system") == 1);
}

void TestFlushPersistsForOtherReaders() {
  auto           store = MakeStore("flush");
  ActivityLogger logger(store, FixedNow);

  logger.Info(LogCategory::kSystem, "persisted");
  logger.Flush();

  muse::db::model::LogFilter filter;
  filter.text  = "persist";
  auto entries = store->QueryLogs(filter);
  assert(entries.size() == 1);
  assert(entries[0].message == "persisted");
}

void TestLogAfterCloseIsDropped() {
  auto           store = MakeStore("closed");
  ActivityLogger logger(store, FixedNow);

  logger.Info(LogCategory::kSystem, "before close");
  logger.Flush();
  store->Close();

  // The writer refuses new entries; the logger still reports to the process log.
  logger.Info(LogCategory::kSystem, "after close");
  logger.Flush();
}

} // namespace

int main() {
  TestQuerySeesBufferedEntries();
  TestMetadataAndOperationIdRoundTrip();
  TestLevelAndCategoryFilters();
  TestSummaryCountsLevelsAndCategories();
  TestFlushPersistsForOtherReaders();
  TestLogAfterCloseIsDropped();

  std::cout << "muse_unit_activity_logger: pass\n";
  return 0;
}

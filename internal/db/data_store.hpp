#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/batch/batch_write_coordinator.hpp"
#include "internal/db/model/activity_log_record.hpp"
#include "internal/db/model/config_record.hpp"
#include "internal/db/model/content_record.hpp"
#include "internal/db/model/operation_record.hpp"
#include "internal/db/unit_of_work.hpp"

namespace muse::db {

class ConnectionPool;

/*
  DataStore

  Non-transactional entry point of the persistence layer.

  Writes go through one BatchWriteCoordinator per record type and resolve
  when their chunk commits. Reads lease a pooled connection directly.
  Multi-statement work that must be atomic uses BeginUnitOfWork().

  The pool is shared and owned by the caller; Close() only drains and
  stops the writers.
*/
class DataStore {
 public:
  DataStore(std::shared_ptr<ConnectionPool>   pool,
            std::shared_ptr<events::EventBus> bus,
            batch::BatchOptions               options,
            observability::Metrics*           metrics = nullptr);
  ~DataStore();

  DataStore(const DataStore&)            = delete;
  DataStore& operator=(const DataStore&) = delete;

  std::future<void> SaveOperation(model::OperationRecord record);
  std::future<void> AppendLog(model::ActivityLogRecord record);
  std::future<void> SaveContent(model::ContentRecord record);

  std::optional<model::OperationRecord> GetOperation(const std::string& id);
  std::vector<model::OperationRecord>   ListOperations(int64_t since_ms, std::size_t limit);
  int64_t                               CountOperationsSince(int64_t since_ms);
  std::optional<model::ContentRecord>   GetContent(const std::string& id);

  // Flushes buffered log writes first so callers see their own entries.
  std::vector<model::ActivityLogRecord> QueryLogs(const model::LogFilter& filter);
  model::LogSummary                     LogSummary(int64_t since_ms);
  int64_t                               PurgeLogsOlderThan(int64_t cutoff_ms);

  std::optional<model::ConfigRecord> LatestConfig();

  std::vector<model::DomainEvent> EventsForAggregate(const std::string& aggregate_id);

  std::unique_ptr<UnitOfWork> BeginUnitOfWork();

  // Through the bus when there is one, else straight to the event log.
  // A non-null ambient connection is an open transaction to write on.
  void Publish(const model::DomainEvent& event, Connection* ambient = nullptr);

  void FlushAll();
  void Close();

  batch::BatchStats OperationWriterStats() const;
  batch::BatchStats LogWriterStats() const;
  batch::BatchStats ContentWriterStats() const;

 private:
  std::shared_ptr<ConnectionPool>   pool_;
  std::shared_ptr<events::EventBus> bus_;
  util::RetryOptions                unit_retry_;

  std::unique_ptr<batch::BatchWriteCoordinator<model::OperationRecord>>   operations_;
  std::unique_ptr<batch::BatchWriteCoordinator<model::ActivityLogRecord>> logs_;
  std::unique_ptr<batch::BatchWriteCoordinator<model::ContentRecord>>     content_;
};

} // namespace muse::db

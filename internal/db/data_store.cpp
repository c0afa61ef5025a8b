#include "data_store.hpp"

#include <utility>

#include "internal/batch/persisters.hpp"
#include "internal/db/pool/connection_pool.hpp"
#include "internal/db/repository/activity_log_repository.hpp"
#include "internal/db/repository/config_repository.hpp"
#include "internal/db/repository/content_repository.hpp"
#include "internal/db/repository/event_store.hpp"
#include "internal/db/repository/operation_repository.hpp"

namespace muse::db {

DataStore::DataStore(std::shared_ptr<ConnectionPool>   pool,
                     std::shared_ptr<events::EventBus> bus,
                     batch::BatchOptions               options,
                     observability::Metrics*           metrics)
    : pool_(std::move(pool)), bus_(std::move(bus)), unit_retry_(options.chunk_retry) {
  operations_ = std::make_unique<batch::BatchWriteCoordinator<model::OperationRecord>>(
      pool_, std::make_shared<batch::OperationPersister>(), options, bus_, metrics);
  logs_ = std::make_unique<batch::BatchWriteCoordinator<model::ActivityLogRecord>>(
      pool_, std::make_shared<batch::ActivityLogPersister>(), options, bus_, metrics);
  content_ = std::make_unique<batch::BatchWriteCoordinator<model::ContentRecord>>(
      pool_, std::make_shared<batch::ContentPersister>(), options, bus_, metrics);
}

DataStore::~DataStore() {
  Close();
}

std::future<void> DataStore::SaveOperation(model::OperationRecord record) {
  return operations_->Add(std::move(record));
}

std::future<void> DataStore::AppendLog(model::ActivityLogRecord record) {
  return logs_->Add(std::move(record));
}

std::future<void> DataStore::SaveContent(model::ContentRecord record) {
  return content_->Add(std::move(record));
}

std::optional<model::OperationRecord> DataStore::GetOperation(const std::string& id) {
  auto conn = pool_->Acquire();
  return repository::OperationRepository(*conn).Get(id);
}

std::vector<model::OperationRecord> DataStore::ListOperations(int64_t since_ms, std::size_t limit) {
  auto conn = pool_->Acquire();
  return repository::OperationRepository(*conn).ListRecent(since_ms, limit);
}

int64_t DataStore::CountOperationsSince(int64_t since_ms) {
  auto conn = pool_->Acquire();
  return repository::OperationRepository(*conn).CountSince(since_ms);
}

std::optional<model::ContentRecord> DataStore::GetContent(const std::string& id) {
  auto conn = pool_->Acquire();
  return repository::ContentRepository(*conn).Get(id);
}

std::vector<model::ActivityLogRecord> DataStore::QueryLogs(const model::LogFilter& filter) {
  logs_->Flush();
  auto conn = pool_->Acquire();
  return repository::ActivityLogRepository(*conn).Query(filter);
}

model::LogSummary DataStore::LogSummary(int64_t since_ms) {
  logs_->Flush();
  auto conn = pool_->Acquire();
  return repository::ActivityLogRepository(*conn).Summarize(since_ms);
}

int64_t DataStore::PurgeLogsOlderThan(int64_t cutoff_ms) {
  logs_->Flush();
  auto conn = pool_->Acquire();
  return repository::ActivityLogRepository(*conn).PurgeOlderThan(cutoff_ms);
}

std::optional<model::ConfigRecord> DataStore::LatestConfig() {
  auto conn = pool_->Acquire();
  return repository::ConfigRepository(*conn).Latest();
}

std::vector<model::DomainEvent> DataStore::EventsForAggregate(const std::string& aggregate_id) {
  auto conn = pool_->Acquire();
  return repository::EventStore(*conn).ByAggregate(aggregate_id);
}

std::unique_ptr<UnitOfWork> DataStore::BeginUnitOfWork() {
  auto uow = std::make_unique<UnitOfWork>(pool_, unit_retry_);
  uow->Begin();
  return uow;
}

void DataStore::Publish(const model::DomainEvent& event, Connection* ambient) {
  if (bus_) {
    bus_->Publish(event, events::PublishContext{ambient});
    return;
  }
  if (ambient) {
    repository::EventStore(*ambient).Append(event);
    return;
  }
  auto conn = pool_->Acquire();
  repository::EventStore(*conn).Append(event);
}

void DataStore::FlushAll() {
  operations_->Flush();
  logs_->Flush();
  content_->Flush();
}

void DataStore::Close() {
  operations_->Close();
  logs_->Close();
  content_->Close();
}

batch::BatchStats DataStore::OperationWriterStats() const {
  return operations_->Stats();
}

batch::BatchStats DataStore::LogWriterStats() const {
  return logs_->Stats();
}

batch::BatchStats DataStore::ContentWriterStats() const {
  return content_->Stats();
}

} // namespace muse::db

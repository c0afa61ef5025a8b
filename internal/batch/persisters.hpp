#pragma once

#include <optional>
#include <string>

#include "internal/batch/batch_persister.hpp"
#include "internal/db/model/activity_log_record.hpp"
#include "internal/db/model/content_record.hpp"
#include "internal/db/model/operation_record.hpp"

namespace muse::batch {

// Insert or update by id. A row already in a terminal status is left as is.
class OperationPersister final : public BatchPersister<db::model::OperationRecord> {
 public:
  std::string Name() const override {
    return "operations";
  }

  std::optional<db::model::DomainEvent> Persist(db::Connection& conn, const db::model::OperationRecord& record) override;
};

// Append-only; an id already present is a retried write and is skipped.
class ActivityLogPersister final : public BatchPersister<db::model::ActivityLogRecord> {
 public:
  std::string Name() const override {
    return "activity_logs";
  }

  std::optional<db::model::DomainEvent> Persist(db::Connection& conn, const db::model::ActivityLogRecord& record) override;
};

class ContentPersister final : public BatchPersister<db::model::ContentRecord> {
 public:
  std::string Name() const override {
    return "content";
  }

  std::optional<db::model::DomainEvent> Persist(db::Connection& conn, const db::model::ContentRecord& record) override;
};

} // namespace muse::batch

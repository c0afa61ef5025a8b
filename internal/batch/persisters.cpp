#include "persisters.hpp"

#include <utility>

#include "internal/db/repository/activity_log_repository.hpp"
#include "internal/db/repository/content_repository.hpp"
#include "internal/db/repository/operation_repository.hpp"
#include "internal/events/domain_event.hpp"
#include "internal/model/activity.hpp"
#include "internal/model/content_type.hpp"
#include "internal/model/operation_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace muse::batch {

namespace {

namespace v1 = muse::autonomous::v1;

const char* OperationEventType(v1::OperationStatus status) {
  switch (status) {
    case v1::OPERATION_STATUS_COMPLETED:
      return events::event_types::kOperationCompleted;
    case v1::OPERATION_STATUS_FAILED:
      return events::event_types::kOperationFailed;
    case v1::OPERATION_STATUS_CANCELLED:
      return events::event_types::kOperationCancelled;
    default:
      return events::event_types::kOperationUpdated;
  }
}

} // namespace

std::optional<db::model::DomainEvent> OperationPersister::Persist(db::Connection& conn, const db::model::OperationRecord& record) {
  if (record.id.empty()) throw util::ValidationError("operation id is empty");
  if (!model::IsKnown(record.type)) throw util::ValidationError("operation " + record.id + " has no content type");

  db::repository::OperationRepository repo(conn);

  const auto current = repo.GetStatus(record.id);
  if (!current) {
    repo.Insert(record);
  } else if (model::IsTerminal(*current)) {
    MUSE_LOG_DEBUG("operation already terminal; write skipped",
                   {observability::StringField("operation_id", record.id),
                    observability::StringField("stored", std::string(model::ToString(*current))),
                    observability::StringField("incoming", std::string(model::ToString(record.status)))});
    return std::nullopt;
  } else {
    repo.Update(record);
  }

  google::protobuf::Struct payload;
  util::SetString(&payload, "type", std::string(model::ToString(record.type)));
  util::SetString(&payload, "status", std::string(model::ToString(record.status)));
  if (record.project_id) util::SetString(&payload, "project_id", *record.project_id);
  if (record.error) util::SetString(&payload, "error", *record.error);
  if (record.result) {
    util::SetNumber(&payload, "quality_score", record.result->quality_score());
    util::SetBool(&payload, "saved", record.result->saved());
  }
  util::SetNumber(&payload, "duration_ms", static_cast<double>(record.metrics.duration_ms()));

  return events::MakeEvent(OperationEventType(record.status), record.id, events::aggregate_types::kOperation, std::move(payload));
}

std::optional<db::model::DomainEvent> ActivityLogPersister::Persist(db::Connection& conn, const db::model::ActivityLogRecord& record) {
  if (record.id.empty()) throw util::ValidationError("activity log id is empty");

  db::repository::ActivityLogRepository repo(conn);
  if (repo.Exists(record.id)) return std::nullopt;
  repo.Append(record);

  google::protobuf::Struct payload;
  util::SetString(&payload, "level", std::string(model::ToString(record.level)));
  util::SetString(&payload, "category", std::string(model::ToString(record.category)));
  util::SetString(&payload, "message", record.message);
  if (record.operation_id) util::SetString(&payload, "operation_id", *record.operation_id);

  return events::MakeEvent(events::event_types::kActivityLogged, record.id, events::aggregate_types::kActivity, std::move(payload),
                           record.operation_id);
}

std::optional<db::model::DomainEvent> ContentPersister::Persist(db::Connection& conn, const db::model::ContentRecord& record) {
  if (record.id.empty()) throw util::ValidationError("content id is empty");
  if (record.body.body_case() == v1::GeneratedContent::BODY_NOT_SET) {
    throw util::ValidationError("content " + record.id + " has no body");
  }

  db::repository::ContentRepository repo(conn);
  if (repo.Get(record.id)) {
    repo.Update(record);
  } else {
    repo.Insert(record);
  }

  google::protobuf::Struct payload;
  util::SetString(&payload, "type", std::string(model::ToString(record.type)));
  util::SetString(&payload, "operation_id", record.operation_id);
  util::SetNumber(&payload, "quality_score", record.quality_score);

  return events::MakeEvent(events::event_types::kContentSaved, record.id, events::aggregate_types::kContent, std::move(payload),
                           record.operation_id);
}

} // namespace muse::batch

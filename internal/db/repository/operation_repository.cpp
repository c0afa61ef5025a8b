#include "operation_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/model/content_type.hpp"
#include "internal/model/operation_state.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace muse::db::repository {

namespace {

std::string MetricsJson(const model::OperationRecord& r) {
  return util::ToJson(r.metrics);
}

sql::Param ResultJson(const model::OperationRecord& r) {
  if (!r.result) return nullptr;
  return util::ToJson(*r.result);
}

model::OperationRecord ReadOperation(const sql::Row& row) {
  model::OperationRecord r;
  r.id            = row.GetText(0);
  r.type          = muse::model::ParseContentType(row.GetText(1)).value_or(muse::autonomous::v1::CONTENT_TYPE_UNSPECIFIED);
  r.status        = muse::model::ParseOperationStatus(row.GetText(2)).value_or(muse::autonomous::v1::OPERATION_STATUS_UNSPECIFIED);
  r.project_id    = row.GetOptionalText(3);
  r.start_time_ms = row.GetInt64(4);
  r.end_time_ms   = row.GetOptionalInt64(5);
  if (!row.IsNull(6)) {
    util::FromJson(row.GetText(6), &r.metrics);
  }
  if (!row.IsNull(7)) {
    r.result = util::FromJson<muse::autonomous::v1::OperationResult>(row.GetText(7));
  }
  r.error = row.GetOptionalText(8);
  return r;
}

} // namespace

void OperationRepository::Insert(const model::OperationRecord& r) {
  ThrowIfError(conn_.Run(sql::INSERT_OPERATION,
                         {r.id, std::string(muse::model::ToString(r.type)), std::string(muse::model::ToString(r.status)),
                          sql::OptionalText(r.project_id), r.start_time_ms, sql::OptionalInt64(r.end_time_ms), MetricsJson(r), ResultJson(r),
                          sql::OptionalText(r.error), util::ToUnixMillis(util::Now())}),
               "insert operation " + r.id);
}

void OperationRepository::Update(const model::OperationRecord& r) {
  ThrowIfError(conn_.Run(sql::UPDATE_OPERATION,
                         {std::string(muse::model::ToString(r.status)), sql::OptionalInt64(r.end_time_ms), MetricsJson(r), ResultJson(r),
                          sql::OptionalText(r.error), util::ToUnixMillis(util::Now()), r.id}),
               "update operation " + r.id);
  if (conn_.Changes() == 0) {
    throw util::NotFound("operation not found: " + r.id);
  }
}

std::optional<model::OperationRecord> OperationRepository::Get(const std::string& id) {
  std::optional<model::OperationRecord> out;
  ThrowIfError(conn_.Query(sql::SELECT_OPERATION, {id}, [&](const sql::Row& row) { out = ReadOperation(row); }), "get operation " + id);
  return out;
}

std::optional<muse::autonomous::v1::OperationStatus> OperationRepository::GetStatus(const std::string& id) {
  std::optional<muse::autonomous::v1::OperationStatus> out;
  ThrowIfError(conn_.Query(sql::SELECT_OPERATION_STATUS, {id},
                           [&](const sql::Row& row) {
                             out = muse::model::ParseOperationStatus(row.GetText(0)).value_or(muse::autonomous::v1::OPERATION_STATUS_UNSPECIFIED);
                           }),
               "get operation status " + id);
  return out;
}

std::vector<model::OperationRecord> OperationRepository::ListRecent(int64_t since_ms, std::size_t limit) {
  std::vector<model::OperationRecord> out;
  ThrowIfError(conn_.Query(sql::SELECT_RECENT_OPERATIONS, {since_ms, static_cast<int64_t>(limit)},
                           [&](const sql::Row& row) { out.push_back(ReadOperation(row)); }),
               "list operations");
  return out;
}

int64_t OperationRepository::CountSince(int64_t since_ms) {
  int64_t count = 0;
  ThrowIfError(conn_.Query(sql::COUNT_OPERATIONS_SINCE, {since_ms}, [&](const sql::Row& row) { count = row.GetInt64(0); }), "count operations");
  return count;
}

} // namespace muse::db::repository

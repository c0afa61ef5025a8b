#include "activity_log_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/json.hpp"

namespace muse::db::repository {

namespace {

model::ActivityLogRecord ReadLog(const sql::Row& row) {
  model::ActivityLogRecord r;
  r.id           = row.GetText(0);
  r.timestamp_ms = row.GetInt64(1);
  r.level        = muse::model::ParseLogLevel(row.GetText(2)).value_or(muse::model::LogLevel::kInfo);
  r.category     = muse::model::ParseLogCategory(row.GetText(3)).value_or(muse::model::LogCategory::kSystem);
  r.message      = row.GetText(4);
  r.operation_id = row.GetOptionalText(5);
  if (!row.IsNull(6)) {
    r.metadata = util::StringMapFromJson(row.GetText(6));
  }
  return r;
}

} // namespace

void ActivityLogRepository::Append(const model::ActivityLogRecord& r) {
  sql::Param metadata = nullptr;
  if (!r.metadata.empty()) metadata = util::ToJson(r.metadata);

  ThrowIfError(conn_.Run(sql::INSERT_LOG,
                         {r.id, r.timestamp_ms, std::string(muse::model::ToString(r.level)), std::string(muse::model::ToString(r.category)), r.message,
                          sql::OptionalText(r.operation_id), metadata}),
               "append activity log");
}

bool ActivityLogRepository::Exists(const std::string& id) {
  bool found = false;
  ThrowIfError(conn_.Query(sql::SELECT_LOG_EXISTS, {id}, [&](const sql::Row&) { found = true; }), "activity log exists");
  return found;
}

std::vector<model::ActivityLogRecord> ActivityLogRepository::Query(const model::LogFilter& filter) {
  std::string query =
      "SELECT id,timestamp_ms,level,category,message,operation_id,metadata_json FROM autonomous_logs WHERE 1=1";
  sql::Params params;

  if (filter.level) {
    query += " AND level=?";
    params.emplace_back(std::string(muse::model::ToString(*filter.level)));
  }
  if (filter.category) {
    query += " AND category=?";
    params.emplace_back(std::string(muse::model::ToString(*filter.category)));
  }
  if (filter.operation_id) {
    query += " AND operation_id=?";
    params.emplace_back(*filter.operation_id);
  }
  if (filter.since_ms) {
    query += " AND timestamp_ms>=?";
    params.emplace_back(*filter.since_ms);
  }
  if (filter.text) {
    query += " AND message LIKE ?";
    params.emplace_back("%" + *filter.text + "%");
  }
  query += " ORDER BY timestamp_ms DESC LIMIT ?;";
  params.emplace_back(static_cast<int64_t>(filter.limit));

  std::vector<model::ActivityLogRecord> out;
  ThrowIfError(conn_.Query(query, params, [&](const sql::Row& row) { out.push_back(ReadLog(row)); }), "query activity log");
  return out;
}

model::LogSummary ActivityLogRepository::Summarize(int64_t since_ms) {
  model::LogSummary summary;
  ThrowIfError(conn_.Query(sql::SUMMARIZE_LOGS_BY_LEVEL, {since_ms},
                           [&](const sql::Row& row) {
                             const auto count            = row.GetInt64(1);
                             summary.by_level[row.GetText(0)] = count;
                             summary.total += count;
                           }),
               "summarize activity log");
  ThrowIfError(conn_.Query(sql::SUMMARIZE_LOGS_BY_CATEGORY, {since_ms},
                           [&](const sql::Row& row) { summary.by_category[row.GetText(0)] = row.GetInt64(1); }),
               "summarize activity log");
  return summary;
}

int64_t ActivityLogRepository::PurgeOlderThan(int64_t cutoff_ms) {
  ThrowIfError(conn_.Run(sql::DELETE_LOGS_BEFORE, {cutoff_ms}), "purge activity log");
  return conn_.Changes();
}

} // namespace muse::db::repository

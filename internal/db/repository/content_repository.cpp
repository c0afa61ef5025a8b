#include "content_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/model/content_type.hpp"
#include "internal/util/json.hpp"

namespace muse::db::repository {

namespace {

model::ContentRecord ReadContent(const sql::Row& row) {
  model::ContentRecord r;
  r.id            = row.GetText(0);
  r.type          = muse::model::ParseContentType(row.GetText(1)).value_or(muse::autonomous::v1::CONTENT_TYPE_UNSPECIFIED);
  r.operation_id  = row.GetText(2);
  r.project_id    = row.GetOptionalText(3);
  r.quality_score = row.GetInt(4);
  util::FromJson(row.GetText(5), &r.body);
  r.created_at_ms = row.GetInt64(6);
  return r;
}

} // namespace

void ContentRepository::Insert(const model::ContentRecord& r) {
  ThrowIfError(conn_.Run(sql::INSERT_CONTENT,
                         {r.id, std::string(muse::model::ToString(r.type)), r.operation_id, sql::OptionalText(r.project_id), r.quality_score,
                          util::ToJson(r.body), r.created_at_ms}),
               "insert content " + r.id);
}

void ContentRepository::Update(const model::ContentRecord& r) {
  ThrowIfError(conn_.Run(sql::UPDATE_CONTENT, {r.quality_score, util::ToJson(r.body), r.id}), "update content " + r.id);
}

std::optional<model::ContentRecord> ContentRepository::Get(const std::string& id) {
  std::optional<model::ContentRecord> out;
  ThrowIfError(conn_.Query(sql::SELECT_CONTENT, {id}, [&](const sql::Row& row) { out = ReadContent(row); }), "get content " + id);
  return out;
}

std::vector<model::ContentRecord> ContentRepository::ListByType(muse::autonomous::v1::ContentType type, std::size_t limit) {
  std::vector<model::ContentRecord> out;
  ThrowIfError(conn_.Query(sql::SELECT_CONTENT_BY_TYPE, {std::string(muse::model::ToString(type)), static_cast<int64_t>(limit)},
                           [&](const sql::Row& row) { out.push_back(ReadContent(row)); }),
               "list content");
  return out;
}

} // namespace muse::db::repository

#include "event_store.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/json.hpp"

namespace muse::db::repository {

namespace {

model::DomainEvent ReadEvent(const sql::Row& row) {
  model::DomainEvent e;
  e.sequence       = row.GetInt64(0);
  e.event_id       = row.GetText(1);
  e.event_type     = row.GetText(2);
  e.aggregate_id   = row.GetText(3);
  e.aggregate_type = row.GetText(4);
  util::FromJson(row.GetText(5), &e.payload);
  e.metadata.timestamp_ms   = row.GetInt64(6);
  e.metadata.correlation_id = row.GetOptionalText(7);
  e.metadata.causation_id   = row.GetOptionalText(8);
  return e;
}

} // namespace

void EventStore::Append(const model::DomainEvent& e) {
  ThrowIfError(conn_.Run(sql::INSERT_EVENT, {e.event_id, e.event_type, e.aggregate_id, e.aggregate_type, util::ToJson(e.payload), e.metadata.timestamp_ms,
                                             sql::OptionalText(e.metadata.correlation_id), sql::OptionalText(e.metadata.causation_id)}),
               "append event " + e.event_type);
}

std::vector<model::DomainEvent> EventStore::ByAggregate(const std::string& aggregate_id) {
  std::vector<model::DomainEvent> out;
  ThrowIfError(conn_.Query(sql::SELECT_EVENTS_BY_AGGREGATE, {aggregate_id}, [&](const sql::Row& row) { out.push_back(ReadEvent(row)); }),
               "events by aggregate");
  return out;
}

std::vector<model::DomainEvent> EventStore::ByType(const std::string& event_type, int64_t after_sequence, std::size_t limit) {
  std::vector<model::DomainEvent> out;
  ThrowIfError(conn_.Query(sql::SELECT_EVENTS_BY_TYPE, {event_type, after_sequence, static_cast<int64_t>(limit)},
                           [&](const sql::Row& row) { out.push_back(ReadEvent(row)); }),
               "events by type");
  return out;
}

int64_t EventStore::LastSequence() {
  int64_t last = 0;
  ThrowIfError(conn_.Query(sql::SELECT_LAST_EVENT_ID, {}, [&](const sql::Row& row) { last = row.IsNull(0) ? 0 : row.GetInt64(0); }), "last event id");
  return last;
}

} // namespace muse::db::repository

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/db/model/event_record.hpp"

namespace muse::db::repository {

/*
  Append-only domain event log.

  The log is the durable record of what happened; entity tables may be
  overwritten, this table never is.
*/
class EventStore {
 public:
  explicit EventStore(Connection& conn) : conn_(conn) {
  }

  void Append(const model::DomainEvent& event);

  std::vector<model::DomainEvent> ByAggregate(const std::string& aggregate_id);
  std::vector<model::DomainEvent> ByType(const std::string& event_type, int64_t after_sequence = 0, std::size_t limit = 1000);

  // 0 when the log is empty.
  int64_t LastSequence();

 private:
  Connection& conn_;
};

} // namespace muse::db::repository

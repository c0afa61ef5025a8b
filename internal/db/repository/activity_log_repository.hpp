#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/db/model/activity_log_record.hpp"

namespace muse::db::repository {

// autonomous_logs access bound to one connection. Rows are never updated.
class ActivityLogRepository {
 public:
  explicit ActivityLogRepository(Connection& conn) : conn_(conn) {
  }

  void Append(const model::ActivityLogRecord& record);
  bool Exists(const std::string& id);

  // Newest first.
  std::vector<model::ActivityLogRecord> Query(const model::LogFilter& filter);

  model::LogSummary Summarize(int64_t since_ms);

  // Returns the number of rows removed.
  int64_t PurgeOlderThan(int64_t cutoff_ms);

 private:
  Connection& conn_;
};

} // namespace muse::db::repository

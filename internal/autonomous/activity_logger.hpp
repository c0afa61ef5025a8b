#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/autonomous/pending_writes.hpp"
#include "internal/db/model/activity_log_record.hpp"
#include "internal/model/activity.hpp"
#include "internal/util/time.hpp"

namespace muse::db {
class DataStore;
}

namespace muse::autonomous {

/*
  Scheduler activity log.

  Every entry goes to the process log immediately and to autonomous_logs
  through the batched log writer. Query() flushes buffered entries first.
*/
class ActivityLogger {
 public:
  ActivityLogger(std::shared_ptr<db::DataStore> store, util::ClockFn clock = util::Now);

  void Log(model::LogLevel                           level,
           model::LogCategory                        category,
           const std::string&                        message,
           const std::optional<std::string>&         operation_id = std::nullopt,
           const std::map<std::string, std::string>& metadata     = {});

  void Info(model::LogCategory category, const std::string& message, const std::optional<std::string>& operation_id = std::nullopt,
            const std::map<std::string, std::string>& metadata = {}) {
    Log(model::LogLevel::kInfo, category, message, operation_id, metadata);
  }

  void Warn(model::LogCategory category, const std::string& message, const std::optional<std::string>& operation_id = std::nullopt,
            const std::map<std::string, std::string>& metadata = {}) {
    Log(model::LogLevel::kWarn, category, message, operation_id, metadata);
  }

  void Error(model::LogCategory category, const std::string& message, const std::optional<std::string>& operation_id = std::nullopt,
             const std::map<std::string, std::string>& metadata = {}) {
    Log(model::LogLevel::kError, category, message, operation_id, metadata);
  }

  std::vector<db::model::ActivityLogRecord> Query(const db::model::LogFilter& filter);
  db::model::LogSummary                     Summary(uint32_t days);

  // Waits for every entry handed to the writer so far.
  void Flush();

 private:
  std::shared_ptr<db::DataStore> store_;
  util::ClockFn                  clock_;
  PendingWrites                  pending_;
};

} // namespace muse::autonomous

#include "activity_logger.hpp"

#include <utility>

#include "internal/db/data_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace muse::autonomous {

namespace {

spdlog::level::level_enum ToSpdlog(model::LogLevel level) {
  switch (level) {
    case model::LogLevel::kDebug:
      return spdlog::level::debug;
    case model::LogLevel::kWarn:
      return spdlog::level::warn;
    case model::LogLevel::kError:
      return spdlog::level::err;
    default:
      return spdlog::level::info;
  }
}

constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;

} // namespace

ActivityLogger::ActivityLogger(std::shared_ptr<db::DataStore> store, util::ClockFn clock) : store_(std::move(store)), clock_(std::move(clock)) {
}

void ActivityLogger::Log(model::LogLevel                           level,
                         model::LogCategory                        category,
                         const std::string&                        message,
                         const std::optional<std::string>&         operation_id,
                         const std::map<std::string, std::string>& metadata) {
  std::vector<observability::LogField> fields;
  fields.push_back(observability::StringField("category", model::ToString(category)));
  if (operation_id) fields.push_back(observability::StringField("operation_id", *operation_id));
  for (const auto& [key, value] : metadata) fields.push_back(observability::StringField(key, value));
  observability::Log(ToSpdlog(level), message, fields);

  db::model::ActivityLogRecord record;
  record.id           = util::NewId();
  record.timestamp_ms = util::ToUnixMillis(clock_());
  record.level        = level;
  record.category     = category;
  record.message      = message;
  record.operation_id = operation_id;
  record.metadata     = metadata;

  try {
    pending_.Track(store_->AppendLog(std::move(record)), "activity log");
  } catch (const util::InvalidState& e) {
    MUSE_LOG_WARN("activity log entry dropped; writer closed", {observability::StringField("error", e.what())});
  }
}

std::vector<db::model::ActivityLogRecord> ActivityLogger::Query(const db::model::LogFilter& filter) {
  auto entries = store_->QueryLogs(filter);
  pending_.Drain();
  return entries;
}

db::model::LogSummary ActivityLogger::Summary(uint32_t days) {
  const auto since = util::ToUnixMillis(clock_()) - static_cast<int64_t>(days) * kDayMs;
  auto       summary = store_->LogSummary(since);
  pending_.Drain();
  return summary;
}

void ActivityLogger::Flush() {
  store_->FlushAll();
  pending_.Drain();
}

} // namespace muse::autonomous

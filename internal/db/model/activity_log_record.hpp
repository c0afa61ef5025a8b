#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "internal/model/activity.hpp"

namespace muse::db::model {

struct ActivityLogRecord {
  std::string                        id;
  int64_t                            timestamp_ms = 0;
  muse::model::LogLevel              level        = muse::model::LogLevel::kInfo;
  muse::model::LogCategory           category     = muse::model::LogCategory::kSystem;
  std::string                        message;
  std::optional<std::string>         operation_id;
  std::map<std::string, std::string> metadata;
};

struct LogFilter {
  std::size_t                             limit = 100;
  std::optional<muse::model::LogLevel>    level;
  std::optional<muse::model::LogCategory> category;
  std::optional<std::string>              operation_id;
  std::optional<int64_t>                  since_ms;
  // substring match on message
  std::optional<std::string>              text;
};

struct LogSummary {
  int64_t                        total = 0;
  std::map<std::string, int64_t> by_level;
  std::map<std::string, int64_t> by_category;
};

} // namespace muse::db::model

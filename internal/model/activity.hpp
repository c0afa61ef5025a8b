#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace muse::model {

enum class LogLevel : std::uint8_t {
  kDebug = 0,
  kInfo  = 1,
  kWarn  = 2,
  kError = 3,
};

enum class LogCategory : std::uint8_t {
  kOperation = 0,
  kQuality   = 1,
  kResource  = 2,
  kSystem    = 3,
};

constexpr std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
    default:
      return "error";
  }
}

constexpr std::string_view ToString(LogCategory category) {
  switch (category) {
    case LogCategory::kOperation:
      return "operation";
    case LogCategory::kQuality:
      return "quality";
    case LogCategory::kResource:
      return "resource";
    case LogCategory::kSystem:
    default:
      return "system";
  }
}

inline std::optional<LogLevel> ParseLogLevel(std::string_view name) {
  for (auto level : {LogLevel::kDebug, LogLevel::kInfo, LogLevel::kWarn, LogLevel::kError}) {
    if (ToString(level) == name) return level;
  }
  return std::nullopt;
}

inline std::optional<LogCategory> ParseLogCategory(std::string_view name) {
  for (auto category : {LogCategory::kOperation, LogCategory::kQuality, LogCategory::kResource, LogCategory::kSystem}) {
    if (ToString(category) == name) return category;
  }
  return std::nullopt;
}

} // namespace muse::model

#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace muse::runtime::config {
class RuntimeConfig;
}

namespace muse::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

void InitializeLogging(const muse::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});
void Log(spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& fields);

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace muse::observability

#define MUSE_LOG_DEBUG(message, ...) ::muse::observability::LogDebug((message), ##__VA_ARGS__)
#define MUSE_LOG_INFO(message, ...) ::muse::observability::LogInfo((message), ##__VA_ARGS__)
#define MUSE_LOG_WARN(message, ...) ::muse::observability::LogWarn((message), ##__VA_ARGS__)
#define MUSE_LOG_ERROR(message, ...) ::muse::observability::LogError((message), ##__VA_ARGS__)

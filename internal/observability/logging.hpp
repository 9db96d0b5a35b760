#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace ledcast::runtime::config {
class RuntimeConfig;
}

namespace ledcast::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const ledcast::runtime::config::RuntimeConfig& config);

// Default console logger for tools and tests that run without a config.
void InitializeDefaultLogging();
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace ledcast::observability

#define LEDCAST_LOG_DEBUG(message, ...) ::ledcast::observability::LogDebug((message), ##__VA_ARGS__)
#define LEDCAST_LOG_INFO(message, ...) ::ledcast::observability::LogInfo((message), ##__VA_ARGS__)
#define LEDCAST_LOG_WARN(message, ...) ::ledcast::observability::LogWarn((message), ##__VA_ARGS__)
#define LEDCAST_LOG_ERROR(message, ...) ::ledcast::observability::LogError((message), ##__VA_ARGS__)

#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace pwaudit::runtime::config {
class LoggingConfig;
}

namespace pwaudit::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the "pwaudit" logger as spdlog's default.

  Logs go to stderr; stdout is reserved for the status line.
  Safe to call again once the real configuration is known.
*/
void InitializeLogging(const pwaudit::runtime::config::LoggingConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

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

} // namespace pwaudit::observability

#define PWAUDIT_LOG_DEBUG(message, ...) ::pwaudit::observability::LogDebug((message), ##__VA_ARGS__)
#define PWAUDIT_LOG_INFO(message, ...) ::pwaudit::observability::LogInfo((message), ##__VA_ARGS__)
#define PWAUDIT_LOG_WARN(message, ...) ::pwaudit::observability::LogWarn((message), ##__VA_ARGS__)
#define PWAUDIT_LOG_ERROR(message, ...) ::pwaudit::observability::LogError((message), ##__VA_ARGS__)

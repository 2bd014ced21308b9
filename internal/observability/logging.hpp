#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace household::runtime::config {
class RuntimeConfig;
}

namespace household::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// "key=value key2=value2". Values holding spaces, quotes or '=' are quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

// spdlog level names plus "warning" and "error"; nullopt for anything else.
std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name);

/*
  Installs the "household" logger as spdlog's default.

  Level and pattern come from the environment (HOUSEHOLD_LOG_LEVEL,
  HOUSEHOLD_LOG_PATTERN) first, then from config. Output goes to colored
  stdout and, when logging.file is set, to that file as well. Calling it
  again replaces the logger.
*/
void InitializeLogging(const household::runtime::config::RuntimeConfig& config);
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

} // namespace household::observability

#define HOUSEHOLD_LOG_DEBUG(message, ...) ::household::observability::LogDebug((message), ##__VA_ARGS__)
#define HOUSEHOLD_LOG_INFO(message, ...) ::household::observability::LogInfo((message), ##__VA_ARGS__)
#define HOUSEHOLD_LOG_WARN(message, ...) ::household::observability::LogWarn((message), ##__VA_ARGS__)
#define HOUSEHOLD_LOG_ERROR(message, ...) ::household::observability::LogError((message), ##__VA_ARGS__)

#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace stackctl::runtime::config {
class RuntimeConfig;
}

namespace stackctl::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Installs a colored stdout logger with defaults; safe before config is loaded.
void InitializeLogging();
void InitializeLogging(const stackctl::runtime::config::RuntimeConfig& config);
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

/*
  Step completed as intended. Logged at info level with a distinct
  "ok" marker so operators can scan a stop/rollback run for results.
*/
void LogSuccess(std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace stackctl::observability

#define STACKCTL_LOG_DEBUG(message, ...) ::stackctl::observability::LogDebug((message), ##__VA_ARGS__)
#define STACKCTL_LOG_INFO(message, ...) ::stackctl::observability::LogInfo((message), ##__VA_ARGS__)
#define STACKCTL_LOG_SUCCESS(message, ...) ::stackctl::observability::LogSuccess((message), ##__VA_ARGS__)
#define STACKCTL_LOG_WARN(message, ...) ::stackctl::observability::LogWarn((message), ##__VA_ARGS__)
#define STACKCTL_LOG_ERROR(message, ...) ::stackctl::observability::LogError((message), ##__VA_ARGS__)

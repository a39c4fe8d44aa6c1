#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace rdash::config {
class LoggingConfig;
}

namespace rdash::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Where log lines go when logging.file is not configured.
enum class LogTarget {
  kStderr,      // one-shot CLI commands
  kDefaultFile, // the dashboard owns the terminal
};

// Throws util::ConfigError when RDASH_LOG_LEVEL or logging.level is not a
// spdlog level name.
void InitializeLogging(const rdash::config::LoggingConfig& config, LogTarget target);
void ShutdownLogging();

// trace, debug, info, warn/warning, err/error, critical, off.
spdlog::level::level_enum ParseLogLevel(std::string_view name);

// ~/.cache/render-dashboard/rdash.log
std::string DefaultLogPath();

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

} // namespace rdash::observability

#define RDASH_LOG_DEBUG(message, ...) ::rdash::observability::LogDebug((message), ##__VA_ARGS__)
#define RDASH_LOG_INFO(message, ...) ::rdash::observability::LogInfo((message), ##__VA_ARGS__)
#define RDASH_LOG_WARN(message, ...) ::rdash::observability::LogWarn((message), ##__VA_ARGS__)
#define RDASH_LOG_ERROR(message, ...) ::rdash::observability::LogError((message), ##__VA_ARGS__)

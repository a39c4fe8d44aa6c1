#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace rdash::observability {
namespace {

constexpr const char* kLoggerName = "rdash";

std::string ResolveLevel(const rdash::config::LoggingConfig& config) {
  if (const char* level = std::getenv("RDASH_LOG_LEVEL")) {
    return level;
  }

  if (!config.level().empty()) {
    return config.level();
  }

  return "info";
}

std::string ResolvePattern(const rdash::config::LoggingConfig& config) {
  if (const char* pattern = std::getenv("RDASH_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.pattern().empty()) {
    return config.pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::shared_ptr<spdlog::logger> MakeFileLogger(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  return spdlog::basic_logger_mt(kLoggerName, path);
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

spdlog::level::level_enum ParseLogLevel(std::string_view name) {
  const std::string level(name);
  const auto        parsed = spdlog::level::from_str(level);
  // from_str maps anything it does not know to off
  if (parsed == spdlog::level::off && level != "off") {
    throw rdash::util::ConfigError("Unknown log level: '" + level + "'. Valid levels: trace, debug, info, warn, error, critical, off");
  }
  return parsed;
}

std::string DefaultLogPath() {
  std::filesystem::path base;
  if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
    base = xdg;
  } else if (const char* home = std::getenv("HOME"); home && *home) {
    base = std::filesystem::path(home) / ".cache";
  } else {
    base = std::filesystem::temp_directory_path();
  }
  return (base / "render-dashboard" / "rdash.log").string();
}

void InitializeLogging(const rdash::config::LoggingConfig& config, LogTarget target) {
  const auto level = ParseLogLevel(ResolveLevel(config));
  spdlog::drop(kLoggerName);

  std::shared_ptr<spdlog::logger> logger;
  if (!config.file().empty()) {
    logger = MakeFileLogger(config.file());
  } else if (target == LogTarget::kDefaultFile) {
    logger = MakeFileLogger(DefaultLogPath());
  } else {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }

  logger->set_pattern(ResolvePattern(config));
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace rdash::observability

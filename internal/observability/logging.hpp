#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace trajectory::runtime::config {
class RuntimeConfig;
}

namespace trajectory::observability {

/*
  Structured log lines: "<message> key=value key=value ...". Values with
  spaces, quotes or '=' are double-quoted with backslash escapes.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

struct LoggingSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string               pattern{"%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"};
  bool                      include_trace_context{false};
  std::string               file; // empty: console only
};

/*
  Environment overrides config, config overrides defaults:
    TRAJECTORY_LOG_LEVEL, TRAJECTORY_LOG_PATTERN,
    TRAJECTORY_LOG_INCLUDE_TRACE_CONTEXT, TRAJECTORY_LOG_FILE

  Throws util::InvalidConfig for an unknown level name.
*/
LoggingSettings ResolveLoggingSettings(const trajectory::runtime::config::RuntimeConfig& config);

void InitializeLogging(const trajectory::runtime::config::RuntimeConfig& config);
void InitializeLogging(const LoggingSettings& settings);
void ShutdownLogging();

// Renders the text after the message; exposed for tests.
std::string FormatFields(std::initializer_list<LogField> fields);

/*
  Fields appended to every line logged by this thread while the scope
  lives. Scopes nest; inner fields follow outer ones.
*/
class LogContext {
 public:
  explicit LogContext(std::initializer_list<LogField> fields);
  ~LogContext();

  LogContext(const LogContext&)            = delete;
  LogContext& operator=(const LogContext&) = delete;

 private:
  std::size_t added_ = 0;
};

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

} // namespace trajectory::observability

#define TRAJECTORY_LOG_DEBUG(message, ...) ::trajectory::observability::LogDebug((message), ##__VA_ARGS__)
#define TRAJECTORY_LOG_INFO(message, ...) ::trajectory::observability::LogInfo((message), ##__VA_ARGS__)
#define TRAJECTORY_LOG_WARN(message, ...) ::trajectory::observability::LogWarn((message), ##__VA_ARGS__)
#define TRAJECTORY_LOG_ERROR(message, ...) ::trajectory::observability::LogError((message), ##__VA_ARGS__)

#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace trajectory::observability {
namespace {

constexpr const char* kLoggerName = "trajectory-tracer";

bool g_include_trace_context{false};

thread_local std::vector<LogField> t_context;

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw util::InvalidConfig("unknown log level: " + name);
  }
  return level;
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\\' || c == '\n' || c == '\t') {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& out, const std::string& value) {
  if (!NeedsQuoting(value)) {
    out += value;
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

void AppendField(std::string& out, const LogField& field) {
  if (!out.empty()) {
    out.push_back(' ');
  }
  out += field.key;
  out.push_back('=');
  AppendValue(out, field.value);
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

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

LoggingSettings ResolveLoggingSettings(const trajectory::runtime::config::RuntimeConfig& config) {
  const auto&     section = config.logging();
  LoggingSettings settings;

  if (const char* level = Env("TRAJECTORY_LOG_LEVEL")) {
    settings.level = ParseLevel(level);
  } else if (!section.level().empty()) {
    settings.level = ParseLevel(section.level());
  }

  if (const char* pattern = Env("TRAJECTORY_LOG_PATTERN")) {
    settings.pattern = pattern;
  } else if (!section.pattern().empty()) {
    settings.pattern = section.pattern();
  }

  if (const char* include = Env("TRAJECTORY_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include);
    settings.include_trace_context = value == "1" || value == "true";
  } else {
    settings.include_trace_context = section.include_trace_context();
  }

  if (const char* file = Env("TRAJECTORY_LOG_FILE")) {
    settings.file = file;
  } else {
    settings.file = section.file();
  }
  return settings;
}

void InitializeLogging(const trajectory::runtime::config::RuntimeConfig& config) {
  InitializeLogging(ResolveLoggingSettings(config));
}

void InitializeLogging(const LoggingSettings& settings) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!settings.file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file));
    } catch (const spdlog::spdlog_ex& e) {
      throw util::InvalidConfig("cannot open log file " + settings.file + ": " + e.what());
    }
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  if (auto logger = spdlog::default_logger()) {
    logger->flush();
  }
  spdlog::shutdown();
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    AppendField(out, field);
  }
  return out;
}

LogContext::LogContext(std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    t_context.push_back(field);
  }
  added_ = fields.size();
}

LogContext::~LogContext() {
  t_context.resize(t_context.size() - added_);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger();
  if (!logger || !logger->should_log(level)) {
    return;
  }

  std::string line(message);
  std::string rendered = FormatFields(fields);
  for (const auto& field : t_context) {
    AppendField(rendered, field);
  }
  if (g_include_trace_context) {
    auto parent = CurrentTraceParent();
    if (parent.valid()) {
      AppendField(rendered, {"trace_id", parent.trace_id});
      AppendField(rendered, {"span_id", parent.span_id});
    }
  }
  if (!rendered.empty()) {
    line.push_back(' ');
    line += rendered;
  }
  logger->log(level, "{}", line);
}

} // namespace trajectory::observability

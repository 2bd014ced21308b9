#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace household::observability {
namespace {

constexpr const char* kLoggerName     = "household";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::string_view ResolveLevel(const household::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("HOUSEHOLD_LOG_LEVEL")) return level;
  if (!config.logging().level().empty()) return config.logging().level();
  return "info";
}

std::string ResolvePattern(const household::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("HOUSEHOLD_LOG_PATTERN")) return pattern;
  if (!config.logging().pattern().empty()) return config.logging().pattern();
  return kDefaultPattern;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '"' || c == '=') return true;
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c == '\n' ? ' ' : c;
  }
  out += '"';
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

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out += ' ';
    out += field.key;
    out += '=';
    AppendValue(out, field.value);
  }
  return out;
}

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name) {
  if (name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "off") return spdlog::level::off;

  // from_str maps unknown names to off.
  const auto level = spdlog::level::from_str(std::string(name));
  if (level == spdlog::level::off) return std::nullopt;
  return level;
}

void InitializeLogging(const household::runtime::config::RuntimeConfig& config) {
  const auto level_name = ResolveLevel(config);
  const auto level      = ParseLogLevel(level_name);
  if (!level) {
    throw util::InvalidConfig("unknown log level '" + std::string(level_name) + "'");
  }

  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!config.logging().file().empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logging().file()));
    } catch (const spdlog::spdlog_ex& e) {
      throw util::InvalidConfig("cannot open logging.file: " + std::string(e.what()));
    }
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(*level);
  logger->flush_on(spdlog::level::warn);

  // Replaces and registers in one step.
  spdlog::set_default_logger(std::move(logger));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  // Null once ShutdownLogging() has run; late destructor logs are dropped.
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) return;

  if (fields.size() == 0) {
    logger->log(level, "{}", message);
    return;
  }
  logger->log(level, "{} {}", message, FormatFields(fields));
}

} // namespace household::observability

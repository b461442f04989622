#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "internal/util/errors.hpp"
#include "vault/config/v1/config.pb.h"

namespace vault::observability {
namespace {

constexpr const char* kLoggerName      = "vault";
constexpr const char* kAuditLoggerName = "vault-audit";
constexpr const char* kDefaultPattern  = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string FromEnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) return value;
  if (!configured.empty()) return configured;
  return fallback;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str maps anything unknown to off
  if (level == spdlog::level::off && name != "off") {
    throw util::ValidationError("unknown log level: " + name);
  }
  return level;
}

std::shared_ptr<spdlog::logger> GetOrCreate(const char* name) {
  auto logger = spdlog::get(name);
  if (!logger) logger = spdlog::stdout_color_mt(name);
  return logger;
}

bool NeedsQuotes(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '=' || c == '"') return true;
  }
  return false;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out += ' ';
    out += field.key;
    out += '=';
    if (!NeedsQuotes(field.value)) {
      out += field.value;
      continue;
    }
    out += '"';
    for (char c : field.value) {
      if (c == '"' || c == '\\') out += '\\';
      out += c;
    }
    out += '"';
  }
  return out;
}

void Write(spdlog::logger& logger, spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!logger.should_log(level)) return;
  if (fields.size() == 0) {
    logger.log(level, "{}", message);
    return;
  }
  logger.log(level, "{} {}", message, SerializeFields(fields));
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
  return {std::string(key), fmt::format("{:.4g}", value)};
}

LogField KeyField(std::string_view key, const identity::HashKey& value) {
  return {std::string(key), identity::ToHex(value)};
}

LogField TimeField(std::string_view key, util::TimePoint value) {
  return {std::string(key), util::FormatIso(value)};
}

void InitializeLogging(const vault::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(FromEnvOr("VAULT_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = FromEnvOr("VAULT_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  auto logger = GetOrCreate(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  auto audit = GetOrCreate(kAuditLoggerName);
  audit->set_pattern(pattern);
  audit->set_level(spdlog::level::info);
  audit->flush_on(spdlog::level::info);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  Write(*spdlog::default_logger_raw(), level, message, fields);
}

void LogAudit(std::string_view message, std::initializer_list<LogField> fields) {
  // before InitializeLogging the audit trail goes to the default logger
  if (auto audit = spdlog::get(kAuditLoggerName)) {
    Write(*audit, spdlog::level::info, message, fields);
    return;
  }
  Write(*spdlog::default_logger_raw(), spdlog::level::info, message, fields);
}

} // namespace vault::observability

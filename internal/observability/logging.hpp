#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/identity/hash_key.hpp"
#include "internal/util/time.hpp"

namespace vault::runtime::config {
class RuntimeConfig;
}

namespace vault::observability {

/*
  Structured key=value logging over spdlog.

  Two loggers are installed: the operational one (level from config or
  VAULT_LOG_LEVEL) and "vault-audit", which always records at info and
  flushes every line. LogAudit() writes to the latter so raising the
  operational level never drops audit records.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);
LogField KeyField(std::string_view key, const identity::HashKey& value);
LogField TimeField(std::string_view key, util::TimePoint value);

// Throws util::ValidationError for a level spdlog does not know.
void InitializeLogging(const vault::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

void LogAudit(std::string_view message, std::initializer_list<LogField> fields);

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

} // namespace vault::observability

#define VAULT_LOG_DEBUG(message, ...) ::vault::observability::LogDebug((message), ##__VA_ARGS__)
#define VAULT_LOG_INFO(message, ...) ::vault::observability::LogInfo((message), ##__VA_ARGS__)
#define VAULT_LOG_WARN(message, ...) ::vault::observability::LogWarn((message), ##__VA_ARGS__)
#define VAULT_LOG_ERROR(message, ...) ::vault::observability::LogError((message), ##__VA_ARGS__)
#define VAULT_LOG_AUDIT(message, ...) ::vault::observability::LogAudit((message), ##__VA_ARGS__)

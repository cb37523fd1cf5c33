#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace syncore::runtime::config {
class RuntimeConfig;
}

namespace syncore::observability {

/*
  Structured key=value logging on top of spdlog.

  Lines go to the console and, when logging.file_path is set, to a rotating
  file on the device. Values with spaces or quotes are quoted logfmt-style.
  Cached values and operation payloads are never logged verbatim: use
  RedactedField, which records only the size and a short digest.
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);
LogField RedactedField(std::string_view key, std::string_view value);

void InitializeLogging(const syncore::runtime::config::RuntimeConfig& config);
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

} // namespace syncore::observability

#define SYNCORE_LOG_DEBUG(message, ...) ::syncore::observability::LogDebug((message), ##__VA_ARGS__)
#define SYNCORE_LOG_INFO(message, ...) ::syncore::observability::LogInfo((message), ##__VA_ARGS__)
#define SYNCORE_LOG_WARN(message, ...) ::syncore::observability::LogWarn((message), ##__VA_ARGS__)
#define SYNCORE_LOG_ERROR(message, ...) ::syncore::observability::LogError((message), ##__VA_ARGS__)

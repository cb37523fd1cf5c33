#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/cache/cipher.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace syncore::observability {
namespace {

constexpr std::size_t kDefaultMaxFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kDefaultMaxFiles     = 3;

// SYNCORE_LOG_* environment variables win over the config file.
std::string EnvOr(const char* name, const std::string& configured, const std::string& fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool ResolveTraceContextEnabled(const syncore::runtime::config::LoggingConfig& logging) {
  if (const char* include_trace = std::getenv("SYNCORE_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return logging.include_trace_context();
}

bool g_include_trace_context{false};

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\\' || c == '\n' || c == '\t') return true;
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

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line += " trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
void AppendTraceContext(std::string&) {
}
#endif

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
  out << std::setprecision(4) << value;
  return {std::string(key), out.str()};
}

LogField RedactedField(std::string_view key, std::string_view value) {
  const std::string digest = cache::Sha256Hex(std::string(value));
  return {std::string(key), "<redacted bytes=" + std::to_string(value.size()) + " sha256=" + digest.substr(0, 12) + ">"};
}

void InitializeLogging(const syncore::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  const std::string file_path = EnvOr("SYNCORE_LOG_FILE", logging.file_path(), "");
  if (!file_path.empty()) {
    const std::size_t max_bytes = logging.max_file_bytes() == 0 ? kDefaultMaxFileBytes : logging.max_file_bytes();
    const std::size_t max_files = logging.max_files() == 0 ? kDefaultMaxFiles : logging.max_files();
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file_path, max_bytes, max_files));
  }

  spdlog::drop("syncore");
  auto logger = std::make_shared<spdlog::logger>("syncore", sinks.begin(), sinks.end());
  logger->set_pattern(EnvOr("SYNCORE_LOG_PATTERN", logging.pattern(), "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"));
  logger->set_level(spdlog::level::from_str(EnvOr("SYNCORE_LOG_LEVEL", logging.level(), "info")));
  spdlog::register_logger(logger);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line += field.key;
    line.push_back('=');
    AppendValue(line, field.value);
  }
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace syncore::observability

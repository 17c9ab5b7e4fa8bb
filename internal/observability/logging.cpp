#include "internal/observability/logging.hpp"

#include <absl/strings/escaping.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>
#include <string>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace rulebook::observability {
namespace {

constexpr const char* kLoggerName     = "rulebook-ingest";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

bool g_include_trace_context{false};

// Environment wins over config, config wins over the built-in default.
std::string Resolve(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool EnvFlag(const char* name, bool fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr) {
    return fallback;
  }
  const std::string flag(value);
  return flag == "1" || flag == "true";
}

void AppendField(std::string& line, const LogField& field) {
  line.push_back(' ');
  line += field.key;
  line.push_back('=');
  if (field.value.find(' ') == std::string::npos) {
    line += field.value;
    return;
  }
  line.push_back('"');
  line += field.value;
  line.push_back('"');
}

#ifdef ENABLE_OTEL
void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[opentelemetry::trace::TraceId::kSize];
  uint8_t span_bytes[opentelemetry::trace::SpanId::kSize];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  line += " trace_id=";
  line += absl::BytesToHexString(std::string_view(reinterpret_cast<const char*>(trace_bytes), sizeof(trace_bytes)));
  line += " span_id=";
  line += absl::BytesToHexString(std::string_view(reinterpret_cast<const char*>(span_bytes), sizeof(span_bytes)));
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
  out << value;
  return {std::string(key), out.str()};
}

void InitializeLogging(const rulebook::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(Resolve("RULEBOOK_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Resolve("RULEBOOK_LOG_LEVEL", logging.level(), kDefaultLevel)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context = EnvFlag("RULEBOOK_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context());
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger();
  if (!logger || !logger->should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  AppendTraceContext(line);
  logger->log(level, line);
}

} // namespace rulebook::observability

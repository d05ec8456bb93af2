#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace waveq::observability {
namespace {

constexpr const char* kLoggerName     = "waveq-engine";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

bool g_include_trace_context{false};

// Environment overrides the config file.
std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool TraceContextEnabled(const waveq::runtime::config::LoggingConfig& logging) {
  if (const char* flag = std::getenv("WAVEQ_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(flag);
    return value == "1" || value == "true";
  }
  return logging.include_trace_context();
}

std::vector<spdlog::sink_ptr> BuildSinks(const waveq::runtime::config::LoggingConfig& logging) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  const auto file = EnvOr("WAVEQ_LOG_FILE", logging.file(), "");
  if (!file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
  }
  return sinks;
}

#ifdef ENABLE_OTEL
template <std::size_t N>
void AppendHex(std::ostringstream& out, const uint8_t (&bytes)[N]) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (auto b : bytes) {
    out << kHex[(b >> 4) & 0x0F] << kHex[b & 0x0F];
  }
}

void AppendTraceContext(std::ostringstream& out) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid() || !context.trace_id().IsValid() || !context.span_id().IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  out << " trace_id=";
  AppendHex(out, trace_bytes);
  out << " span_id=";
  AppendHex(out, span_bytes);
}
#else
void AppendTraceContext(std::ostringstream&) {}
#endif

// Values containing spaces are quoted so the key=value stream stays parseable.
void AppendField(std::ostringstream& out, const LogField& field) {
  out << ' ' << field.key << '=';
  if (field.value.find(' ') == std::string::npos) {
    out << field.value;
  } else {
    out << '"' << field.value << '"';
  }
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField RequestField(std::string_view request_id) {
  return StringField("request_id", request_id.empty() ? std::string_view("-") : request_id);
}

void InitializeLogging(const waveq::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  spdlog::drop(kLoggerName);
  auto sinks  = BuildSinks(logging);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(EnvOr("WAVEQ_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("WAVEQ_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = TraceContextEnabled(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::ostringstream line;
  line << message;
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  AppendTraceContext(line);
  spdlog::log(level, "{}", line.str());
}

} // namespace waveq::observability

#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace ledcast::observability {
namespace {

using ledcast::runtime::config::LoggingConfig;

constexpr const char* kLoggerName          = "ledcast";
constexpr const char* kDefaultPattern      = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
constexpr uint64_t    kDefaultFileMaxBytes = 5 * 1024 * 1024;
constexpr uint32_t    kDefaultFileMaxFiles = 3;

bool g_include_trace_context{false};

// Environment wins over the config file, the config file over the default.
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value && *value) return value;
  return configured.empty() ? fallback : configured;
}

bool TraceContextEnabled(const LoggingConfig& logging) {
  if (const char* include_trace = std::getenv("LEDCAST_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    return value == "1" || value == "true";
  }
  return logging.include_trace_context();
}

std::vector<spdlog::sink_ptr> BuildSinks(const LoggingConfig& logging) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  const auto file = Setting("LEDCAST_LOG_FILE", logging.file(), "");
  if (!file.empty()) {
    const auto max_bytes = logging.file_max_bytes() ? logging.file_max_bytes() : kDefaultFileMaxBytes;
    const auto max_files = logging.file_max_files() ? logging.file_max_files() : kDefaultFileMaxFiles;
    // spdlog throws spdlog_ex when the file cannot be opened
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, static_cast<std::size_t>(max_bytes), max_files));
  }
  return sinks;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  for (const auto& field : fields) {
    if (out.tellp() > 0) out << ' ';
    out << field.key << '=';
    // quoted when it holds a space
    if (field.value.find(' ') != std::string::npos) {
      out << '"' << field.value << '"';
    } else {
      out << field.value;
    }
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) return {};

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return {};

  const auto context = span->GetContext();
  if (!context.IsValid() || !context.trace_id().IsValid() || !context.span_id().IsValid()) return {};

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
std::string TraceContextFields() {
  return {};
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

void InitializeLogging(const ledcast::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  spdlog::drop(kLoggerName);
  auto sinks  = BuildSinks(logging);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(Setting("LEDCAST_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("LEDCAST_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);

  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = TraceContextEnabled(logging);
}

void InitializeDefaultLogging() {
  InitializeLogging(ledcast::runtime::config::RuntimeConfig{});
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto line = SerializeFields(fields);
  if (auto trace = TraceContextFields(); !trace.empty()) {
    if (!line.empty()) line.push_back(' ');
    line += trace;
  }

  if (line.empty()) {
    spdlog::log(level, "{}", message);
  } else {
    spdlog::log(level, "{} {}", message, line);
  }
}

} // namespace ledcast::observability

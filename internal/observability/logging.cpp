#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <stdexcept>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef WARRANTY_ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace warranty::observability {
namespace {

constexpr const char* kLoggerName     = "warranty-core";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_trace_context = false;

// Environment wins over the config file.
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env)) return value;
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off.
  if (level == spdlog::level::off && name != "off") {
    throw std::runtime_error("Invalid configuration: logging.level '" + name + "' is not a log level");
  }
  return level;
}

void AppendTraceContext(fmt::memory_buffer& line) {
#ifdef WARRANTY_ENABLE_OTEL
  if (!g_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;
  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  char trace_hex[32];
  char span_hex[16];
  context.trace_id().ToLowerBase16(trace_hex);
  context.span_id().ToLowerBase16(span_hex);
  fmt::format_to(std::back_inserter(line), " trace_id={} span_id={}", std::string_view(trace_hex, sizeof(trace_hex)),
                 std::string_view(span_hex, sizeof(span_hex)));
#else
  (void)line;
#endif
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

void InitializeLogging(const warranty::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();
  const auto  level   = ParseLevel(Setting("WARRANTY_LOG_LEVEL", logging.level(), "info"));

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(Setting("WARRANTY_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (const char* env = std::getenv("WARRANTY_LOG_INCLUDE_TRACE_CONTEXT")) {
    g_trace_context = std::string_view(env) == "1" || std::string_view(env) == "true";
  } else {
    g_trace_context = logging.include_trace_context();
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  fmt::memory_buffer line;
  fmt::format_to(std::back_inserter(line), "{}", message);
  for (const auto& field : fields) {
    // Values with spaces are quoted so key=value pairs stay splittable.
    if (field.value.find(' ') != std::string::npos) {
      fmt::format_to(std::back_inserter(line), " {}=\"{}\"", field.key, field.value);
    } else {
      fmt::format_to(std::back_inserter(line), " {}={}", field.key, field.value);
    }
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace warranty::observability

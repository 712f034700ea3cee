#include "internal/observability/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace vodbridge::observability {
namespace {

constexpr const char* kLoggerName     = "vodbridge";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct LogSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string               pattern{kDefaultPattern};
  bool                      include_trace_context{false};
};

// Environment first, then config, then built-in defaults.
LogSettings ResolveSettings(const vodbridge::runtime::config::RuntimeConfig& config) {
  LogSettings settings;

  std::string level = config.logging().level();
  if (const char* env = std::getenv("VODBRIDGE_LOG_LEVEL")) {
    level = env;
  }
  if (!level.empty()) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    settings.level = (parsed == spdlog::level::off && level != "off") ? spdlog::level::info : parsed;
  }

  if (const char* env = std::getenv("VODBRIDGE_LOG_PATTERN")) {
    settings.pattern = env;
  } else if (!config.logging().pattern().empty()) {
    settings.pattern = config.logging().pattern();
  }

  if (const char* env = std::getenv("VODBRIDGE_LOG_INCLUDE_TRACE_CONTEXT")) {
    settings.include_trace_context = std::string(env) == "1" || std::string(env) == "true";
  } else {
    settings.include_trace_context = config.logging().include_trace_context();
  }

  return settings;
}

bool g_include_trace_context{false};

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') {
      return true;
    }
  }
  return false;
}

// logfmt: key=value, values with spaces or quotes are quoted and escaped.
void AppendField(std::string* out, const LogField& field) {
  if (!out->empty()) {
    out->push_back(' ');
  }
  out->append(field.key);
  out->push_back('=');

  if (!NeedsQuoting(field.value)) {
    out->append(field.value);
    return;
  }

  out->push_back('"');
  for (char c : field.value) {
    switch (c) {
      case '"':
        out->append("\\\"");
        break;
      case '\\':
        out->append("\\\\");
        break;
      case '\n':
        out->append("\\n");
        break;
      default:
        out->push_back(c);
    }
  }
  out->push_back('"');
}

#ifdef ENABLE_OTEL
void AppendHex(std::string* out, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    out->push_back(kHex[(data[i] >> 4) & 0x0F]);
    out->push_back(kHex[data[i] & 0x0F]);
  }
}

void AppendTraceContext(std::string* out) {
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

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  if (!out->empty()) {
    out->push_back(' ');
  }
  out->append("trace_id=");
  AppendHex(out, trace_bytes, sizeof(trace_bytes));
  out->append(" span_id=");
  AppendHex(out, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string*) {
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
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return {std::string(key), buffer};
}

void InitializeLogging(const vodbridge::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  // stdout belongs to the CLI; diagnostics go to stderr
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string context;
  for (const auto& field : fields) {
    AppendField(&context, field);
  }
  AppendTraceContext(&context);

  if (context.empty()) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, context);
}

} // namespace vodbridge::observability

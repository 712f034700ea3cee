#include "internal/observability/telemetry.hpp"

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

namespace vodbridge::observability {

namespace {

std::string Env(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

bool EnvTrue(const char* name) {
  const auto value = Env(name);
  return value == "true" || value == "TRUE" || value == "1";
}

std::string DefaultEndpoint(bool http, Signal signal) {
  if (!http) {
    return "localhost:4317";
  }
  return signal == Signal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

OtlpSettings ResolveOtlpSettings(const vodbridge::runtime::config::RuntimeConfig& config, Signal signal) {
  const auto& observability = config.observability();

  OtlpSettings settings;
  settings.enabled = signal == Signal::kTraces ? observability.tracing_enabled() : observability.metrics_enabled();
  if (EnvTrue("OTEL_SDK_DISABLED")) {
    settings.enabled = false;
  }

  settings.http = observability.transport() == vodbridge::runtime::config::OTLP_TRANSPORT_HTTP;

  settings.endpoint = observability.otlp_endpoint();
  if (settings.endpoint.empty()) {
    settings.endpoint = Env(signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  }
  if (settings.endpoint.empty()) {
    settings.endpoint = Env("OTEL_EXPORTER_OTLP_ENDPOINT");
  }
  if (settings.endpoint.empty()) {
    settings.endpoint = DefaultEndpoint(settings.http, signal);
  }

  if (auto name = Env("OTEL_SERVICE_NAME"); !name.empty()) {
    settings.service_name = name;
  }

  if (auto interval = Env("OTEL_METRIC_EXPORT_INTERVAL"); !interval.empty()) {
    char*      end = nullptr;
    const long ms  = std::strtol(interval.c_str(), &end, 10);
    if (end != interval.c_str() && *end == '\0' && ms > 0) {
      settings.export_interval = std::chrono::milliseconds(ms);
    }
  }

  return settings;
}

} // namespace vodbridge::observability

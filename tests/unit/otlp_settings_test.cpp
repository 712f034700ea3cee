#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/telemetry.hpp"

namespace {

using vodbridge::observability::ResolveOtlpSettings;
using vodbridge::observability::Signal;

void ClearEnvironment() {
  for (const char* name : {"OTEL_SDK_DISABLED", "OTEL_EXPORTER_OTLP_ENDPOINT", "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT",
                           "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_SERVICE_NAME", "OTEL_METRIC_EXPORT_INTERVAL"}) {
    unsetenv(name);
  }
}

void TestDisabledByDefault() {
  ClearEnvironment();
  const auto config = vodbridge::config::ConfigLoader::Defaults();

  assert(!ResolveOtlpSettings(config, Signal::kTraces).enabled);
  assert(!ResolveOtlpSettings(config, Signal::kMetrics).enabled);
  assert(ResolveOtlpSettings(config, Signal::kTraces).service_name == "vodbridge");
}

void TestCollectorDefaultsPerTransport() {
  ClearEnvironment();
  auto config = vodbridge::config::ConfigLoader::Defaults();
  config.mutable_observability()->set_tracing_enabled(true);
  config.mutable_observability()->set_metrics_enabled(true);

  const auto grpc_traces = ResolveOtlpSettings(config, Signal::kTraces);
  assert(grpc_traces.enabled);
  assert(!grpc_traces.http);
  assert(grpc_traces.endpoint == "localhost:4317");

  config.mutable_observability()->set_transport(vodbridge::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(ResolveOtlpSettings(config, Signal::kTraces).endpoint == "http://localhost:4318/v1/traces");
  assert(ResolveOtlpSettings(config, Signal::kMetrics).endpoint == "http://localhost:4318/v1/metrics");
}

void TestEnvironmentPrecedence() {
  ClearEnvironment();
  auto config = vodbridge::config::ConfigLoader::Defaults();
  config.mutable_observability()->set_metrics_enabled(true);

  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "collector:4317", 1);
  assert(ResolveOtlpSettings(config, Signal::kMetrics).endpoint == "collector:4317");

  setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "metrics:4317", 1);
  assert(ResolveOtlpSettings(config, Signal::kMetrics).endpoint == "metrics:4317");
  assert(ResolveOtlpSettings(config, Signal::kTraces).endpoint == "collector:4317");

  config.mutable_observability()->set_otlp_endpoint("configured:4317");
  assert(ResolveOtlpSettings(config, Signal::kMetrics).endpoint == "configured:4317");

  setenv("OTEL_SERVICE_NAME", "vodbridge-test", 1);
  setenv("OTEL_METRIC_EXPORT_INTERVAL", "250", 1);
  const auto settings = ResolveOtlpSettings(config, Signal::kMetrics);
  assert(settings.service_name == "vodbridge-test");
  assert(settings.export_interval == std::chrono::milliseconds(250));

  setenv("OTEL_METRIC_EXPORT_INTERVAL", "soon", 1);
  assert(ResolveOtlpSettings(config, Signal::kMetrics).export_interval == std::chrono::milliseconds(5000));

  setenv("OTEL_SDK_DISABLED", "true", 1);
  assert(!ResolveOtlpSettings(config, Signal::kMetrics).enabled);

  ClearEnvironment();
}

} // namespace

int main() {
  TestDisabledByDefault();
  TestCollectorDefaultsPerTransport();
  TestEnvironmentPrecedence();

  std::cout << "vodbridge_unit_otlp_settings: pass\n";
  return 0;
}

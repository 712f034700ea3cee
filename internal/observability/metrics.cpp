#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <initializer_list>
#include <utility>

#include "config/config.pb.h"

namespace vodbridge::observability {

namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using Attributes = std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;

template <typename T>
using Instrument = opentelemetry::nostd::shared_ptr<T>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint = settings.endpoint;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// opentelemetry-cpp changed AddMetricReader from shared_ptr to unique_ptr.
void AttachReader(sdkmetrics::MeterProvider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

const char* Outcome(bool ok) {
  return ok ? "ok" : "error";
}

} // namespace

struct Metrics::Instruments {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  Instrument<metrics_api::Counter<std::uint64_t>> content_requests;
  Instrument<metrics_api::Histogram<double>>      content_latency_ms;
  Instrument<metrics_api::Counter<std::uint64_t>> cache_lookups;
  Instrument<metrics_api::Counter<std::uint64_t>> backend_selections;
  Instrument<metrics_api::Counter<std::uint64_t>> preflight_evaluations;
  Instrument<metrics_api::Histogram<double>>      diagnostics_run_ms;
};

bool InitializeMetrics(const vodbridge::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveOtlpSettings(config, Signal::kMetrics);
  if (!settings.enabled) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = settings.export_interval;
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(settings), reader_options);

  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", settings.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), opentelemetry::sdk::resource::Resource::Create(attrs));
  AttachReader(*g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// Instruments bind to whichever provider is installed on first use, so
// InitializeMetrics must run before the first request.
Metrics::Metrics() : instruments_(std::make_unique<Instruments>()) {
  auto& m = *instruments_;
  m.meter = metrics_api::Provider::GetMeterProvider()->GetMeter("vodbridge");

  m.content_requests      = m.meter->CreateUInt64Counter("vodbridge.content.requests", "Content requests by route and outcome", "1");
  m.content_latency_ms    = m.meter->CreateDoubleHistogram("vodbridge.content.latency_ms", "Content request latency", "ms");
  m.cache_lookups         = m.meter->CreateUInt64Counter("vodbridge.cache.lookups", "Cache lookups by route and result", "1");
  m.backend_selections    = m.meter->CreateUInt64Counter("vodbridge.backend.selections", "Backend selection attempts", "1");
  m.preflight_evaluations = m.meter->CreateUInt64Counter("vodbridge.preflight.evaluations", "Preflight evaluations by readiness", "1");
  m.diagnostics_run_ms    = m.meter->CreateDoubleHistogram("vodbridge.diagnostics.run_ms", "Home view build time per diagnostics run", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordContentRequest(std::string_view route, bool ok, double latency_ms) {
  const std::string route_name(route);
  instruments_->content_requests->Add(1, Attributes{{"route", route_name}, {"outcome", Outcome(ok)}}, opentelemetry::context::Context{});
  instruments_->content_latency_ms->Record(latency_ms, Attributes{{"route", route_name}}, opentelemetry::context::Context{});
}

void Metrics::RecordCacheLookup(std::string_view route, bool hit) {
  instruments_->cache_lookups->Add(1, Attributes{{"route", std::string(route)}, {"result", hit ? "hit" : "miss"}}, opentelemetry::context::Context{});
}

void Metrics::RecordBackendSelection(std::string_view strategy, bool ok) {
  instruments_->backend_selections->Add(1, Attributes{{"strategy", std::string(strategy)}, {"outcome", Outcome(ok)}}, opentelemetry::context::Context{});
}

void Metrics::RecordPreflight(bool ready) {
  instruments_->preflight_evaluations->Add(1, Attributes{{"ready", ready}}, opentelemetry::context::Context{});
}

void Metrics::ObserveDiagnosticsRun(bool warm, double total_ms) {
  instruments_->diagnostics_run_ms->Record(total_ms, Attributes{{"warm", warm}}, opentelemetry::context::Context{});
}

} // namespace vodbridge::observability

#endif

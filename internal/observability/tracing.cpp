#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace vodbridge::observability {

namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::mutex                                          g_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint = settings.endpoint;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_tracer;
}

} // namespace

bool InitializeTracing(const vodbridge::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveOtlpSettings(config, Signal::kTraces);
  if (!settings.enabled) {
    ShutdownTracing();
    return false;
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(settings), sdktrace::BatchSpanProcessorOptions{});
  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", settings.service_name}};
  auto resource = opentelemetry::sdk::resource::Resource::Create(attrs);

  std::shared_ptr<sdktrace::TracerProvider> provider(sdktrace::TracerProviderFactory::Create(std::move(processor), resource));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));

  std::lock_guard<std::mutex> lock(g_mutex);
  g_provider = provider;
  g_tracer   = provider->GetTracer("vodbridge");
  return true;
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    std::lock_guard<std::mutex> lock(g_mutex);
    provider = std::move(g_provider);
    g_tracer = nullptr;
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

struct TraceSpan::State {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit State(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

TraceSpan::TraceSpan(std::string_view name) {
  auto tracer = CurrentTracer();
  if (tracer) {
    state_ = std::make_unique<State>(tracer->StartSpan(std::string(name)));
  }
}

TraceSpan::~TraceSpan() {
  if (state_) {
    state_->span->End();
  }
}

void TraceSpan::Tag(std::string_view key, std::string_view value) {
  if (state_) state_->span->SetAttribute(std::string(key), std::string(value));
}

void TraceSpan::Tag(std::string_view key, std::int64_t value) {
  if (state_) state_->span->SetAttribute(std::string(key), value);
}

void TraceSpan::Tag(std::string_view key, bool value) {
  if (state_) state_->span->SetAttribute(std::string(key), value);
}

void TraceSpan::MarkFailed(std::string_view reason) {
  if (!state_) {
    return;
  }
  state_->span->AddEvent("exception", {{"exception.message", std::string(reason)}});
  state_->span->SetStatus(trace_api::StatusCode::kError, std::string(reason));
}

} // namespace vodbridge::observability

#endif

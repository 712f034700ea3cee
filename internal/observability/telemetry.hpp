#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace vodbridge::runtime::config {
class RuntimeConfig;
}

namespace vodbridge::observability {

enum class Signal {
  kTraces,
  kMetrics,
};

/*
  Exporter settings for one OTLP signal.

  Precedence: RuntimeConfig, then the standard OTEL_* environment
  variables, then collector defaults. OTEL_SDK_DISABLED=true turns every
  signal off regardless of config.
*/
struct OtlpSettings {
  bool                      enabled{false};
  bool                      http{false};
  std::string               endpoint;
  std::string               service_name{"vodbridge"};
  std::chrono::milliseconds export_interval{5000};
};

OtlpSettings ResolveOtlpSettings(const vodbridge::runtime::config::RuntimeConfig& config, Signal signal);

// Both return false when the signal is disabled or the build has no OTel.
bool InitializeTracing(const vodbridge::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const vodbridge::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for the enclosing scope; ends on destruction.
class TraceSpan {
 public:
  explicit TraceSpan(std::string_view name);
  ~TraceSpan();

  TraceSpan(const TraceSpan&)            = delete;
  TraceSpan& operator=(const TraceSpan&) = delete;

  void Tag(std::string_view key, std::string_view value);
  void Tag(std::string_view key, std::int64_t value);
  void Tag(std::string_view key, bool value);

  // Sets error status and attaches `reason` as an exception event.
  void MarkFailed(std::string_view reason);

 private:
#ifdef ENABLE_OTEL
  struct State;
  std::unique_ptr<State> state_;
#endif
};

/*
  Process-wide instruments:

    vodbridge.content.requests      {route, outcome=ok|error}
    vodbridge.content.latency_ms    {route}
    vodbridge.cache.lookups         {route, result=hit|miss}
    vodbridge.backend.selections    {strategy, outcome}
    vodbridge.preflight.evaluations {ready}
    vodbridge.diagnostics.run_ms    {warm}
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordContentRequest(std::string_view route, bool ok, double latency_ms);
  void RecordCacheLookup(std::string_view route, bool hit);
  void RecordBackendSelection(std::string_view strategy, bool ok);
  void RecordPreflight(bool ready);
  void ObserveDiagnosticsRun(bool warm, double total_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Instruments;
  std::unique_ptr<Instruments> instruments_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const vodbridge::runtime::config::RuntimeConfig&) {
  return false;
}
inline bool InitializeMetrics(const vodbridge::runtime::config::RuntimeConfig&) {
  return false;
}
inline void ShutdownTracing() {
}
inline void ShutdownMetrics() {
}

inline TraceSpan::TraceSpan(std::string_view) {
}
inline TraceSpan::~TraceSpan() {
}
inline void TraceSpan::Tag(std::string_view, std::string_view) {
}
inline void TraceSpan::Tag(std::string_view, std::int64_t) {
}
inline void TraceSpan::Tag(std::string_view, bool) {
}
inline void TraceSpan::MarkFailed(std::string_view) {
}

inline Metrics::Metrics() {
}
inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}
inline void Metrics::RecordContentRequest(std::string_view, bool, double) {
}
inline void Metrics::RecordCacheLookup(std::string_view, bool) {
}
inline void Metrics::RecordBackendSelection(std::string_view, bool) {
}
inline void Metrics::RecordPreflight(bool) {
}
inline void Metrics::ObserveDiagnosticsRun(bool, double) {
}
#endif

} // namespace vodbridge::observability

#include "diagnostics_harness.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"

namespace vodbridge::diagnostics {

DiagnosticsHarness::DiagnosticsHarness(std::shared_ptr<backend::ContentFacade>   facade,
                                       std::shared_ptr<cache::TtlCache>          cache,
                                       std::shared_ptr<preflight::PreflightGate> preflight,
                                       Options                                   options,
                                       util::SteadyFn                            clock)
    : facade_(facade),
      cache_(std::move(cache)),
      preflight_(std::move(preflight)),
      options_(std::move(options)),
      home_view_(facade, options_.rail_limit, std::move(clock)) {
}

content::v1::DiagnosticsReport DiagnosticsHarness::Run() {
  observability::TraceSpan span("diagnostics.run");

  if (preflight_) {
    preflight_->EnsureReady();
  }

  content::v1::DiagnosticsReport report;
  *report.mutable_backend() = facade_->Descriptor();

  const bool caching = facade_->options().cache_enabled;

  for (std::uint32_t index = 1; index <= options_.runs; ++index) {
    const bool first = index == 1;

    if (first && cache_) {
      for (const auto& prefix : options_.clear_prefixes) {
        const auto removed = cache_->ClearPrefix(prefix);
        VODBRIDGE_LOG_DEBUG("diagnostics cleared cache prefix",
                            {observability::StringField("prefix", prefix), observability::IntField("removed", static_cast<std::int64_t>(removed))});
      }
    }

    const auto snapshot = home_view_.Build(first);

    bool all_cached = snapshot.home_from_cache;
    for (const auto& rail : snapshot.rails) {
      all_cached = all_cached && rail.from_cache;
    }
    const bool warm = caching && all_cached;

    auto* run = report.add_runs();
    run->set_index(index);
    run->set_total_ms(snapshot.total_ms);
    run->set_warm(warm);
    observability::Metrics::Instance().ObserveDiagnosticsRun(warm, snapshot.total_ms);
    run->set_threshold_ms(options_.home.For(warm));
    run->set_breached(LogDuration("diagnostics run " + std::to_string(index), snapshot.total_ms, warm, options_.home, options_.perf_logging));

    for (const auto& rail : snapshot.rails) {
      auto* timing = run->add_rails();
      timing->set_identifier(rail.identifier);
      timing->set_elapsed_ms(rail.elapsed_ms);
      timing->set_from_cache(rail.from_cache);
      timing->set_item_count(static_cast<std::uint32_t>(rail.item_count));
      timing->set_threshold_ms(options_.rail.For(rail.from_cache));
      timing->set_breached(LogDuration("diagnostics rail " + rail.identifier + " (run " + std::to_string(index) + ")",
                                       rail.elapsed_ms,
                                       rail.from_cache,
                                       options_.rail,
                                       options_.perf_logging));
    }
  }

  VODBRIDGE_LOG_INFO("diagnostics complete",
                     {observability::StringField("addon_id", report.backend().candidate_id()),
                      observability::StringField("strategy", content::v1::Strategy_Name(report.backend().strategy())),
                      observability::IntField("runs", report.runs_size())});
  return report;
}

} // namespace vodbridge::diagnostics

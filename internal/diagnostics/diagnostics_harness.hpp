#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "home_view.hpp"
#include "internal/cache/ttl_cache.hpp"
#include "internal/preflight/preflight_gate.hpp"
#include "perf.hpp"

namespace vodbridge::diagnostics {

/*
  Three home-view runs against the cold/warm threshold tables.

  Run 1 clears the configured cache prefixes and forces a refresh; runs 2-3
  use normal caching. A run is warm when caching is enabled and every fetch
  in it was served from cache.
*/
class DiagnosticsHarness {
 public:
  struct Options {
    Thresholds               home{1500.0, 300.0};
    Thresholds               rail{800.0, 100.0};
    std::vector<std::string> clear_prefixes{"home:", "rail:"};
    std::uint32_t            rail_limit{20};
    std::uint32_t            runs{3};
    bool                     perf_logging{false};
  };

  // `preflight` may be null.
  DiagnosticsHarness(std::shared_ptr<backend::ContentFacade>   facade,
                     std::shared_ptr<cache::TtlCache>          cache,
                     std::shared_ptr<preflight::PreflightGate> preflight,
                     Options                                   options,
                     util::SteadyFn                            clock = util::SteadyNow);

  content::v1::DiagnosticsReport Run();

 private:
  std::shared_ptr<backend::ContentFacade>   facade_;
  std::shared_ptr<cache::TtlCache>          cache_;
  std::shared_ptr<preflight::PreflightGate> preflight_;
  Options                                   options_;
  HomeView                                  home_view_;
};

} // namespace vodbridge::diagnostics

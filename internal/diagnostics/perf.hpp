#pragma once

#include <string_view>

namespace vodbridge::diagnostics {

struct Thresholds {
  double cold_ms{0};
  double warm_ms{0};

  double For(bool warm) const {
    return warm ? warm_ms : cold_ms;
  }
};

/*
  Logs one timing. A breach of the applicable threshold is always logged at
  warn; normal timings are logged at info only when perf_logging is on.
  Returns whether the threshold was breached.
*/
bool LogDuration(std::string_view label, double elapsed_ms, bool warm, const Thresholds& thresholds, bool perf_logging);

} // namespace vodbridge::diagnostics

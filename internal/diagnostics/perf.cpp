#include "perf.hpp"

#include "internal/observability/logging.hpp"

namespace vodbridge::diagnostics {

bool LogDuration(std::string_view label, double elapsed_ms, bool warm, const Thresholds& thresholds, bool perf_logging) {
  const double threshold = thresholds.For(warm);
  const char*  state     = warm ? "warm" : "cold";

  if (threshold > 0 && elapsed_ms > threshold) {
    VODBRIDGE_LOG_WARN("timing exceeded target",
                       {observability::StringField("label", label),
                        observability::StringField("state", state),
                        observability::DoubleField("elapsed_ms", elapsed_ms),
                        observability::DoubleField("threshold_ms", threshold)});
    return true;
  }

  if (perf_logging) {
    VODBRIDGE_LOG_INFO("timing", {observability::StringField("label", label), observability::StringField("state", state), observability::DoubleField("elapsed_ms", elapsed_ms)});
  }
  return false;
}

} // namespace vodbridge::diagnostics

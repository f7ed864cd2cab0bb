#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace cold_chain::sinks {

void StdoutDebugSink::publish(const model::spoilage_result& result) const {
  std::printf("[score] product=%s instant_pct=%.2f cumulative_pct=%.2f risk=%s zscore=%d ewma=%d warn=%.2f crit=%.2f\n",
              result.product.c_str(), result.instant_spoilage_pct, result.cumulative_spoilage_pct,
              model::to_string(result.risk), result.anomalies.zscore ? 1 : 0, result.anomalies.ewma ? 1 : 0,
              result.thresholds.warn, result.thresholds.crit);
}

}  // namespace cold_chain::sinks

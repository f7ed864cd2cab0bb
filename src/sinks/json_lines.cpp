#include "sinks/json_lines.hpp"

#include <ostream>

namespace cold_chain::sinks {

nlohmann::json to_json(const model::spoilage_result& result) {
  nlohmann::json out{
      {"ts", nullptr},
      {"product", result.product},
      {"instant_spoilage_pct", result.instant_spoilage_pct},
      {"cumulative_spoilage_pct", result.cumulative_spoilage_pct},
      {"quality", result.quality},
      {"decay_rate", result.decay_rate},
      {"risk_level", model::to_string(result.risk)},
      {"anomalies", {{"zscore", result.anomalies.zscore}, {"ewma", result.anomalies.ewma}}},
      {"adaptive_thresholds",
       {{"z", result.thresholds.z},
        {"ewma_L", result.thresholds.ewma_limit},
        {"warn", result.thresholds.warn},
        {"crit", result.thresholds.crit}}},
      {"contributions",
       {{"temp", result.contributions.temperature},
        {"humidity", result.contributions.humidity},
        {"door", result.contributions.door},
        {"gas", result.contributions.gas},
        {"interaction", result.contributions.interaction},
        {"outside", result.contributions.outside}}},
      {"alerts", result.alerts},
      {"notes", result.notes},
  };
  if (result.ts.has_value()) {
    out["ts"] = *result.ts;
  }
  return out;
}

JsonLinesSink::JsonLinesSink(std::ostream& out) noexcept : out_(&out) {}

bool JsonLinesSink::publish(const model::spoilage_result& result) {
  *out_ << to_json(result).dump() << '\n';
  out_->flush();
  return static_cast<bool>(*out_);
}

}  // namespace cold_chain::sinks

#pragma once

#include <cstdint>

#include "model/spoilage_result.hpp"
#include "risk/anomaly.hpp"

namespace cold_chain::risk {

// Hysteresis filter over {ok, warning, critical}: a level is only reported
// after `require_consecutive` breaches in a row.
class RiskDebouncer {
 public:
  explicit RiskDebouncer(std::uint32_t require_consecutive = 2) noexcept;

  model::risk_level sample(double instant_pct, const RiskThresholds& thresholds) noexcept;

  [[nodiscard]] model::risk_level level() const noexcept { return level_; }
  [[nodiscard]] std::uint32_t warning_breaches() const noexcept { return warn_breaches_; }
  [[nodiscard]] std::uint32_t critical_breaches() const noexcept { return crit_breaches_; }
  [[nodiscard]] std::uint32_t require_consecutive() const noexcept { return require_consecutive_; }

 private:
  std::uint32_t require_consecutive_{2};
  std::uint32_t warn_breaches_{0};
  std::uint32_t crit_breaches_{0};
  model::risk_level level_{model::risk_level::OK};
};

}  // namespace cold_chain::risk

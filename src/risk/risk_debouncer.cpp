#include "risk/risk_debouncer.hpp"

namespace cold_chain::risk {

RiskDebouncer::RiskDebouncer(const std::uint32_t require_consecutive) noexcept
    : require_consecutive_(require_consecutive > 0 ? require_consecutive : 1) {}

model::risk_level RiskDebouncer::sample(const double instant_pct, const RiskThresholds& thresholds) noexcept {
  if (instant_pct > thresholds.crit) {
    ++crit_breaches_;
    if (warn_breaches_ > 0) {
      --warn_breaches_;
    }
    if (crit_breaches_ >= require_consecutive_) {
      level_ = model::risk_level::CRITICAL;
    } else if (level_ == model::risk_level::CRITICAL) {
      level_ = model::risk_level::WARNING;
    }
  } else if (instant_pct > thresholds.warn) {
    ++warn_breaches_;
    if (crit_breaches_ > 0) {
      --crit_breaches_;
    }
    level_ = warn_breaches_ >= require_consecutive_ ? model::risk_level::WARNING : model::risk_level::OK;
  } else {
    warn_breaches_ = 0;
    crit_breaches_ = 0;
    level_ = model::risk_level::OK;
  }

  return level_;
}

}  // namespace cold_chain::risk

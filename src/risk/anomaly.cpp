#include "risk/anomaly.hpp"

#include <algorithm>
#include <cmath>

#include "core/math.hpp"

namespace cold_chain::risk {

ZScoreResult detect_zscore(const std::vector<double>& history, const double threshold) {
  ZScoreResult result{};
  if (history.size() <= 3) {
    return result;
  }

  const double sigma = core::stddev(history);
  if (sigma <= kStdFloor) {
    return result;
  }

  result.z = (history.back() - core::mean(history)) / sigma;
  result.anomalous = std::fabs(result.z) > threshold;
  return result;
}

EwmaResult detect_ewma(const std::vector<double>& history, const double alpha, const double limit) {
  EwmaResult result{};
  if (history.size() <= 1) {
    return result;
  }

  double ewma = history.front();
  for (std::size_t i = 1; i < history.size(); ++i) {
    ewma = (alpha * history[i]) + ((1.0 - alpha) * ewma);
  }

  const double n = static_cast<double>(history.size());
  const double lambda = std::sqrt((alpha / (2.0 - alpha)) * (1.0 - std::pow(1.0 - alpha, 2.0 * n)));
  const double sigma = core::stddev(history);

  result.ewma = ewma;
  result.deviation = std::fabs(history.back() - ewma);
  result.control_limit = limit * (sigma > 0.0 ? sigma : 1.0) * lambda;
  result.anomalous = result.deviation > result.control_limit;
  return result;
}

RiskThresholds compute_thresholds(const std::vector<double>& history) {
  RiskThresholds thresholds{};
  if (history.size() < 5) {
    return thresholds;
  }

  const double mu = core::mean(history);
  const double sigma = core::stddev(history);
  thresholds.warn = std::clamp(mu + (0.5 * sigma), 30.0, 100.0);
  thresholds.crit = std::clamp(mu + sigma, 40.0, 100.0);
  return thresholds;
}

}  // namespace cold_chain::risk

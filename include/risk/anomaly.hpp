#pragma once

#include <vector>

namespace cold_chain::risk {

constexpr double kStdFloor = 1e-8;

struct ZScoreResult {
  double z{0.0};
  bool anomalous{false};
};

struct EwmaResult {
  double ewma{0.0};
  double deviation{0.0};
  double control_limit{0.0};
  bool anomalous{false};
};

struct RiskThresholds {
  double warn{60.0};
  double crit{80.0};
};

// Latest value against the mean of the whole history. Needs more than 3
// samples and a non-degenerate spread.
[[nodiscard]] ZScoreResult detect_zscore(const std::vector<double>& history, double threshold);

// EWMA control chart with the time-varying limit factor
// lambda = sqrt(alpha / (2 - alpha) * (1 - (1 - alpha)^(2n))). Needs more than 1 sample.
[[nodiscard]] EwmaResult detect_ewma(const std::vector<double>& history, double alpha, double limit);

// warn = mean + 0.5 std in [30, 100], crit = mean + std in [40, 100] once 5
// samples exist; 60/80 before that.
[[nodiscard]] RiskThresholds compute_thresholds(const std::vector<double>& history);

}  // namespace cold_chain::risk

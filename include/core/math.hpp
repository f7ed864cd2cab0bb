#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace cold_chain::core {

inline constexpr double clamp01(const double value) noexcept {
  return std::clamp(value, 0.0, 1.0);
}

inline constexpr double clamp_pct(const double value) noexcept {
  return std::clamp(value, 0.0, 100.0);
}

inline double round_to(const double value, const int decimals) noexcept {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

inline double mean(const std::vector<double>& values) noexcept {
  if (values.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const double v : values) {
    sum += v;
  }
  return sum / static_cast<double>(values.size());
}

// Population standard deviation (divides by n).
inline double stddev(const std::vector<double>& values) noexcept {
  if (values.empty()) {
    return 0.0;
  }
  const double mu = mean(values);
  double sq_sum = 0.0;
  for (const double v : values) {
    const double deviation = v - mu;
    sq_sum += deviation * deviation;
  }
  return std::sqrt(sq_sum / static_cast<double>(values.size()));
}

}  // namespace cold_chain::core

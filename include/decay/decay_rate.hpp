#pragma once

#include <cstddef>
#include <vector>

namespace cold_chain::decay {

// Reference temperature used when no inside history exists yet.
constexpr double kFallbackRefTempC = 25.0;

// base_rate * q10^((temp - ref) / 10). Unbounded; callers clamp.
[[nodiscard]] double static_rate(double temp_c, double ref_temp_c, double q10, double base_rate) noexcept;

struct RecentSignals {
  std::vector<double> inside_c{};
  std::vector<double> outside_c{};
  std::vector<double> humidity_pct{};
  std::vector<double> door{};
};

// Q10 rate with reference temperature, q10 and bounds re-estimated from the
// last `window` samples of each signal.
[[nodiscard]] double adaptive_rate(double temp_c, const RecentSignals& recent, double base_q10, double base_rate,
                                   std::size_t window);

}  // namespace cold_chain::decay

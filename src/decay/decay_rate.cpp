#include "decay/decay_rate.hpp"

#include <algorithm>
#include <cmath>

#include "core/math.hpp"

namespace cold_chain::decay {
namespace {

std::vector<double> last_n(const std::vector<double>& values, const std::size_t window) {
  const std::size_t take = std::min(window, values.size());
  return std::vector<double>(values.end() - static_cast<std::ptrdiff_t>(take), values.end());
}

}  // namespace

double static_rate(const double temp_c, const double ref_temp_c, const double q10, const double base_rate) noexcept {
  return base_rate * std::pow(q10, (temp_c - ref_temp_c) / 10.0);
}

double adaptive_rate(const double temp_c, const RecentSignals& recent, const double base_q10, const double base_rate,
                     const std::size_t window) {
  const auto inside = last_n(recent.inside_c, window);
  if (inside.empty()) {
    return static_rate(temp_c, kFallbackRefTempC, base_q10, base_rate);
  }
  const auto outside = last_n(recent.outside_c, window);
  const auto humidity = last_n(recent.humidity_pct, window);
  const auto door = last_n(recent.door, window);

  const double inside_mean = core::mean(inside);
  const double outside_mean = outside.empty() ? temp_c : core::mean(outside);
  const double door_freq = core::mean(door);
  const double humidity_frac = core::mean(humidity) / 100.0;

  // Open doors pull the effective reference toward the ambient.
  const double ref_temp_c =
      outside.empty() ? inside_mean : inside_mean + (0.5 * door_freq * (outside_mean - inside_mean));
  const double q10 = base_q10 * (1.0 + (core::stddev(inside) / 10.0));

  const double delta = std::fabs(temp_c - outside_mean);
  const double modifier = 1.0 + ((0.05 + (core::stddev(outside) / 100.0)) * std::exp(-delta / 5.0));

  const double min_rate = 0.5 * humidity_frac;
  const double max_rate = 5.0 * (1.0 + door_freq + humidity_frac);

  const double rate = static_rate(temp_c, ref_temp_c, q10, base_rate) * modifier;
  return std::clamp(rate, min_rate, max_rate);
}

}  // namespace cold_chain::decay

#include "engine/spoilage_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "core/math.hpp"
#include "decay/decay_rate.hpp"
#include "risk/anomaly.hpp"

namespace cold_chain::engine {
namespace {

constexpr double kDefaultStepMinutes = 1.0;
constexpr double kMinStepMinutes = 0.1;

void require_finite(const double value, const char* field) {
  if (!std::isfinite(value)) {
    throw core::InvalidReading(std::string(field) + " must be a finite number");
  }
}

void validate_reading(const model::reading& reading) {
  require_finite(reading.temp_inside_c, "temp_inside_c");
  require_finite(reading.temp_outside_c, "temp_outside_c");
  require_finite(reading.humidity_pct, "humidity_pct");
  require_finite(reading.gas_ppm, "gas_ppm");
  if (reading.ts.has_value()) {
    require_finite(*reading.ts, "ts");
  }
}

// Close to 1 while the thermal barrier is breached (inside ~ outside), close to
// 0 when the gap is large.
double outside_penalty(const double inside_c, const double outside_c) {
  const double delta = std::fabs(inside_c - outside_c);
  return 1.0 / (1.0 + std::exp((delta - 10.0) / 2.0));
}

std::string format_note(const char* label, const double value, const int decimals, const char* unit = "") {
  std::ostringstream out;
  out << label << '=' << std::fixed << std::setprecision(decimals) << value << unit;
  return out.str();
}

model::factor_values round_contributions(const model::factor_values& c) {
  return {core::round_to(c.temperature, 3), core::round_to(c.humidity, 3), core::round_to(c.door, 3),
          core::round_to(c.gas, 3),         core::round_to(c.interaction, 3), core::round_to(c.outside, 3)};
}

}  // namespace

SpoilageEngine::SpoilageEngine(std::string product, EngineOptions options, profile::ProfileCatalog catalog)
    : product_(std::move(product)),
      options_(options),
      catalog_(std::move(catalog)),
      instant_history_(options.window),
      inside_history_(options.window),
      outside_history_(options.window),
      humidity_history_(options.window),
      door_history_(options.window),
      debouncer_(options.require_consecutive) {
  if (options_.require_consecutive == 0) {
    throw std::invalid_argument("require_consecutive must be greater than 0");
  }
}

double SpoilageEngine::elapsed_minutes(const std::optional<double> ts) const noexcept {
  if (!ts.has_value() || !last_ts_.has_value() || *ts < *last_ts_) {
    return kDefaultStepMinutes;
  }
  return std::max(kMinStepMinutes, (*ts - *last_ts_) / 60.0);
}

double SpoilageEngine::select_rate(const model::reading& reading, const model::dynamic_profile& profile) const {
  double rate = 0.0;
  if (options_.mode == model::rate_mode::ADAPTIVE && inside_history_.size() >= kAdaptiveMinSamples) {
    decay::RecentSignals recent{};
    recent.inside_c = inside_history_.values();
    recent.outside_c = outside_history_.values();
    recent.humidity_pct = humidity_history_.values();
    recent.door = door_history_.values();
    const std::size_t lookback = std::min(kAdaptiveRateWindow, inside_history_.size());
    rate = decay::adaptive_rate(reading.temp_inside_c, recent, profile.base.q10, 1.0, lookback);
  } else {
    rate = decay::static_rate(reading.temp_inside_c, profile.base.ref_temp_c, profile.q10_dynamic, 1.0);
  }
  return std::min(profile.max_rate_dynamic, std::max(profile.base.min_rate, rate));
}

model::spoilage_result SpoilageEngine::update(const model::reading& reading) {
  // Everything that can reject the reading runs before any state is touched.
  validate_reading(reading);
  const std::string product = reading.product.empty() ? product_ : reading.product;

  std::optional<double> variability{};
  if (instant_history_.size() > 5) {
    variability = core::stddev(instant_history_.values());
  }

  const model::dynamic_profile profile =
      catalog_.derive(product, reading.temp_outside_c, reading.door_open, variability);
  const model::factor_values& w = profile.weights;

  const double dt_minutes = elapsed_minutes(reading.ts);
  const double rate = select_rate(reading, profile);

  const double humidity = reading.humidity_pct / 100.0;
  const double door_penalty = reading.door_open == 1 ? 1.0 : 0.0;
  const double gas = reading.gas_ppm / 1000.0;
  const double interaction = humidity * (reading.temp_inside_c / 30.0);
  const double outside = outside_penalty(reading.temp_inside_c, reading.temp_outside_c);

  const model::factor_values contributions{rate * w.temperature, humidity * w.humidity,
                                           door_penalty * w.door, gas * w.gas,
                                           interaction * w.interaction, outside * w.outside};
  const double raw = contributions.sum();

  const double scaled = raw * 100.0;
  const double slope = std::max(1e-6, profile.base.logistic.slope);
  const double instant = core::clamp_pct(100.0 / (1.0 + std::exp(-(scaled - profile.base.logistic.midpoint) / slope)));

  // Commit.
  product_ = product;
  last_ts_ = reading.ts;

  quality_ *= std::max(0.0, 1.0 - ((instant / 100.0) * dt_minutes));
  quality_ = core::clamp01(quality_);
  const double cumulative = core::clamp_pct(100.0 * (1.0 - quality_));

  instant_history_.push(instant);
  inside_history_.push(reading.temp_inside_c);
  outside_history_.push(reading.temp_outside_c);
  humidity_history_.push(reading.humidity_pct);
  door_history_.push(static_cast<double>(reading.door_open));

  const std::vector<double> history = instant_history_.values();
  const risk::ZScoreResult zscore = risk::detect_zscore(history, profile.z_threshold_dynamic);
  const risk::EwmaResult ewma =
      risk::detect_ewma(history, profile.base.ewma_alpha, profile.ewma_threshold_dynamic);
  const risk::RiskThresholds thresholds = risk::compute_thresholds(history);
  const model::risk_level level = debouncer_.sample(instant, thresholds);

  model::spoilage_result result{};
  result.ts = reading.ts;
  result.product = product_;
  result.instant_spoilage_pct = core::round_to(instant, 2);
  result.cumulative_spoilage_pct = core::round_to(cumulative, 2);
  result.quality = quality_;
  result.decay_rate = rate;
  result.risk = level;
  result.anomalies = {zscore.anomalous, ewma.anomalous};
  result.thresholds = {profile.z_threshold_dynamic, profile.ewma_threshold_dynamic,
                       core::round_to(thresholds.warn, 2), core::round_to(thresholds.crit, 2)};
  result.contributions = round_contributions(contributions);

  if (reading.temp_inside_c > profile.max_safe_temp_c) {
    result.alerts.push_back(profile.base.alerts.high_temp);
  }
  if (rate >= profile.max_rate_dynamic) {
    result.alerts.push_back(profile.base.alerts.rapid_spoilage);
  }

  result.notes.push_back(format_note("dT", std::fabs(reading.temp_inside_c - reading.temp_outside_c), 1, "C"));
  result.notes.push_back(format_note("z", zscore.z, 2));
  result.notes.push_back(format_note("ewma_dev", ewma.deviation, 2));
  return result;
}

}  // namespace cold_chain::engine

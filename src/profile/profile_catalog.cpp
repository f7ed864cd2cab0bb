#include "profile/profile_catalog.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"

namespace cold_chain::profile {
namespace {

constexpr double kWeightTolerance = 1e-6;

model::base_profile fruit_profile() {
  model::base_profile p{};
  p.q10 = 2.5;
  p.ref_temp_c = 10.0;
  p.z_threshold = 3.0;
  p.ewma_threshold = 2.5;
  p.ewma_alpha = 0.35;
  p.max_safe_temp_c = 20.0;
  p.min_rate = 0.0;
  p.max_rate = 5.0;
  p.weights = {0.35, 0.25, 0.10, 0.20, 0.05, 0.05};
  p.logistic = {40.0, 8.0};
  p.adaptive_window = 25;
  p.alerts = {"Fruit temperature exceeds safe limit!", "Fruit spoilage rate too high!"};
  return p;
}

// WHO storage band 2..8 C.
model::base_profile vaccine_profile() {
  model::base_profile p{};
  p.q10 = 2.0;
  p.ref_temp_c = 5.0;
  p.z_threshold = 2.0;
  p.ewma_threshold = 1.8;
  p.ewma_alpha = 0.2;
  p.max_safe_temp_c = 8.0;
  p.min_rate = 0.0;
  p.max_rate = 2.0;
  p.weights = {0.55, 0.05, 0.25, 0.05, 0.05, 0.05};
  p.logistic = {50.0, 12.0};
  p.adaptive_window = 40;
  p.alerts = {"Vaccine temperature exceeds WHO limit!", "Vaccine degradation rate too high!"};
  return p;
}

// Keep at or below 4 C.
model::base_profile seafood_profile() {
  model::base_profile p{};
  p.q10 = 3.0;
  p.ref_temp_c = 4.0;
  p.z_threshold = 2.5;
  p.ewma_threshold = 2.2;
  p.ewma_alpha = 0.3;
  p.max_safe_temp_c = 5.0;
  p.min_rate = 0.0;
  p.max_rate = 7.0;
  p.weights = {0.50, 0.20, 0.15, 0.15, 0.03, 0.02};
  p.logistic = {35.0, 7.0};
  p.adaptive_window = 35;
  p.alerts = {"Seafood temperature exceeds safe limit!", "Seafood spoilage rate too high!"};
  return p;
}

void validate_inputs(const std::optional<double> outside_temp_c, const int door_open) {
  if (door_open != 0 && door_open != 1) {
    throw core::InvalidInput("door_open must be 0 or 1");
  }
  if (outside_temp_c.has_value() &&
      (!std::isfinite(*outside_temp_c) || *outside_temp_c < kMinOutsideTempC || *outside_temp_c > kMaxOutsideTempC)) {
    throw core::InvalidInput("temp_outside_c out of realistic range (-30..50 C)");
  }
}

}  // namespace

void validate_profile(const std::string& product, const model::base_profile& profile) {
  const auto reject = [&product](const char* why) {
    throw std::invalid_argument("profile '" + product + "': " + why);
  };

  if (product.empty()) {
    reject("product name must not be empty");
  }
  if (!(profile.q10 > 0.0)) {
    reject("q10 must be greater than 0");
  }
  if (!(profile.ewma_alpha > 0.0 && profile.ewma_alpha <= 1.0)) {
    reject("ewma_alpha must be in (0, 1]");
  }
  if (!(profile.z_threshold > 0.0) || !(profile.ewma_threshold > 0.0)) {
    reject("anomaly thresholds must be greater than 0");
  }
  if (profile.min_rate < 0.0 || profile.max_rate < profile.min_rate) {
    reject("rate bounds must satisfy 0 <= min_rate <= max_rate");
  }
  if (!(profile.logistic.slope > 0.0)) {
    reject("logistic slope must be greater than 0");
  }
  if (profile.adaptive_window == 0) {
    reject("adaptive_window must be greater than 0");
  }

  const auto& w = profile.weights;
  if (w.temperature < 0.0 || w.humidity < 0.0 || w.door < 0.0 || w.gas < 0.0 || w.interaction < 0.0 ||
      w.outside < 0.0) {
    reject("weights must be non-negative");
  }
  if (std::fabs(w.sum() - 1.0) > kWeightTolerance) {
    reject("weights must sum to 1.0");
  }
}

ProfileCatalog ProfileCatalog::builtin() {
  ProfileCatalog catalog;
  catalog.register_profile("fruit", fruit_profile());
  catalog.register_profile("vaccine", vaccine_profile());
  catalog.register_profile("seafood", seafood_profile());
  return catalog;
}

void ProfileCatalog::register_profile(const std::string& product, model::base_profile profile) {
  validate_profile(product, profile);
  profiles_[product] = std::move(profile);
}

bool ProfileCatalog::contains(const std::string& product) const {
  return profiles_.find(product) != profiles_.end();
}

const model::base_profile& ProfileCatalog::find(const std::string& product) const {
  const auto it = profiles_.find(product);
  if (it == profiles_.end()) {
    throw core::UnknownProduct("Unknown product '" + product + "'");
  }
  return it->second;
}

std::vector<std::string> ProfileCatalog::products() const {
  std::vector<std::string> names;
  names.reserve(profiles_.size());
  for (const auto& entry : profiles_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

model::dynamic_profile ProfileCatalog::derive(const std::string& product, const std::optional<double> outside_temp_c,
                                              const int door_open, const std::optional<double> variability) const {
  const model::base_profile& base = find(product);
  validate_inputs(outside_temp_c, door_open);

  model::dynamic_profile profile{};
  profile.base = base;
  profile.weights = base.weights;

  const double ref = base.ref_temp_c;
  const double outside_trend = outside_temp_c.has_value() ? std::tanh((*outside_temp_c - ref) / 10.0) : 0.0;

  // Safe temperature drifts smoothly with the ambient, bounded around ref.
  double safe = base.max_safe_temp_c + (5.0 * outside_trend);
  safe += 0.5 * static_cast<double>(door_open);
  profile.max_safe_temp_c = std::clamp(safe, ref - 5.0, ref + 10.0);

  const double max_rate = base.max_rate * (1.0 + (0.05 * (profile.max_safe_temp_c - ref)));
  profile.max_rate_dynamic = std::max(base.min_rate, std::min(max_rate, base.max_rate * 1.5));

  if (base.adaptive_q10 && variability.has_value()) {
    profile.q10_dynamic = std::min(base.q10 * (1.0 + (0.01 * *variability)), base.q10 * 1.5);
  } else {
    profile.q10_dynamic = base.q10;
  }

  if (variability.has_value()) {
    const double inflation = 1.0 + (0.1 * *variability);
    profile.z_threshold_dynamic = std::min(base.z_threshold * inflation, base.z_threshold * 2.0);
    profile.ewma_threshold_dynamic = std::min(base.ewma_threshold * inflation, base.ewma_threshold * 2.0);
  } else {
    profile.z_threshold_dynamic = base.z_threshold;
    profile.ewma_threshold_dynamic = base.ewma_threshold;
  }

  auto& w = profile.weights;
  if (outside_temp_c.has_value()) {
    w.temperature *= 1.0 + (0.1 * outside_trend);
  }
  if (door_open == 1) {
    w.door *= 1.2;
    w.interaction *= 1.1;
  }
  if (variability.has_value()) {
    w.gas *= 1.0 + (0.05 * *variability);
  }

  const double total = w.sum() > 0.0 ? w.sum() : 1.0;
  w.temperature /= total;
  w.humidity /= total;
  w.door /= total;
  w.gas /= total;
  w.interaction /= total;
  w.outside /= total;

  return profile;
}

}  // namespace cold_chain::profile

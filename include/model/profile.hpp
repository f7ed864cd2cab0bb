#pragma once

#include <string>

namespace cold_chain::model {

// Six factors shared by weights and per-reading contributions.
struct factor_values {
  double temperature{0.0};
  double humidity{0.0};
  double door{0.0};
  double gas{0.0};
  double interaction{0.0};
  double outside{0.0};

  [[nodiscard]] double sum() const noexcept {
    return temperature + humidity + door + gas + interaction + outside;
  }
};

struct logistic_curve {
  double midpoint{50.0};
  double slope{10.0};
};

struct alert_text {
  std::string high_temp{"Temperature exceeds safe limit!"};
  std::string rapid_spoilage{"Spoilage rate too high!"};
};

// Static per-product baseline. Defaults describe a generic chilled product and
// are the starting point for products registered from configuration.
struct base_profile {
  double q10{2.0};
  double ref_temp_c{5.0};
  double z_threshold{3.0};
  double ewma_threshold{2.5};
  double ewma_alpha{0.3};
  double max_safe_temp_c{8.0};
  double min_rate{0.0};
  double max_rate{5.0};
  factor_values weights{0.40, 0.20, 0.15, 0.15, 0.05, 0.05};
  logistic_curve logistic{};
  bool adaptive_q10{true};
  bool adaptive_ewma{true};
  unsigned adaptive_window{30};
  alert_text alerts{};
};

// Per-reading adaptation of a base_profile.
struct dynamic_profile {
  base_profile base{};
  double max_safe_temp_c{0.0};
  double max_rate_dynamic{0.0};
  double q10_dynamic{0.0};
  double z_threshold_dynamic{0.0};
  double ewma_threshold_dynamic{0.0};
  factor_values weights{};
};

}  // namespace cold_chain::model

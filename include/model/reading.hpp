#pragma once

#include <optional>
#include <string>

namespace cold_chain::model {

// One sensor sample for the monitored asset.
struct reading {
  std::optional<double> ts{};  // seconds, monotonic or epoch
  std::string product{};       // empty keeps the engine's current product
  double temp_inside_c{0.0};
  double temp_outside_c{0.0};
  double humidity_pct{0.0};
  int door_open{0};
  double gas_ppm{0.0};
};

}  // namespace cold_chain::model

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "model/profile.hpp"

namespace cold_chain::profile {

// Realistic outside temperature envelope accepted by derive().
constexpr double kMinOutsideTempC = -30.0;
constexpr double kMaxOutsideTempC = 50.0;

class ProfileCatalog {
 public:
  ProfileCatalog() = default;

  // fruit, vaccine and seafood baselines.
  static ProfileCatalog builtin();

  // Adds or replaces a product. Throws std::invalid_argument when the profile
  // is not usable (weights not summing to 1, non-positive q10/slope/window...).
  void register_profile(const std::string& product, model::base_profile profile);

  [[nodiscard]] bool contains(const std::string& product) const;
  [[nodiscard]] const model::base_profile& find(const std::string& product) const;
  [[nodiscard]] std::vector<std::string> products() const;

  // Pure adaptation of a base profile to the current environment.
  // Throws core::UnknownProduct and core::InvalidInput.
  [[nodiscard]] model::dynamic_profile derive(const std::string& product, std::optional<double> outside_temp_c,
                                              int door_open, std::optional<double> variability) const;

 private:
  std::unordered_map<std::string, model::base_profile> profiles_{};
};

void validate_profile(const std::string& product, const model::base_profile& profile);

}  // namespace cold_chain::profile

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "core/rolling_window.hpp"
#include "model/reading.hpp"
#include "model/spoilage_result.hpp"
#include "profile/profile_catalog.hpp"
#include "risk/risk_debouncer.hpp"

namespace cold_chain::engine {

// Samples of inside temperature needed before the adaptive rate engages.
constexpr std::size_t kAdaptiveMinSamples = 5;
// Lookback handed to the adaptive rate model.
constexpr std::size_t kAdaptiveRateWindow = 10;

struct EngineOptions {
  std::size_t window{30};
  model::rate_mode mode{model::rate_mode::ADAPTIVE};
  std::uint32_t require_consecutive{2};
};

// Stateful scorer for one monitored stream. update() is not reentrant; the
// owner of the reading loop serializes calls.
class SpoilageEngine {
 public:
  explicit SpoilageEngine(std::string product, EngineOptions options = {},
                          profile::ProfileCatalog catalog = profile::ProfileCatalog::builtin());

  // Scores one reading. Throws core::InvalidReading, core::UnknownProduct and
  // core::InvalidInput; on throw the engine state is unchanged.
  model::spoilage_result update(const model::reading& reading);

  [[nodiscard]] const std::string& product() const noexcept { return product_; }
  [[nodiscard]] model::rate_mode mode() const noexcept { return options_.mode; }
  [[nodiscard]] double quality() const noexcept { return quality_; }
  [[nodiscard]] std::size_t history_size() const noexcept { return instant_history_.size(); }
  [[nodiscard]] std::size_t window() const noexcept { return options_.window; }
  [[nodiscard]] const risk::RiskDebouncer& debouncer() const noexcept { return debouncer_; }
  [[nodiscard]] const profile::ProfileCatalog& catalog() const noexcept { return catalog_; }

 private:
  [[nodiscard]] double elapsed_minutes(std::optional<double> ts) const noexcept;
  [[nodiscard]] double select_rate(const model::reading& reading, const model::dynamic_profile& profile) const;

  std::string product_;
  EngineOptions options_;
  profile::ProfileCatalog catalog_;

  double quality_{1.0};
  std::optional<double> last_ts_{};

  core::RollingWindow<double> instant_history_;
  core::RollingWindow<double> inside_history_;
  core::RollingWindow<double> outside_history_;
  core::RollingWindow<double> humidity_history_;
  core::RollingWindow<double> door_history_;

  risk::RiskDebouncer debouncer_;
};

}  // namespace cold_chain::engine

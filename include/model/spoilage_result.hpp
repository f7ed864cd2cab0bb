#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model/profile.hpp"

namespace cold_chain::model {

enum class risk_level : std::uint8_t {
    OK = 0,
    WARNING = 1,
    CRITICAL = 2,
};

enum class rate_mode : std::uint8_t {
    ADAPTIVE = 0,
    SIMPLE = 1,
};

inline const char* to_string(const risk_level level) noexcept {
  switch (level) {
    case risk_level::OK:
      return "ok";
    case risk_level::WARNING:
      return "warning";
    case risk_level::CRITICAL:
      return "critical";
  }
  return "ok";
}

inline const char* to_string(const rate_mode mode) noexcept {
  return mode == rate_mode::ADAPTIVE ? "adaptive" : "simple";
}

struct anomaly_flags {
  bool zscore{false};
  bool ewma{false};
};

struct adaptive_thresholds {
  double z{0.0};
  double ewma_limit{0.0};
  double warn{0.0};
  double crit{0.0};
};

// Output record for one scored reading.
struct spoilage_result {
  std::optional<double> ts{};
  std::string product{};
  double instant_spoilage_pct{0.0};
  double cumulative_spoilage_pct{0.0};
  double quality{1.0};
  double decay_rate{0.0};
  risk_level risk{risk_level::OK};
  anomaly_flags anomalies{};
  adaptive_thresholds thresholds{};
  factor_values contributions{};
  std::vector<std::string> alerts{};
  std::vector<std::string> notes{};
};

}  // namespace cold_chain::model

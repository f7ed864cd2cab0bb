#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/rolling_window.hpp"
#include "model/spoilage_result.hpp"
#include "risk/anomaly.hpp"
#include "risk/risk_debouncer.hpp"

using cold_chain::core::MonitorConfig;
using cold_chain::core::RollingWindow;
using cold_chain::core::load_monitor_config;
using cold_chain::model::rate_mode;
using cold_chain::model::risk_level;
using cold_chain::risk::RiskDebouncer;
using cold_chain::risk::RiskThresholds;
using cold_chain::risk::compute_thresholds;
using cold_chain::risk::detect_ewma;
using cold_chain::risk::detect_zscore;

namespace {

bool almost_equal(double a, double b, double epsilon = 1e-9) {
  return std::fabs(a - b) <= epsilon;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path write_config(const char* name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

bool config_throws(const char* name, const std::string& content) {
  const auto path = write_config(name, content);
  bool threw = false;
  try {
    (void)load_monitor_config(path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  std::error_code ec;
  std::filesystem::remove(path, ec);
  return threw;
}

int test_debouncer_single_breach_does_not_escalate() {
  RiskDebouncer debouncer;
  const RiskThresholds fallback{};

  if (debouncer.sample(90.0, fallback) != risk_level::OK) {
    return fail("test_debouncer_single_breach_does_not_escalate", "one critical breach must stay ok");
  }
  if (debouncer.critical_breaches() != 1U) {
    return fail("test_debouncer_single_breach_does_not_escalate", "critical counter should be 1");
  }
  if (debouncer.sample(90.0, fallback) != risk_level::CRITICAL) {
    return fail("test_debouncer_single_breach_does_not_escalate", "second critical breach should escalate");
  }
  if (debouncer.sample(10.0, fallback) != risk_level::OK || debouncer.critical_breaches() != 0U ||
      debouncer.warning_breaches() != 0U) {
    return fail("test_debouncer_single_breach_does_not_escalate", "calm reading should reset to ok");
  }
  return 0;
}

int test_debouncer_warning_and_counter_decay() {
  RiskDebouncer debouncer;
  const RiskThresholds fallback{};

  if (debouncer.sample(70.0, fallback) != risk_level::OK) {
    return fail("test_debouncer_warning_and_counter_decay", "one warning breach must stay ok");
  }
  if (debouncer.sample(70.0, fallback) != risk_level::WARNING) {
    return fail("test_debouncer_warning_and_counter_decay", "second warning breach should report warning");
  }

  // A lone critical breach keeps the current non-critical level.
  if (debouncer.sample(95.0, fallback) != risk_level::WARNING) {
    return fail("test_debouncer_warning_and_counter_decay", "single critical breach should hold warning");
  }
  if (debouncer.warning_breaches() != 1U || debouncer.critical_breaches() != 1U) {
    return fail("test_debouncer_warning_and_counter_decay", "critical breach should decay warning counter");
  }

  if (debouncer.sample(70.0, fallback) != risk_level::WARNING) {
    return fail("test_debouncer_warning_and_counter_decay", "warning counter back at 2 should report warning");
  }
  if (debouncer.critical_breaches() != 0U) {
    return fail("test_debouncer_warning_and_counter_decay", "warning breach should decay critical counter");
  }

  if (debouncer.sample(95.0, fallback) != risk_level::WARNING ||
      debouncer.sample(95.0, fallback) != risk_level::CRITICAL) {
    return fail("test_debouncer_warning_and_counter_decay", "two critical breaches should escalate from warning");
  }
  return 0;
}

int test_debouncer_require_one_reacts_immediately() {
  RiskDebouncer debouncer(1);
  const RiskThresholds thresholds{30.0, 40.0};

  if (debouncer.sample(35.0, thresholds) != risk_level::WARNING) {
    return fail("test_debouncer_require_one_reacts_immediately", "expected immediate warning");
  }
  if (debouncer.sample(45.0, thresholds) != risk_level::CRITICAL) {
    return fail("test_debouncer_require_one_reacts_immediately", "expected immediate critical");
  }
  if (debouncer.sample(40.0, thresholds) != risk_level::WARNING) {
    return fail("test_debouncer_require_one_reacts_immediately", "value equal to crit is only a warning breach");
  }
  return 0;
}

int test_zscore_detection() {
  if (detect_zscore({1.0, 50.0, 1.0}, 1.0).anomalous) {
    return fail("test_zscore_detection", "three samples are not enough");
  }

  const auto flat = detect_zscore({5.0, 5.0, 5.0, 5.0, 5.0}, 1.0);
  if (flat.anomalous || flat.z != 0.0) {
    return fail("test_zscore_detection", "zero spread must short-circuit");
  }

  const std::vector<double> spike{1.0, 1.0, 1.0, 1.0, 10.0};
  const auto loose = detect_zscore(spike, 2.5);
  if (!almost_equal(loose.z, 2.0) || loose.anomalous) {
    return fail("test_zscore_detection", "z of 2.0 under threshold 2.5 is not anomalous");
  }
  if (!detect_zscore(spike, 1.5).anomalous) {
    return fail("test_zscore_detection", "z of 2.0 over threshold 1.5 is anomalous");
  }
  return 0;
}

int test_ewma_detection() {
  if (detect_ewma({42.0}, 0.3, 2.0).anomalous) {
    return fail("test_ewma_detection", "single sample must not be evaluated");
  }

  const auto flat = detect_ewma({10.0, 10.0}, 0.3, 2.0);
  if (flat.anomalous || flat.deviation != 0.0) {
    return fail("test_ewma_detection", "flat history has no deviation");
  }
  const double flat_lambda = std::sqrt((0.3 / 1.7) * (1.0 - std::pow(0.7, 4.0)));
  if (!almost_equal(flat.control_limit, 2.0 * 1.0 * flat_lambda)) {
    return fail("test_ewma_detection", "zero spread should use unit std in the control limit");
  }

  const auto jump = detect_ewma({0.0, 0.0, 0.0, 0.0, 100.0}, 0.2, 1.8);
  const double lambda = std::sqrt((0.2 / 1.8) * (1.0 - std::pow(0.8, 10.0)));
  if (!almost_equal(jump.ewma, 20.0) || !almost_equal(jump.deviation, 80.0) ||
      !almost_equal(jump.control_limit, 1.8 * 40.0 * lambda)) {
    return fail("test_ewma_detection", "ewma statistics mismatch");
  }
  if (!jump.anomalous) {
    return fail("test_ewma_detection", "jump should breach the control limit");
  }
  return 0;
}

int test_dynamic_thresholds() {
  const auto fallback = compute_thresholds({10.0, 20.0, 30.0, 40.0});
  if (fallback.warn != 60.0 || fallback.crit != 80.0) {
    return fail("test_dynamic_thresholds", "short history should use 60/80");
  }

  const auto floor = compute_thresholds({10.0, 10.0, 10.0, 10.0, 10.0});
  if (!almost_equal(floor.warn, 30.0) || !almost_equal(floor.crit, 40.0)) {
    return fail("test_dynamic_thresholds", "low history should clamp to 30/40");
  }

  const auto spread = compute_thresholds({50.0, 60.0, 70.0, 80.0, 90.0});
  const double sigma = std::sqrt(200.0);
  if (!almost_equal(spread.warn, 70.0 + (0.5 * sigma)) || !almost_equal(spread.crit, 70.0 + sigma)) {
    return fail("test_dynamic_thresholds", "mean/std thresholds mismatch");
  }

  const auto ceiling = compute_thresholds({100.0, 100.0, 100.0, 100.0, 100.0});
  if (!almost_equal(ceiling.warn, 100.0) || !almost_equal(ceiling.crit, 100.0)) {
    return fail("test_dynamic_thresholds", "thresholds should clamp at 100");
  }
  return 0;
}

int test_rolling_window_evicts_oldest() {
  RollingWindow<double> window(3);
  for (int i = 1; i <= 5; ++i) {
    window.push(static_cast<double>(i));
  }

  if (window.size() != 3U || window.capacity() != 3U) {
    return fail("test_rolling_window_evicts_oldest", "size must not exceed capacity");
  }
  if (window.values() != std::vector<double>{3.0, 4.0, 5.0} || window[0] != 3.0 || window.back() != 5.0) {
    return fail("test_rolling_window_evicts_oldest", "oldest samples should be evicted first");
  }
  if (window.tail(2) != std::vector<double>{4.0, 5.0} || window.tail(10).size() != 3U) {
    return fail("test_rolling_window_evicts_oldest", "tail slicing mismatch");
  }

  bool threw = false;
  try {
    RollingWindow<double> empty(0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_rolling_window_evicts_oldest", "zero capacity must be rejected");
  }
  return 0;
}

int test_config_parses_engine_settings() {
  const auto path = write_config("cold_chain_config_engine.yaml",
                                 "product: seafood\n"
                                 "window: 12\n"
                                 "mode: simple   # static q10\n"
                                 "require_consecutive: 3\n"
                                 "input:\n"
                                 "  path: \"/tmp/readings.jsonl\"\n"
                                 "output:\n"
                                 "  stdout_debug: yes\n"
                                 "  json_lines: false\n"
                                 "redis:\n"
                                 "  address: unix:///var/run/redis/redis.sock\n"
                                 "  key_prefix: coldbox\n"
                                 "  db: 2\n");
  const MonitorConfig config = load_monitor_config(path.string());
  std::filesystem::remove(path);

  if (config.product != "seafood" || config.window != 12U || config.mode != rate_mode::SIMPLE ||
      config.require_consecutive != 3U) {
    return fail("test_config_parses_engine_settings", "engine settings mismatch");
  }
  if (config.input_path != "/tmp/readings.jsonl" || !config.stdout_debug || config.json_lines) {
    return fail("test_config_parses_engine_settings", "input/output settings mismatch");
  }
  if (!config.redis.enabled || config.redis.unix_socket != "/var/run/redis/redis.sock" ||
      config.redis.key_prefix != "coldbox" || config.redis.db != 2) {
    return fail("test_config_parses_engine_settings", "redis settings mismatch");
  }
  return 0;
}

int test_config_defaults_when_sections_missing() {
  const auto path = write_config("cold_chain_config_defaults.yaml", "window: 30\n");
  const MonitorConfig config = load_monitor_config(path.string());
  std::filesystem::remove(path);

  if (config.product != "vaccine" || config.mode != rate_mode::ADAPTIVE || config.require_consecutive != 2U) {
    return fail("test_config_defaults_when_sections_missing", "engine defaults mismatch");
  }
  if (config.redis.enabled || !config.json_lines || config.stdout_debug) {
    return fail("test_config_defaults_when_sections_missing", "sink defaults mismatch");
  }
  if (config.profiles.products().size() != 3U) {
    return fail("test_config_defaults_when_sections_missing", "builtin profiles should be loaded");
  }
  return 0;
}

int test_config_profile_overrides() {
  const auto path = write_config("cold_chain_config_profiles.yaml",
                                 "product: insulin\n"
                                 "profiles:\n"
                                 "  vaccine:\n"
                                 "    q10: 2.4\n"
                                 "    logistic:\n"
                                 "      slope: 9\n"
                                 "  insulin:\n"
                                 "    ref_temp: 5\n"
                                 "    max_safe_temp: 8\n"
                                 "    weights:\n"
                                 "      temp: 0.5\n"
                                 "      humidity: 0.05\n"
                                 "      door: 0.3\n"
                                 "      gas: 0.05\n"
                                 "      interaction: 0.05\n"
                                 "      outside: 0.05\n"
                                 "    alerts:\n"
                                 "      high_temp: \"Insulin above 8 C\"\n");
  const MonitorConfig config = load_monitor_config(path.string());
  std::filesystem::remove(path);

  const auto& vaccine = config.profiles.find("vaccine");
  if (!almost_equal(vaccine.q10, 2.4) || !almost_equal(vaccine.logistic.slope, 9.0) ||
      !almost_equal(vaccine.ref_temp_c, 5.0) || !almost_equal(vaccine.logistic.midpoint, 50.0)) {
    return fail("test_config_profile_overrides", "override should keep untouched builtin fields");
  }

  if (!config.profiles.contains("insulin")) {
    return fail("test_config_profile_overrides", "new product should be registered");
  }
  const auto& insulin = config.profiles.find("insulin");
  if (!almost_equal(insulin.weights.door, 0.3) || insulin.alerts.high_temp != "Insulin above 8 C") {
    return fail("test_config_profile_overrides", "new product fields mismatch");
  }
  return 0;
}

int test_config_rejects_invalid_values() {
  if (!config_throws("cold_chain_bad_window.yaml", "window: 0\n")) {
    return fail("test_config_rejects_invalid_values", "window 0 should throw");
  }
  if (!config_throws("cold_chain_bad_mode.yaml", "mode: turbo\n")) {
    return fail("test_config_rejects_invalid_values", "unknown mode should throw");
  }
  if (!config_throws("cold_chain_bad_number.yaml", "window: thirty\n")) {
    return fail("test_config_rejects_invalid_values", "non-numeric window should throw");
  }
  if (!config_throws("cold_chain_bad_port.yaml", "redis:\n  address: localhost:70000\n")) {
    return fail("test_config_rejects_invalid_values", "redis port > 65535 should throw");
  }
  if (!config_throws("cold_chain_bad_product.yaml", "product: caviar\n")) {
    return fail("test_config_rejects_invalid_values", "product without profile should throw");
  }
  if (!config_throws("cold_chain_bad_weights.yaml", "profiles:\n  fruit:\n    weights:\n      temp: 0.9\n")) {
    return fail("test_config_rejects_invalid_values", "weights not summing to 1 should throw");
  }
  if (!config_throws("cold_chain_bad_field.yaml", "profiles:\n  fruit:\n    colour: red\n")) {
    return fail("test_config_rejects_invalid_values", "unknown profile field should throw");
  }
  if (!config_throws("cold_chain_bad_consecutive.yaml", "require_consecutive: 0\n")) {
    return fail("test_config_rejects_invalid_values", "require_consecutive 0 should throw");
  }
  return 0;
}

int test_config_missing_file_throws() {
  try {
    (void)load_monitor_config("/nonexistent/cold_chain.yaml");
  } catch (const std::runtime_error&) {
    return 0;
  }
  return fail("test_config_missing_file_throws", "missing config file should throw");
}

}  // namespace

int main() {
  if (int rc = test_debouncer_single_breach_does_not_escalate(); rc != 0) {
    return rc;
  }
  if (int rc = test_debouncer_warning_and_counter_decay(); rc != 0) {
    return rc;
  }
  if (int rc = test_debouncer_require_one_reacts_immediately(); rc != 0) {
    return rc;
  }
  if (int rc = test_zscore_detection(); rc != 0) {
    return rc;
  }
  if (int rc = test_ewma_detection(); rc != 0) {
    return rc;
  }
  if (int rc = test_dynamic_thresholds(); rc != 0) {
    return rc;
  }
  if (int rc = test_rolling_window_evicts_oldest(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_parses_engine_settings(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_defaults_when_sections_missing(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_profile_overrides(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_rejects_invalid_values(); rc != 0) {
    return rc;
  }
  if (int rc = test_config_missing_file_throws(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] risk unit tests\n";
  return 0;
}

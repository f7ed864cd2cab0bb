#include <csignal>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "core/config.hpp"
#include "core/monitor.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void request_stop(int /*signal*/) {
  g_stop_requested = 1;
}

}  // namespace

std::string format_config_settings(const cold_chain::core::MonitorConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[monitor] loaded config from " << config_path
         << " | product=" << config.product
         << " | window=" << config.window
         << " | mode=" << cold_chain::model::to_string(config.mode)
         << " | require_consecutive=" << config.require_consecutive
         << " | input=" << (config.input_path.empty() ? "stdin" : config.input_path)
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | json_lines=" << (config.json_lines ? "true" : "false")
         << " | products=";
  const auto products = config.profiles.products();
  for (std::size_t i = 0; i < products.size(); ++i) {
    output << (i == 0 ? "" : ",") << products[i];
  }

  output << " | redis=";
  if (!config.redis.enabled) {
    output << "off";
  } else if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port << " prefix=" << config.redis.key_prefix;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, request_stop);
  std::signal(SIGTERM, request_stop);

  cold_chain::core::MonitorConfig config{};
  std::string config_path = "defaults";
  if (argc > 1) {
    config_path = argv[1];
    try {
      config = cold_chain::core::load_monitor_config(config_path);
    } catch (const std::exception& ex) {
      std::cerr << "[config] error: " << ex.what() << '\n';
      return 1;
    }
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::ifstream file_input;
  if (!config.input_path.empty()) {
    file_input.open(config.input_path);
    if (!file_input.is_open()) {
      std::cerr << "[monitor] unable to open input " << config.input_path << '\n';
      return 1;
    }
  }
  std::istream& input = config.input_path.empty() ? std::cin : file_input;

  cold_chain::core::Monitor monitor{config, std::cout};
  const auto stats = monitor.run(input, &g_stop_requested);

  if (g_stop_requested != 0) {
    std::cerr << "[monitor] shutdown signal received; exiting cleanly\n";
  }
  std::cerr << "[monitor] received=" << stats.readings_received << " scored=" << stats.readings_scored
            << " rejected=" << stats.readings_rejected << " sink_failures=" << stats.sink_failures << '\n';

  return 0;
}

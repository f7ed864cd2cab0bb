#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "model/spoilage_result.hpp"
#include "profile/profile_catalog.hpp"

namespace cold_chain::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"coldchain"};
  bool enabled{false};
};

struct MonitorConfig {
  std::string product{"vaccine"};
  std::size_t window{30};
  model::rate_mode mode{model::rate_mode::ADAPTIVE};
  std::uint32_t require_consecutive{2};
  std::string input_path{};
  bool stdout_debug{false};
  bool json_lines{true};
  RedisConfig redis{};
  profile::ProfileCatalog profiles{profile::ProfileCatalog::builtin()};
};

MonitorConfig load_monitor_config(const std::string& path);

}  // namespace cold_chain::core

#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace cold_chain::core {
namespace {

constexpr std::size_t kMaxWindow = 10000;
constexpr const char* kWhitespace = " \t\r";

// One scalar from the YAML subset, keyed by its dotted section path.
struct ConfigEntry {
  std::size_t line{0};
  std::string key{};
  std::string value{};
};

std::string strip(const std::string& text) {
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string unquote(const std::string& value) {
  const bool quoted = value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front();
  return quoted ? value.substr(1, value.size() - 2) : value;
}

bool parse_bool(const std::string& key, const std::string& value) {
  const std::string flag = lowercase(unquote(value));
  if (flag == "true" || flag == "yes" || flag == "on" || flag == "1") {
    return true;
  }
  if (flag == "false" || flag == "no" || flag == "off" || flag == "0") {
    return false;
  }
  throw std::runtime_error(key + " must be a boolean, got '" + value + "'");
}

double parse_double(const std::string& key, const std::string& value) {
  char* tail = nullptr;
  errno = 0;
  const double parsed = std::strtod(value.c_str(), &tail);
  if (errno != 0 || tail == value.c_str() || *tail != '\0' || !std::isfinite(parsed)) {
    throw std::runtime_error(key + " must be a number, got '" + value + "'");
  }
  return parsed;
}

long long parse_integer(const std::string& key, const std::string& value) {
  char* tail = nullptr;
  errno = 0;
  const long long parsed = std::strtoll(value.c_str(), &tail, 10);
  if (errno != 0 || tail == value.c_str() || *tail != '\0') {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  return parsed;
}

// Flattens nested "section:" blocks into dotted keys. Nesting follows
// indentation depth; comments start at '#'.
std::vector<ConfigEntry> flatten(std::istream& input) {
  struct Section {
    std::size_t indent;
    std::string name;
  };

  std::vector<ConfigEntry> entries;
  std::vector<Section> open_sections;
  std::string raw;
  std::size_t line_no = 0;
  while (std::getline(input, raw)) {
    ++line_no;
    const std::string line = raw.substr(0, raw.find('#'));
    const std::string text = strip(line);
    if (text.empty()) {
      continue;
    }

    const std::size_t indent = line.find_first_not_of(' ');
    const auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0) {
      throw std::runtime_error("line " + std::to_string(line_no) + ": expected 'key: value'");
    }

    while (!open_sections.empty() && open_sections.back().indent >= indent) {
      open_sections.pop_back();
    }

    const std::string name = strip(text.substr(0, colon));
    const std::string value = strip(text.substr(colon + 1));
    if (value.empty()) {
      open_sections.push_back({indent, name});
      continue;
    }

    std::string key;
    for (const auto& section : open_sections) {
      key += section.name + '.';
    }
    entries.push_back({line_no, key + name, value});
  }
  return entries;
}

// profiles.<product>.<field> where field may itself be nested
// (weights.temp, logistic.slope, alerts.high_temp).
void apply_profile_field(model::base_profile& p, const std::string& key, const std::string& field,
                         const std::string& value) {
  if (field == "q10") {
    p.q10 = parse_double(key, value);
  } else if (field == "ref_temp") {
    p.ref_temp_c = parse_double(key, value);
  } else if (field == "z_threshold") {
    p.z_threshold = parse_double(key, value);
  } else if (field == "ewma_threshold") {
    p.ewma_threshold = parse_double(key, value);
  } else if (field == "ewma_alpha") {
    p.ewma_alpha = parse_double(key, value);
  } else if (field == "max_safe_temp") {
    p.max_safe_temp_c = parse_double(key, value);
  } else if (field == "min_rate") {
    p.min_rate = parse_double(key, value);
  } else if (field == "max_rate") {
    p.max_rate = parse_double(key, value);
  } else if (field == "weights.temp") {
    p.weights.temperature = parse_double(key, value);
  } else if (field == "weights.humidity") {
    p.weights.humidity = parse_double(key, value);
  } else if (field == "weights.door") {
    p.weights.door = parse_double(key, value);
  } else if (field == "weights.gas") {
    p.weights.gas = parse_double(key, value);
  } else if (field == "weights.interaction") {
    p.weights.interaction = parse_double(key, value);
  } else if (field == "weights.outside") {
    p.weights.outside = parse_double(key, value);
  } else if (field == "logistic.midpoint") {
    p.logistic.midpoint = parse_double(key, value);
  } else if (field == "logistic.slope") {
    p.logistic.slope = parse_double(key, value);
  } else if (field == "adaptive_q10") {
    p.adaptive_q10 = parse_bool(key, value);
  } else if (field == "adaptive_ewma") {
    p.adaptive_ewma = parse_bool(key, value);
  } else if (field == "adaptive_window") {
    const auto window = parse_integer(key, value);
    if (window <= 0) {
      throw std::runtime_error(key + " must be greater than 0");
    }
    p.adaptive_window = static_cast<unsigned>(window);
  } else if (field == "alerts.high_temp") {
    p.alerts.high_temp = unquote(value);
  } else if (field == "alerts.rapid_spoilage") {
    p.alerts.rapid_spoilage = unquote(value);
  } else {
    throw std::runtime_error("unknown profile field: " + key);
  }
}

void apply_redis_address(RedisConfig& redis, const std::string& address) {
  redis.enabled = !address.empty();
  redis.unix_socket.clear();

  constexpr const char* kUnixScheme = "unix://";
  const bool unix_scheme = address.rfind(kUnixScheme, 0) == 0;
  if (unix_scheme || (!address.empty() && address.front() == '/')) {
    redis.unix_socket = unix_scheme ? address.substr(std::strlen(kUnixScheme)) : address;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  const auto colon = address.rfind(':');
  redis.host = address.substr(0, colon);
  if (colon == std::string::npos) {
    return;
  }

  const auto port = parse_integer("redis.address port", address.substr(colon + 1));
  if (port < 1 || port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }
  redis.port = static_cast<std::uint16_t>(port);
}

void apply_key_value(MonitorConfig& config, std::map<std::string, model::base_profile>& drafts, const std::string& key,
                     const std::string& value) {
  if (key == "product") {
    config.product = unquote(value);
    return;
  }

  if (key == "window") {
    const auto window = parse_integer(key, value);
    if (window <= 0) {
      throw std::runtime_error("window must be greater than 0");
    }
    if (static_cast<std::size_t>(window) > kMaxWindow) {
      throw std::runtime_error("window must be less than or equal to 10000");
    }
    config.window = static_cast<std::size_t>(window);
    return;
  }

  if (key == "mode") {
    const std::string mode = lowercase(value);
    if (mode == "adaptive") {
      config.mode = model::rate_mode::ADAPTIVE;
    } else if (mode == "simple") {
      config.mode = model::rate_mode::SIMPLE;
    } else {
      throw std::runtime_error("mode must be 'adaptive' or 'simple'");
    }
    return;
  }

  if (key == "require_consecutive") {
    const auto count = parse_integer(key, value);
    if (count <= 0) {
      throw std::runtime_error("require_consecutive must be greater than 0");
    }
    config.require_consecutive = static_cast<std::uint32_t>(count);
    return;
  }

  if (key == "input.path") {
    config.input_path = unquote(value);
    return;
  }

  if (key == "output.stdout_debug") {
    config.stdout_debug = parse_bool(key, value);
    return;
  }

  if (key == "output.json_lines") {
    config.json_lines = parse_bool(key, value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, unquote(value));
    return;
  }

  if (key == "redis.password") {
    config.redis.password = unquote(value);
    return;
  }

  if (key == "redis.db") {
    const auto db = parse_integer(key, value);
    if (db < 0) {
      throw std::runtime_error("redis.db must be greater than or equal to 0");
    }
    config.redis.db = static_cast<int>(db);
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = unquote(value);
    return;
  }

  if (key.rfind("profiles.", 0) == 0) {
    const std::string rest = key.substr(std::string("profiles.").size());
    const auto split = rest.find('.');
    if (split == std::string::npos || split == 0) {
      throw std::runtime_error("profile entry needs a product and a field: " + key);
    }
    const std::string product = rest.substr(0, split);
    auto it = drafts.find(product);
    if (it == drafts.end()) {
      model::base_profile draft{};
      if (config.profiles.contains(product)) {
        draft = config.profiles.find(product);
      }
      it = drafts.emplace(product, draft).first;
    }
    apply_profile_field(it->second, key, rest.substr(split + 1), value);
  }
}

}  // namespace

MonitorConfig load_monitor_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  MonitorConfig config{};
  std::map<std::string, model::base_profile> drafts;
  for (const ConfigEntry& entry : flatten(input)) {
    try {
      apply_key_value(config, drafts, entry.key, entry.value);
    } catch (const std::runtime_error& ex) {
      throw std::runtime_error("line " + std::to_string(entry.line) + ": " + ex.what());
    }
  }

  for (const auto& [product, draft] : drafts) {
    try {
      config.profiles.register_profile(product, draft);
    } catch (const std::invalid_argument& ex) {
      throw std::runtime_error(ex.what());
    }
  }

  if (!config.profiles.contains(config.product)) {
    throw std::runtime_error("product '" + config.product + "' has no profile");
  }

  return config;
}

}  // namespace cold_chain::core

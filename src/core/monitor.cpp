#include "core/monitor.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "sources/reading_parser.hpp"

namespace cold_chain::core {
namespace {

engine::EngineOptions engine_options(const MonitorConfig& config) {
  engine::EngineOptions options{};
  options.window = config.window;
  options.mode = config.mode;
  options.require_consecutive = config.require_consecutive;
  return options;
}

sinks::RedisTsOptions redis_options(const RedisConfig& redis) {
  sinks::RedisTsOptions options{};
  options.host = redis.host;
  options.port = redis.port;
  options.unix_socket = redis.unix_socket;
  options.password = redis.password;
  options.db = redis.db;
  options.key_prefix = redis.key_prefix;
  return options;
}

std::string redis_endpoint(const RedisConfig& redis) {
  if (!redis.unix_socket.empty()) {
    return "unix://" + redis.unix_socket;
  }
  return redis.host + ':' + std::to_string(redis.port);
}

bool is_blank(const std::string& line) {
  return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

Monitor::Monitor(MonitorConfig config, std::ostream& out)
    : engine_(config.product, engine_options(config), std::move(config.profiles)),
      publish_stdout_(config.stdout_debug),
      publish_json_(config.json_lines),
      json_sink_(out) {
  if (config.redis.enabled) {
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(redis_options(config.redis));
    const bool reachable = redis_sink_->check_connectivity();
    std::cerr << "[monitor] redis connectivity " << (reachable ? "confirmed" : "check failed") << " at "
              << redis_endpoint(config.redis) << '\n';
  }

  std::cerr << "[monitor] engine ready product=" << engine_.product() << " window=" << engine_.window()
            << " mode=" << model::to_string(engine_.mode()) << '\n';
}

std::optional<model::spoilage_result> Monitor::process_line(const std::string& line) {
  if (is_blank(line)) {
    return std::nullopt;
  }
  ++stats_.readings_received;

  model::spoilage_result result{};
  try {
    result = engine_.update(sources::parse_reading_line(line));
  } catch (const std::invalid_argument& ex) {
    ++stats_.readings_rejected;
    std::cerr << "[monitor] rejected reading #" << stats_.readings_received << ": " << ex.what() << '\n';
    return std::nullopt;
  }

  ++stats_.readings_scored;
  publish_sinks(result);
  return result;
}

MonitorStats Monitor::run(std::istream& in, const volatile std::sig_atomic_t* stop) {
  std::string line;
  while ((stop == nullptr || *stop == 0) && std::getline(in, line)) {
    (void)process_line(line);
  }
  return stats_;
}

void Monitor::publish_sinks(const model::spoilage_result& result) {
  ++stats_.sink_cycles;

  if (publish_stdout_) {
    stdout_sink_.publish(result);
  }

  if (publish_json_ && !json_sink_.publish(result)) {
    ++stats_.sink_failures;
  }

  if (redis_sink_ == nullptr) {
    return;
  }
  const bool ok = redis_sink_->publish(result);
  if (!ok) {
    ++stats_.sink_failures;
  }
  // Logged on transitions only.
  if (ok != redis_healthy_) {
    std::cerr << "[redis] publish " << (ok ? "recovered" : "failed") << " for product=" << result.product << '\n';
    redis_healthy_ = ok;
  }
}

}  // namespace cold_chain::core

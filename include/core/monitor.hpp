#pragma once

#include <csignal>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "engine/spoilage_engine.hpp"
#include "model/spoilage_result.hpp"
#include "sinks/json_lines.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace cold_chain::core {

struct MonitorStats {
  std::size_t readings_received{0};
  std::size_t readings_scored{0};
  std::size_t readings_rejected{0};
  std::size_t sink_cycles{0};
  std::size_t sink_failures{0};
};

// Drives one engine from a line-oriented reading source into the configured
// sinks.
class Monitor {
 public:
  Monitor(MonitorConfig config, std::ostream& out);

  // Scores one JSON reading line. Blank lines are ignored. Rejected readings
  // are logged and counted; the stream carries on.
  std::optional<model::spoilage_result> process_line(const std::string& line);

  // Consumes lines until EOF or until `stop` becomes non-zero.
  MonitorStats run(std::istream& in, const volatile std::sig_atomic_t* stop = nullptr);

  [[nodiscard]] const MonitorStats& stats() const noexcept { return stats_; }
  [[nodiscard]] const engine::SpoilageEngine& engine() const noexcept { return engine_; }

 private:
  void publish_sinks(const model::spoilage_result& result);

  engine::SpoilageEngine engine_;
  MonitorStats stats_{};
  bool publish_stdout_{false};
  bool publish_json_{true};
  sinks::StdoutDebugSink stdout_sink_{};
  sinks::JsonLinesSink json_sink_;
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_healthy_{true};
};

}  // namespace cold_chain::core

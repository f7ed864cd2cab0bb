#pragma once

#include <iosfwd>

#include <nlohmann/json.hpp>

#include "model/spoilage_result.hpp"

namespace cold_chain::sinks {

nlohmann::json to_json(const model::spoilage_result& result);

// One serialized result per line.
class JsonLinesSink {
 public:
  explicit JsonLinesSink(std::ostream& out) noexcept;

  bool publish(const model::spoilage_result& result);

 private:
  std::ostream* out_;
};

}  // namespace cold_chain::sinks

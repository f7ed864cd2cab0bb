#pragma once

#include "model/spoilage_result.hpp"

namespace cold_chain::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::spoilage_result& result) const;
};

}  // namespace cold_chain::sinks

#pragma once

#include <stdexcept>

namespace cold_chain::core {

// Profile lookup miss.
class UnknownProduct : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Door flag or outside temperature outside the realistic envelope.
class InvalidInput : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Missing or unparseable required field. The reading is rejected and the
// engine state is left untouched.
class InvalidReading : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

}  // namespace cold_chain::core

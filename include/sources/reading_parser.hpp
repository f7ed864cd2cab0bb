#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "model/reading.hpp"

namespace cold_chain::sources {

// Maps a reading record onto model::reading. Required numbers accept JSON
// numbers or numeric strings; door_open accepts booleans or integers. Throws
// core::InvalidReading.
model::reading parse_reading(const nlohmann::json& record);

// One JSON object per line.
model::reading parse_reading_line(const std::string& line);

}  // namespace cold_chain::sources

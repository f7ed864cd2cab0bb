#include "sources/reading_parser.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

#include "core/errors.hpp"

namespace cold_chain::sources {
namespace {

double parse_number_text(const std::string& text, const char* field) {
  const char* begin = text.c_str();
  char* end = nullptr;
  errno = 0;
  const double parsed = std::strtod(begin, &end);
  if (errno != 0 || end == begin) {
    throw core::InvalidReading(std::string(field) + " is not a number: '" + text + "'");
  }
  while (*end == ' ' || *end == '\t') {
    ++end;
  }
  if (*end != '\0') {
    throw core::InvalidReading(std::string(field) + " is not a number: '" + text + "'");
  }
  return parsed;
}

double to_number(const nlohmann::json& value, const char* field) {
  double parsed = 0.0;
  if (value.is_number()) {
    parsed = value.get<double>();
  } else if (value.is_string()) {
    parsed = parse_number_text(value.get<std::string>(), field);
  } else {
    throw core::InvalidReading(std::string(field) + " must be a number");
  }

  if (!std::isfinite(parsed)) {
    throw core::InvalidReading(std::string(field) + " must be a finite number");
  }
  return parsed;
}

double required_number(const nlohmann::json& record, const char* field) {
  const auto it = record.find(field);
  if (it == record.end() || it->is_null()) {
    throw core::InvalidReading(std::string("missing required field ") + field);
  }
  return to_number(*it, field);
}

int door_flag(const nlohmann::json& record) {
  const auto it = record.find("door_open");
  if (it == record.end() || it->is_null()) {
    throw core::InvalidReading("missing required field door_open");
  }
  if (it->is_boolean()) {
    return it->get<bool>() ? 1 : 0;
  }

  // Range is checked by the profile derivation (InvalidInput), only the shape here.
  const double value = to_number(*it, "door_open");
  if (value != std::floor(value)) {
    throw core::InvalidReading("door_open must be an integer flag");
  }
  if (std::fabs(value) > 1e6) {
    throw core::InvalidReading("door_open out of range");
  }
  return static_cast<int>(value);
}

}  // namespace

model::reading parse_reading(const nlohmann::json& record) {
  if (!record.is_object()) {
    throw core::InvalidReading("reading must be a JSON object");
  }

  model::reading reading{};

  const auto ts_it = record.find("ts");
  if (ts_it != record.end() && !ts_it->is_null()) {
    reading.ts = to_number(*ts_it, "ts");
  }

  const auto product_it = record.find("product");
  if (product_it != record.end() && !product_it->is_null()) {
    if (!product_it->is_string()) {
      throw core::InvalidReading("product must be a string");
    }
    reading.product = product_it->get<std::string>();
  }

  reading.temp_inside_c = required_number(record, "temp_inside_c");
  reading.temp_outside_c = required_number(record, "temp_outside_c");
  reading.humidity_pct = required_number(record, "humidity_pct");
  reading.door_open = door_flag(record);

  const auto gas_it = record.find("gas_ppm");
  if (gas_it != record.end() && !gas_it->is_null()) {
    reading.gas_ppm = to_number(*gas_it, "gas_ppm");
  }

  return reading;
}

model::reading parse_reading_line(const std::string& line) {
  nlohmann::json record;
  try {
    record = nlohmann::json::parse(line);
  } catch (const nlohmann::json::parse_error& ex) {
    throw core::InvalidReading(std::string("malformed reading: ") + ex.what());
  }
  return parse_reading(record);
}

}  // namespace cold_chain::sources

#include "telemetry/telemetry_event.hpp"

#include "core/json_utils.hpp"

#include <cmath>
#include <sstream>

namespace wellwatch::telemetry {

const char* ToString(Metric metric) {
  switch (metric) {
  case Metric::kTemperature:
    return "temperature";
  case Metric::kPressure:
    return "pressure";
  }
  return "unknown";
}

bool ParseMetric(const std::string& raw, Metric& metric) {
  if (raw == "temperature") {
    metric = Metric::kTemperature;
    return true;
  }
  if (raw == "pressure") {
    metric = Metric::kPressure;
    return true;
  }
  return false;
}

double MetricValue(const TelemetryEvent& event, Metric metric) {
  return metric == Metric::kTemperature ? event.temperature : event.pressure;
}

bool ValidateEvent(const TelemetryEvent& event, std::string& error) {
  if (event.device_id.empty()) {
    error = "device_id must not be empty";
    return false;
  }
  if (!std::isfinite(event.timestamp)) {
    error = "timestamp must be a finite number";
    return false;
  }
  if (event.timestamp < 0.0) {
    error = "timestamp must be >= 0 (got " + core::FormatFixed(event.timestamp, 3) + ")";
    return false;
  }
  if (!std::isfinite(event.temperature)) {
    error = "temperature must be a finite number";
    return false;
  }
  if (!std::isfinite(event.pressure)) {
    error = "pressure must be a finite number";
    return false;
  }
  error.clear();
  return true;
}

std::string ToJson(const TelemetryEvent& event) {
  std::ostringstream out;
  out << "{\"device_id\":" << core::QuoteJson(event.device_id)
      << ",\"ts\":" << core::FormatJsonNumber(event.timestamp, 15)
      << ",\"temperature\":" << core::FormatJsonNumber(event.temperature)
      << ",\"pressure\":" << core::FormatJsonNumber(event.pressure)
      << ",\"status\":" << core::QuoteJson(event.status);
  if (!event.metadata.empty()) {
    out << ",\"metadata\":{";
    bool first = true;
    for (const auto& [key, value] : event.metadata) {
      if (!first) {
        out << ',';
      }
      out << core::QuoteJson(key) << ':' << core::QuoteJson(value);
      first = false;
    }
    out << '}';
  }
  out << '}';
  return out.str();
}

} // namespace wellwatch::telemetry

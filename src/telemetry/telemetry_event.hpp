#pragma once

#include <map>
#include <string>

namespace wellwatch::telemetry {

// Default operational status carried by devices that report nothing else.
inline constexpr const char* kDefaultStatus = "OK";

// One timestamped sensor reading from a device.
//
// - `timestamp`: epoch seconds, fractional allowed, must be >= 0.
// - `temperature` / `pressure`: must be finite.
// - `metadata`: free-form string attributes; sorted so serialization is stable.
//
// Events are treated as immutable values once they enter the pipeline.
struct TelemetryEvent {
  std::string device_id;
  double timestamp = 0.0;
  double temperature = 0.0;
  double pressure = 0.0;
  std::string status = kDefaultStatus;
  std::map<std::string, std::string> metadata;

  bool operator==(const TelemetryEvent& other) const = default;
};

// The two metrics every detector understands.
enum class Metric {
  kTemperature,
  kPressure,
};

const char* ToString(Metric metric);
bool ParseMetric(const std::string& raw, Metric& metric);
double MetricValue(const TelemetryEvent& event, Metric metric);

// Ingestion-boundary validation.
//
// Rejects: empty device id, non-finite or negative timestamp, non-finite
// temperature or pressure. Returns false with a human-readable `error`.
bool ValidateEvent(const TelemetryEvent& event, std::string& error);

std::string ToJson(const TelemetryEvent& event);

} // namespace wellwatch::telemetry

#include "health/health_scorer.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "detection/window_stats.hpp"

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <utility>

namespace wellwatch::health {
namespace {

constexpr double kPenaltyPerAlert = 0.1;
constexpr double kMaxAlertPenalty = 0.5;

// A non-positive `std_bad` treats any spread as fully unstable.
double Stability(double stddev, double std_bad) {
  if (!(std_bad > 0.0)) {
    return stddev > 0.0 ? 0.0 : 1.0;
  }
  return std::max(0.0, 1.0 - stddev / std_bad);
}

} // namespace

const char* ToString(HealthStatus status) {
  switch (status) {
  case HealthStatus::kHealthy:
    return "HEALTHY";
  case HealthStatus::kDegraded:
    return "DEGRADED";
  case HealthStatus::kCritical:
    return "CRITICAL";
  case HealthStatus::kNoData:
    return "NO_DATA";
  }
  return "NO_DATA";
}

HealthScorer::HealthScorer(config::HealthThresholds thresholds)
    : thresholds_(std::move(thresholds)) {}

DeviceHealth HealthScorer::Score(const std::string& device_id,
                                 const std::vector<telemetry::TelemetryEvent>& recent,
                                 std::size_t recent_alert_count) const {
  DeviceHealth health;
  health.device_id = device_id;
  health.recent_alert_count = recent_alert_count;
  if (recent.empty()) {
    health.status = HealthStatus::kNoData;
    return health;
  }

  const std::size_t take =
      std::min(recent.size(), std::max<std::size_t>(thresholds_.history_points, 1));
  const std::vector<telemetry::TelemetryEvent> window(
      recent.end() - static_cast<std::ptrdiff_t>(take), recent.end());
  health.samples = window.size();
  health.last_seen = window.back().timestamp;

  health.temperature_std =
      detection::Summarize(detection::MetricSeries(window, telemetry::Metric::kTemperature), 1)
          .stddev;
  health.pressure_std =
      detection::Summarize(detection::MetricSeries(window, telemetry::Metric::kPressure), 1)
          .stddev;
  health.temperature_stability =
      Stability(health.temperature_std, thresholds_.temperature_std_bad);
  health.pressure_stability = Stability(health.pressure_std, thresholds_.pressure_std_bad);
  health.alert_penalty =
      std::min(kMaxAlertPenalty, static_cast<double>(recent_alert_count) * kPenaltyPerAlert);

  const double stability = (health.temperature_stability + health.pressure_stability) / 2.0;
  health.score = std::clamp(stability - health.alert_penalty, 0.0, 1.0);

  if (health.score > thresholds_.healthy) {
    health.status = HealthStatus::kHealthy;
  } else if (health.score > thresholds_.degraded) {
    health.status = HealthStatus::kDegraded;
  } else {
    health.status = HealthStatus::kCritical;
  }
  return health;
}

std::string ToJson(const DeviceHealth& health) {
  using core::FormatJsonNumber;
  std::ostringstream out;
  out << "{\"device_id\":" << core::QuoteJson(health.device_id)
      << ",\"status\":" << core::QuoteJson(ToString(health.status))
      << ",\"score\":" << FormatJsonNumber(health.score)
      << ",\"temperature_stability\":" << FormatJsonNumber(health.temperature_stability)
      << ",\"pressure_stability\":" << FormatJsonNumber(health.pressure_stability)
      << ",\"temperature_std\":" << FormatJsonNumber(health.temperature_std)
      << ",\"pressure_std\":" << FormatJsonNumber(health.pressure_std)
      << ",\"alert_penalty\":" << FormatJsonNumber(health.alert_penalty)
      << ",\"recent_alert_count\":" << health.recent_alert_count
      << ",\"samples\":" << health.samples << ",\"last_seen\":"
      << (health.last_seen.has_value() ? core::QuoteJson(core::FormatEpochSeconds(*health.last_seen))
                                       : std::string("null"))
      << "}";
  return out.str();
}

} // namespace wellwatch::health

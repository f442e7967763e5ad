#pragma once

#include "config/pipeline_config.hpp"
#include "telemetry/telemetry_event.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wellwatch::health {

enum class HealthStatus {
  kHealthy,
  kDegraded,
  kCritical,
  kNoData,
};

const char* ToString(HealthStatus status);

struct DeviceHealth {
  std::string device_id;
  HealthStatus status = HealthStatus::kNoData;
  double score = 0.0;
  double temperature_stability = 0.0;
  double pressure_stability = 0.0;
  double temperature_std = 0.0;
  double pressure_std = 0.0;
  double alert_penalty = 0.0;
  std::size_t recent_alert_count = 0;
  std::size_t samples = 0;
  // Timestamp of the newest reading; empty with NO_DATA.
  std::optional<double> last_seen;
};

// Health from metric stability and recent alert pressure.
//
//   stability = max(0, 1 - std / std_bad)            per metric, sample std
//   penalty   = min(0.5, recent_alerts * 0.1)
//   score     = clamp(mean(stability) - penalty, 0, 1)
//
// Status: score > healthy -> HEALTHY, score > degraded -> DEGRADED, otherwise
// CRITICAL. A device without readings is NO_DATA.
class HealthScorer {
public:
  explicit HealthScorer(config::HealthThresholds thresholds);

  // `recent` holds the device's newest readings, oldest first; only the last
  // `history_points` of them are used.
  DeviceHealth Score(const std::string& device_id,
                     const std::vector<telemetry::TelemetryEvent>& recent,
                     std::size_t recent_alert_count) const;

  const config::HealthThresholds& thresholds() const {
    return thresholds_;
  }

private:
  config::HealthThresholds thresholds_;
};

std::string ToJson(const DeviceHealth& health);

} // namespace wellwatch::health

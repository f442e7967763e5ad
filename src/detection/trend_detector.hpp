#pragma once

#include "config/pipeline_config.hpp"
#include "detection/detector.hpp"

namespace wellwatch::detection {

// Per-reading slope over the device's most recent readings (current one
// included). Emits TEMPERATURE_TREND / PRESSURE_TREND findings when a slope
// exceeds its configured limit. Produces no verdict until
// `detector_min_points` readings exist.
class TrendDetector final : public IDetector {
public:
  explicit TrendDetector(config::TrendConfig trend);

  std::string Name() const override {
    return "trend";
  }

  DetectionMethod Method() const override {
    return DetectionMethod::kTrend;
  }

  bool Evaluate(const telemetry::TelemetryEvent& event,
                const std::vector<telemetry::TelemetryEvent>& history,
                std::optional<AnomalyVerdict>& verdict, std::string& error) const override;

private:
  config::TrendConfig trend_;
};

} // namespace wellwatch::detection

#pragma once

#include "config/pipeline_config.hpp"
#include "detection/detector.hpp"

namespace wellwatch::detection {

// Threshold rules evaluated on the current reading alone.
//
// Findings (each dispatched as its own alert):
// - TEMPERATURE_EXTREME / PRESSURE_EXTREME (CRITICAL): outside physical bounds
// - TEMPERATURE_HIGH / PRESSURE_HIGH (CRITICAL)
// - TEMPERATURE_LOW / PRESSURE_LOW (HIGH)
// - COMBINED_STRESS (HIGH): both metrics above their secondary thresholds
//
// A reading outside the widened normal range only contributes a reason and a
// score to the vote; it does not raise an alert on its own.
class RuleDetector final : public IDetector {
public:
  explicit RuleDetector(config::RuleThresholds rules);

  std::string Name() const override {
    return "rule_based";
  }

  DetectionMethod Method() const override {
    return DetectionMethod::kRuleBased;
  }

  bool Evaluate(const telemetry::TelemetryEvent& event,
                const std::vector<telemetry::TelemetryEvent>& history,
                std::optional<AnomalyVerdict>& verdict, std::string& error) const override;

private:
  config::RuleThresholds rules_;
};

} // namespace wellwatch::detection

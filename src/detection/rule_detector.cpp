#include "detection/rule_detector.hpp"

#include "core/json_utils.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace wellwatch::detection {
namespace {

constexpr double kExtremeScore = 1.0;
constexpr double kBreachScore = 0.9;
constexpr double kCombinedScore = 0.8;
constexpr double kNormalRangeScore = 0.6;

struct MetricLimits {
  double low = 0.0;
  double high = 0.0;
  double extreme_low = 0.0;
  double extreme_high = 0.0;
  double normal_min = 0.0;
  double normal_max = 0.0;
};

std::string UpperName(telemetry::Metric metric) {
  return metric == telemetry::Metric::kTemperature ? "TEMPERATURE" : "PRESSURE";
}

Finding MakeBreach(telemetry::Metric metric, const char* suffix, Severity severity, double value,
                   double threshold) {
  Finding finding;
  finding.alert_type = UpperName(metric) + "_" + suffix;
  finding.severity = severity;
  finding.message = std::string(telemetry::ToString(metric)) + " " + core::FormatFixed(value, 2) +
                    " breached threshold " + core::FormatFixed(threshold, 2);
  finding.details["value"] = core::FormatFixed(value, 2);
  finding.details["threshold"] = core::FormatFixed(threshold, 2);
  return finding;
}

void CheckMetric(telemetry::Metric metric, double value, const MetricLimits& limits,
                 double tolerance, AnomalyVerdict& verdict) {
  if (value > limits.extreme_high || value < limits.extreme_low) {
    const double bound = value > limits.extreme_high ? limits.extreme_high : limits.extreme_low;
    verdict.findings.push_back(MakeBreach(metric, "EXTREME", Severity::kCritical, value, bound));
    verdict.reasons.push_back(verdict.findings.back().message);
    verdict.score = std::max(verdict.score, kExtremeScore);
  } else if (value > limits.high) {
    verdict.findings.push_back(MakeBreach(metric, "HIGH", Severity::kCritical, value, limits.high));
    verdict.reasons.push_back(verdict.findings.back().message);
    verdict.score = std::max(verdict.score, kBreachScore);
  } else if (value < limits.low) {
    verdict.findings.push_back(MakeBreach(metric, "LOW", Severity::kHigh, value, limits.low));
    verdict.reasons.push_back(verdict.findings.back().message);
    verdict.score = std::max(verdict.score, kBreachScore);
  }

  const double normal_low = limits.normal_min * (1.0 - tolerance);
  const double normal_high = limits.normal_max * (1.0 + tolerance);
  if (value < normal_low || value > normal_high) {
    verdict.reasons.push_back(std::string(telemetry::ToString(metric)) + " " +
                              core::FormatFixed(value, 2) + " outside normal range [" +
                              core::FormatFixed(normal_low, 2) + ", " +
                              core::FormatFixed(normal_high, 2) + "]");
    verdict.score = std::max(verdict.score, kNormalRangeScore);
  }
}

} // namespace

RuleDetector::RuleDetector(config::RuleThresholds rules) : rules_(std::move(rules)) {}

bool RuleDetector::Evaluate(const telemetry::TelemetryEvent& event,
                            const std::vector<telemetry::TelemetryEvent>& /*history*/,
                            std::optional<AnomalyVerdict>& verdict, std::string& error) const {
  error.clear();

  AnomalyVerdict result;
  result.method = DetectionMethod::kRuleBased;

  CheckMetric(telemetry::Metric::kTemperature, event.temperature,
              MetricLimits{.low = rules_.temperature_low,
                           .high = rules_.temperature_high,
                           .extreme_low = rules_.temperature_extreme_low,
                           .extreme_high = rules_.temperature_extreme_high,
                           .normal_min = rules_.temperature_normal_min,
                           .normal_max = rules_.temperature_normal_max},
              rules_.normal_range_tolerance, result);
  CheckMetric(telemetry::Metric::kPressure, event.pressure,
              MetricLimits{.low = rules_.pressure_low,
                           .high = rules_.pressure_high,
                           .extreme_low = rules_.pressure_extreme_low,
                           .extreme_high = rules_.pressure_extreme_high,
                           .normal_min = rules_.pressure_normal_min,
                           .normal_max = rules_.pressure_normal_max},
              rules_.normal_range_tolerance, result);

  if (event.temperature > rules_.combined_temperature && event.pressure > rules_.combined_pressure) {
    Finding finding;
    finding.alert_type = "COMBINED_STRESS";
    finding.severity = Severity::kHigh;
    finding.message = "temperature " + core::FormatFixed(event.temperature, 2) + " and pressure " +
                      core::FormatFixed(event.pressure, 2) + " both above combined limits";
    finding.details["temperature"] = core::FormatFixed(event.temperature, 2);
    finding.details["pressure"] = core::FormatFixed(event.pressure, 2);
    result.reasons.push_back(finding.message);
    result.findings.push_back(std::move(finding));
    result.score = std::max(result.score, kCombinedScore);
  }

  result.is_anomaly = !result.reasons.empty();
  result.metrics["breaches"] = static_cast<double>(result.findings.size());
  verdict = std::move(result);
  return true;
}

} // namespace wellwatch::detection

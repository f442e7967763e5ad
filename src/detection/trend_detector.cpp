#include "detection/trend_detector.hpp"

#include "core/json_utils.hpp"
#include "detection/window_stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

namespace wellwatch::detection {

TrendDetector::TrendDetector(config::TrendConfig trend) : trend_(std::move(trend)) {}

bool TrendDetector::Evaluate(const telemetry::TelemetryEvent& event,
                             const std::vector<telemetry::TelemetryEvent>& history,
                             std::optional<AnomalyVerdict>& verdict, std::string& error) const {
  error.clear();
  const std::size_t available = history.size() + 1U;
  if (available < trend_.detector_min_points) {
    verdict.reset();
    return true;
  }

  const std::size_t from_history = std::min(history.size(), trend_.detector_window - 1U);
  std::vector<telemetry::TelemetryEvent> window(
      history.end() - static_cast<std::ptrdiff_t>(from_history), history.end());
  window.push_back(event);

  AnomalyVerdict result;
  result.method = DetectionMethod::kTrend;
  result.metrics["window_points"] = static_cast<double>(window.size());

  const struct {
    telemetry::Metric metric;
    const char* alert_type;
    double limit;
  } checks[] = {
      {telemetry::Metric::kTemperature, "TEMPERATURE_TREND", trend_.temperature_slope_alert},
      {telemetry::Metric::kPressure, "PRESSURE_TREND", trend_.pressure_slope_alert},
  };

  double strongest = 0.0;
  for (const auto& check : checks) {
    LinearFit fit;
    if (!FitLineByIndex(MetricSeries(window, check.metric), fit)) {
      error = std::string("unable to fit ") + telemetry::ToString(check.metric) + " trend";
      return false;
    }
    const std::string name = telemetry::ToString(check.metric);
    result.metrics[name + "_slope"] = fit.slope;
    strongest = std::max(strongest, std::abs(fit.slope) / check.limit);
    if (std::abs(fit.slope) <= check.limit) {
      continue;
    }

    const char* direction = fit.slope > 0.0 ? "INCREASING" : "DECREASING";
    Finding finding;
    finding.alert_type = check.alert_type;
    finding.severity = Severity::kMedium;
    finding.message = name + " trending " + direction + " at " + core::FormatFixed(fit.slope, 3) +
                      " per reading";
    finding.details["trend_value"] = core::FormatFixed(fit.slope, 4);
    finding.details["direction"] = direction;
    result.reasons.push_back(finding.message);
    result.findings.push_back(std::move(finding));
  }

  result.is_anomaly = !result.findings.empty();
  // A slope exactly at the limit maps to 0.5.
  result.score = ClampScore(strongest / 2.0);
  verdict = std::move(result);
  return true;
}

} // namespace wellwatch::detection

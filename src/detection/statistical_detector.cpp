#include "detection/statistical_detector.hpp"

#include "core/json_utils.hpp"
#include "detection/window_stats.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

namespace wellwatch::detection {

StatisticalDetector::StatisticalDetector(std::size_t window_size, std::size_t min_window,
                                         double z_threshold)
    : window_size_(window_size), min_window_(min_window), z_threshold_(z_threshold) {}

bool StatisticalDetector::Evaluate(const telemetry::TelemetryEvent& event,
                                   const std::vector<telemetry::TelemetryEvent>& history,
                                   std::optional<AnomalyVerdict>& verdict,
                                   std::string& error) const {
  error.clear();
  if (history.size() < min_window_) {
    verdict = MakeInsufficientDataVerdict(history.size(), min_window_);
    return true;
  }

  const std::size_t take = std::min(history.size(), window_size_);
  const std::vector<telemetry::TelemetryEvent> window(
      history.end() - static_cast<std::ptrdiff_t>(take), history.end());

  AnomalyVerdict result;
  result.method = DetectionMethod::kStatistical;
  double max_z = 0.0;
  for (const telemetry::Metric metric :
       {telemetry::Metric::kTemperature, telemetry::Metric::kPressure}) {
    const std::string name = telemetry::ToString(metric);
    const SeriesStats stats = Summarize(MetricSeries(window, metric), 0);
    const double z = ZScore(telemetry::MetricValue(event, metric), stats);
    result.metrics[name + "_z"] = z;
    result.metrics[name + "_mean"] = stats.mean;
    result.metrics[name + "_std"] = stats.stddev;
    max_z = std::max(max_z, z);
    if (z > z_threshold_) {
      result.is_anomaly = true;
      result.reasons.push_back(name + " z-score " + core::FormatFixed(z, 2) + " exceeds " +
                               core::FormatFixed(z_threshold_, 2));
    }
  }
  result.metrics["max_z"] = max_z;
  result.metrics["window_points"] = static_cast<double>(take);
  result.score = ClampScore(max_z / (2.0 * z_threshold_));
  verdict = std::move(result);
  return true;
}

} // namespace wellwatch::detection

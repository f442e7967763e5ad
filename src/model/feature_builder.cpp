#include "model/feature_builder.hpp"

#include "detection/window_stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numbers>
#include <string>

namespace wellwatch::model {
namespace {

constexpr double kSecondsPerHour = 3600.0;
constexpr double kSecondsPerDay = 86400.0;
constexpr double kRatioEpsilon = 1e-8;

void AddMetricFeatures(const telemetry::TelemetryEvent& event,
                       const std::vector<telemetry::TelemetryEvent>& window,
                       const std::vector<telemetry::TelemetryEvent>& history,
                       telemetry::Metric metric, FeatureVector& features) {
  const std::string prefix = telemetry::ToString(metric);
  const double value = telemetry::MetricValue(event, metric);
  const detection::SeriesStats stats =
      detection::Summarize(detection::MetricSeries(window, metric), 1);

  features[prefix] = value;
  features[prefix + "_rolling_mean"] = stats.mean;
  features[prefix + "_rolling_std"] = stats.stddev;
  features[prefix + "_rate_of_change"] =
      history.empty() ? 0.0 : value - telemetry::MetricValue(history.back(), metric);
  features[prefix + "_z_score"] = (value - stats.mean) / (stats.stddev + detection::kStdEpsilon);
}

} // namespace

FeatureBuilder::FeatureBuilder(std::size_t window_size)
    : window_size_(std::max<std::size_t>(window_size, 1U)) {}

FeatureVector FeatureBuilder::Build(const telemetry::TelemetryEvent& event,
                                    const std::vector<telemetry::TelemetryEvent>& history) const {
  const std::size_t from_history = std::min(history.size(), window_size_ - 1U);
  std::vector<telemetry::TelemetryEvent> window(
      history.end() - static_cast<std::ptrdiff_t>(from_history), history.end());
  window.push_back(event);

  FeatureVector features;
  AddMetricFeatures(event, window, history, telemetry::Metric::kTemperature, features);
  AddMetricFeatures(event, window, history, telemetry::Metric::kPressure, features);

  features["temp_pressure_ratio"] = event.temperature / (event.pressure + kRatioEpsilon);
  features["temp_pressure_product"] = event.temperature * event.pressure;

  const double days = std::floor(event.timestamp / kSecondsPerDay);
  const double hour = std::floor(std::fmod(event.timestamp, kSecondsPerDay) / kSecondsPerHour);
  // 1970-01-01 was a Thursday; Monday is day 0.
  const double day_of_week = std::fmod(days + 3.0, 7.0);
  const double two_pi = 2.0 * std::numbers::pi;
  features["hour_sin"] = std::sin(two_pi * hour / 24.0);
  features["hour_cos"] = std::cos(two_pi * hour / 24.0);
  features["day_sin"] = std::sin(two_pi * day_of_week / 7.0);
  features["day_cos"] = std::cos(two_pi * day_of_week / 7.0);
  features["is_weekend"] = day_of_week >= 5.0 ? 1.0 : 0.0;
  return features;
}

} // namespace wellwatch::model

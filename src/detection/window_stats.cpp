#include "detection/window_stats.hpp"

#include <algorithm>
#include <cmath>

namespace wellwatch::detection {

SeriesStats Summarize(const std::vector<double>& values, std::size_t ddof) {
  SeriesStats stats;
  stats.count = values.size();
  if (values.empty()) {
    return stats;
  }

  double sum = 0.0;
  stats.min = values.front();
  stats.max = values.front();
  for (const double value : values) {
    sum += value;
    stats.min = std::min(stats.min, value);
    stats.max = std::max(stats.max, value);
  }
  stats.mean = sum / static_cast<double>(values.size());

  if (values.size() <= ddof) {
    return stats;
  }
  double squared = 0.0;
  for (const double value : values) {
    const double delta = value - stats.mean;
    squared += delta * delta;
  }
  stats.stddev = std::sqrt(squared / static_cast<double>(values.size() - ddof));
  return stats;
}

double ZScore(double value, const SeriesStats& stats) {
  return std::abs(value - stats.mean) / (stats.stddev + kStdEpsilon);
}

bool FitLine(const std::vector<double>& xs, const std::vector<double>& ys, LinearFit& fit) {
  fit = LinearFit{};
  if (xs.size() != ys.size() || xs.size() < 2U) {
    return false;
  }

  const double n = static_cast<double>(xs.size());
  double mean_x = 0.0;
  double mean_y = 0.0;
  for (std::size_t i = 0; i < xs.size(); ++i) {
    mean_x += xs[i];
    mean_y += ys[i];
  }
  mean_x /= n;
  mean_y /= n;

  double sxx = 0.0;
  double sxy = 0.0;
  double syy = 0.0;
  for (std::size_t i = 0; i < xs.size(); ++i) {
    const double dx = xs[i] - mean_x;
    const double dy = ys[i] - mean_y;
    sxx += dx * dx;
    sxy += dx * dy;
    syy += dy * dy;
  }
  if (sxx <= 0.0) {
    return false;
  }

  fit.slope = sxy / sxx;
  fit.intercept = mean_y - fit.slope * mean_x;
  // A flat series is perfectly explained by a flat line.
  fit.r_squared = syy <= 0.0 ? 1.0 : std::clamp((sxy * sxy) / (sxx * syy), 0.0, 1.0);
  return true;
}

bool FitLineByIndex(const std::vector<double>& ys, LinearFit& fit) {
  std::vector<double> xs(ys.size());
  for (std::size_t i = 0; i < xs.size(); ++i) {
    xs[i] = static_cast<double>(i);
  }
  return FitLine(xs, ys, fit);
}

std::vector<double> MetricSeries(const std::vector<telemetry::TelemetryEvent>& events,
                                 telemetry::Metric metric) {
  std::vector<double> values;
  values.reserve(events.size());
  for (const auto& event : events) {
    values.push_back(telemetry::MetricValue(event, metric));
  }
  return values;
}

std::vector<double> TimestampSeries(const std::vector<telemetry::TelemetryEvent>& events) {
  std::vector<double> values;
  values.reserve(events.size());
  for (const auto& event : events) {
    values.push_back(event.timestamp);
  }
  return values;
}

} // namespace wellwatch::detection

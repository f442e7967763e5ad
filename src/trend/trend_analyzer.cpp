#include "trend/trend_analyzer.hpp"

#include "core/json_utils.hpp"
#include "detection/window_stats.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace wellwatch::trend {
namespace {

constexpr double kHighConfidenceR2 = 0.7;
constexpr double kMediumConfidenceR2 = 0.3;
constexpr double kSeasonalPeakMin = 0.3;

} // namespace

const char* ToString(Direction direction) {
  switch (direction) {
  case Direction::kStable:
    return "stable";
  case Direction::kIncreasing:
    return "increasing";
  case Direction::kDecreasing:
    return "decreasing";
  }
  return "stable";
}

const char* ToString(Confidence confidence) {
  switch (confidence) {
  case Confidence::kLow:
    return "low";
  case Confidence::kMedium:
    return "medium";
  case Confidence::kHigh:
    return "high";
  }
  return "low";
}

TrendAnalyzer::TrendAnalyzer(config::TrendConfig config) : config_(std::move(config)) {}

LinearTrend TrendAnalyzer::AnalyzeLinear(const std::vector<double>& timestamps,
                                         const std::vector<double>& values) const {
  LinearTrend trend;
  trend.points = values.size();
  if (values.size() < 2U || timestamps.size() != values.size()) {
    trend.note = "linear trend needs at least 2 points";
    return trend;
  }

  detection::LinearFit fit;
  if (!detection::FitLine(timestamps, values, fit)) {
    trend.note = "linear trend needs distinct timestamps";
    return trend;
  }

  trend.sufficient_data = true;
  trend.slope = fit.slope;
  trend.intercept = fit.intercept;
  trend.r_squared = fit.r_squared;
  if (std::abs(fit.slope) < config_.stable_slope) {
    trend.direction = Direction::kStable;
  } else {
    trend.direction = fit.slope > 0.0 ? Direction::kIncreasing : Direction::kDecreasing;
  }
  if (fit.r_squared > kHighConfidenceR2) {
    trend.confidence = Confidence::kHigh;
  } else if (fit.r_squared > kMediumConfidenceR2) {
    trend.confidence = Confidence::kMedium;
  } else {
    trend.confidence = Confidence::kLow;
  }
  return trend;
}

Seasonality TrendAnalyzer::DetectSeasonality(const std::vector<double>& values) const {
  Seasonality result;
  result.max_lag = config_.max_lag;
  if (config_.max_lag == 0U || values.size() < 2U * config_.max_lag) {
    result.note = "seasonality needs at least " + std::to_string(2U * config_.max_lag) + " points";
    return result;
  }
  result.sufficient_data = true;

  const detection::SeriesStats stats = detection::Summarize(values, 0);
  double denominator = 0.0;
  for (const double value : values) {
    denominator += (value - stats.mean) * (value - stats.mean);
  }
  if (denominator <= 0.0) {
    result.note = "series has no variance";
    return result;
  }

  const std::size_t n = values.size();
  result.autocorrelation.reserve(config_.max_lag);
  for (std::size_t lag = 1; lag <= config_.max_lag; ++lag) {
    double numerator = 0.0;
    for (std::size_t t = 0; t + lag < n; ++t) {
      numerator += (values[t] - stats.mean) * (values[t + lag] - stats.mean);
    }
    result.autocorrelation.push_back(numerator / denominator);
  }

  // Interior lags only: a peak needs a neighbour on both sides.
  const auto& acf = result.autocorrelation;
  for (std::size_t i = 1; i + 1 < acf.size(); ++i) {
    if (acf[i] > acf[i - 1] && acf[i] > acf[i + 1] && acf[i] > kSeasonalPeakMin) {
      result.peaks.push_back(SeasonalPeak{.lag = i + 1U, .autocorrelation = acf[i]});
    }
  }
  result.seasonal = !result.peaks.empty();
  return result;
}

MovingAverageTrend TrendAnalyzer::AnalyzeMovingAverage(const std::vector<double>& values) const {
  MovingAverageTrend result;
  result.window = config_.moving_average_window;
  const std::size_t window = config_.moving_average_window;
  if (window == 0U || values.size() < 2U * window) {
    result.note = "moving average needs at least " + std::to_string(2U * window) + " points";
    return result;
  }
  result.sufficient_data = true;

  double running = 0.0;
  for (std::size_t i = 0; i < values.size(); ++i) {
    running += values[i];
    if (i >= window) {
      running -= values[i - window];
    }
    if (i + 1U >= window) {
      result.averages.push_back(running / static_cast<double>(window));
    }
  }

  const double earlier = result.averages.front();
  const double recent = result.averages.back();
  if (earlier != 0.0) {
    result.relative_change = (recent - earlier) / std::abs(earlier);
  } else {
    result.relative_change = recent - earlier;
  }
  if (result.relative_change > config_.moving_average_change) {
    result.direction = Direction::kIncreasing;
  } else if (result.relative_change < -config_.moving_average_change) {
    result.direction = Direction::kDecreasing;
  } else {
    result.direction = Direction::kStable;
  }
  return result;
}

TrendReport TrendAnalyzer::Analyze(const std::string& device_id,
                                   const std::vector<telemetry::TelemetryEvent>& events,
                                   telemetry::Metric metric) const {
  const std::vector<double> values = detection::MetricSeries(events, metric);

  TrendReport report;
  report.device_id = device_id;
  report.metric = metric;
  report.points = values.size();
  report.linear = AnalyzeLinear(detection::TimestampSeries(events), values);
  report.seasonality = DetectSeasonality(values);
  report.moving_average = AnalyzeMovingAverage(values);
  return report;
}

std::string ToJson(const TrendReport& report) {
  using core::FormatJsonNumber;
  using core::QuoteJson;

  const LinearTrend& linear = report.linear;
  const Seasonality& seasonality = report.seasonality;
  const MovingAverageTrend& moving = report.moving_average;

  std::ostringstream out;
  out << "{\"device_id\":" << QuoteJson(report.device_id)
      << ",\"metric\":" << QuoteJson(telemetry::ToString(report.metric))
      << ",\"points\":" << report.points;

  out << ",\"linear\":{\"sufficient_data\":" << (linear.sufficient_data ? "true" : "false")
      << ",\"slope\":" << FormatJsonNumber(linear.slope)
      << ",\"intercept\":" << FormatJsonNumber(linear.intercept)
      << ",\"r_squared\":" << FormatJsonNumber(linear.r_squared)
      << ",\"direction\":" << QuoteJson(ToString(linear.direction))
      << ",\"confidence\":" << QuoteJson(ToString(linear.confidence))
      << ",\"note\":" << QuoteJson(linear.note) << "}";

  out << ",\"seasonality\":{\"sufficient_data\":"
      << (seasonality.sufficient_data ? "true" : "false")
      << ",\"seasonal\":" << (seasonality.seasonal ? "true" : "false")
      << ",\"max_lag\":" << seasonality.max_lag << ",\"peaks\":[";
  for (std::size_t i = 0; i < seasonality.peaks.size(); ++i) {
    if (i > 0U) {
      out << ",";
    }
    out << "{\"lag\":" << seasonality.peaks[i].lag
        << ",\"autocorrelation\":" << FormatJsonNumber(seasonality.peaks[i].autocorrelation)
        << "}";
  }
  out << "],\"note\":" << QuoteJson(seasonality.note) << "}";

  out << ",\"moving_average\":{\"sufficient_data\":" << (moving.sufficient_data ? "true" : "false")
      << ",\"window\":" << moving.window
      << ",\"relative_change\":" << FormatJsonNumber(moving.relative_change)
      << ",\"direction\":" << QuoteJson(ToString(moving.direction))
      << ",\"note\":" << QuoteJson(moving.note) << "}}";
  return out.str();
}

} // namespace wellwatch::trend

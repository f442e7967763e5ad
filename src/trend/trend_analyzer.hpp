#pragma once

#include "config/pipeline_config.hpp"
#include "telemetry/telemetry_event.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace wellwatch::trend {

enum class Direction {
  kStable,
  kIncreasing,
  kDecreasing,
};

enum class Confidence {
  kLow,
  kMedium,
  kHigh,
};

const char* ToString(Direction direction);
const char* ToString(Confidence confidence);

// Least squares of value on timestamp (seconds).
struct LinearTrend {
  bool sufficient_data = false;
  std::size_t points = 0;
  double slope = 0.0;
  double intercept = 0.0;
  double r_squared = 0.0;
  Direction direction = Direction::kStable;
  Confidence confidence = Confidence::kLow;
  std::string note;
};

struct SeasonalPeak {
  std::size_t lag = 0;
  double autocorrelation = 0.0;
};

struct Seasonality {
  bool sufficient_data = false;
  bool seasonal = false;
  std::size_t max_lag = 0;
  // Peaks in ascending lag order.
  std::vector<SeasonalPeak> peaks;
  // Index i holds the autocorrelation at lag i + 1.
  std::vector<double> autocorrelation;
  std::string note;
};

struct MovingAverageTrend {
  bool sufficient_data = false;
  std::size_t window = 0;
  std::vector<double> averages;
  double relative_change = 0.0;
  Direction direction = Direction::kStable;
  std::string note;
};

struct TrendReport {
  std::string device_id;
  telemetry::Metric metric = telemetry::Metric::kTemperature;
  std::size_t points = 0;
  LinearTrend linear;
  Seasonality seasonality;
  MovingAverageTrend moving_average;
};

// Trend queries over a device window. Every analysis reports
// `sufficient_data = false` with a note instead of failing when the window is
// too short.
//
// - linear: needs 2 points with distinct timestamps. Stable when
//   |slope| < stable_slope; confidence high above R^2 0.7, medium above 0.3.
// - seasonality: needs 2 * max_lag points. A lag is a peak when its
//   autocorrelation is a local maximum and above 0.3.
// - moving average: needs 2 * window points; compares the newest windowed
//   mean with the oldest one against a relative change of
//   moving_average_change.
class TrendAnalyzer {
public:
  explicit TrendAnalyzer(config::TrendConfig config);

  LinearTrend AnalyzeLinear(const std::vector<double>& timestamps,
                            const std::vector<double>& values) const;

  Seasonality DetectSeasonality(const std::vector<double>& values) const;

  MovingAverageTrend AnalyzeMovingAverage(const std::vector<double>& values) const;

  // Runs all three analyses over `events` (chronological).
  TrendReport Analyze(const std::string& device_id,
                      const std::vector<telemetry::TelemetryEvent>& events,
                      telemetry::Metric metric) const;

private:
  config::TrendConfig config_;
};

std::string ToJson(const TrendReport& report);

} // namespace wellwatch::trend

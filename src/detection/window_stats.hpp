#pragma once

#include "telemetry/telemetry_event.hpp"

#include <cstddef>
#include <vector>

namespace wellwatch::detection {

// Guards z-score division for flat windows.
inline constexpr double kStdEpsilon = 1e-8;

struct SeriesStats {
  std::size_t count = 0;
  double mean = 0.0;
  double stddev = 0.0;
  double min = 0.0;
  double max = 0.0;
};

// `ddof` 0 gives the population std, 1 the sample std. Fewer than ddof + 1
// values yield std 0.
SeriesStats Summarize(const std::vector<double>& values, std::size_t ddof = 0);

double ZScore(double value, const SeriesStats& stats);

struct LinearFit {
  double slope = 0.0;
  double intercept = 0.0;
  double r_squared = 0.0;
};

// Ordinary least squares of ys on xs. Requires xs.size() == ys.size() >= 2;
// returns false otherwise or when every x is identical.
bool FitLine(const std::vector<double>& xs, const std::vector<double>& ys, LinearFit& fit);

// Fit against the sample index (0, 1, 2, ...): slope is change per reading.
bool FitLineByIndex(const std::vector<double>& ys, LinearFit& fit);

std::vector<double> MetricSeries(const std::vector<telemetry::TelemetryEvent>& events,
                                 telemetry::Metric metric);

std::vector<double> TimestampSeries(const std::vector<telemetry::TelemetryEvent>& events);

} // namespace wellwatch::detection

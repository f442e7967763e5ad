#pragma once

#include <map>
#include <string>
#include <vector>

namespace wellwatch::detection {

enum class Severity {
  kLow,
  kMedium,
  kHigh,
  kCritical,
};

const char* ToString(Severity severity);

enum class DetectionMethod {
  kStatistical,
  kRuleBased,
  kExternalModel,
  kEnsemble,
  kTrend,
  kInsufficientData,
};

const char* ToString(DetectionMethod method);

// Something a verdict wants turned into an alert. Only rule breaches, trends
// and a positive ensemble vote carry findings; the raw statistical and model
// signals feed the vote instead.
struct Finding {
  std::string alert_type;
  Severity severity = Severity::kMedium;
  std::string message;
  std::map<std::string, std::string> details;
};

// Output of one detector (or of the ensemble vote) for one event.
//
// - `score` is always within [0, 1].
// - `metrics` holds the numbers behind the decision (z-scores, slopes,
//   probability, vote fraction) keyed by name.
// - `degraded` is set when the producing detector failed, or, for the
//   ensemble, when at least one signal was missing because of a failure.
struct AnomalyVerdict {
  bool is_anomaly = false;
  double score = 0.0;
  DetectionMethod method = DetectionMethod::kStatistical;
  std::vector<std::string> reasons;
  std::map<std::string, double> metrics;
  std::vector<Finding> findings;
  bool degraded = false;

  bool operator==(const AnomalyVerdict& other) const = default;
};

double ClampScore(double value);

std::string ToJson(const AnomalyVerdict& verdict);

} // namespace wellwatch::detection

#pragma once

#include "config/pipeline_config.hpp"
#include "detection/detector.hpp"
#include "model/anomaly_scorer.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace wellwatch::detection {

struct DetectorFailure {
  std::string detector;
  DetectionMethod method = DetectionMethod::kStatistical;
  std::string message;
};

// Everything the chain produced for one event. The ensemble verdict is always
// the last entry of `verdicts`.
struct DetectionReport {
  std::vector<AnomalyVerdict> verdicts;
  std::vector<DetectorFailure> failures;

  const AnomalyVerdict* Ensemble() const {
    return verdicts.empty() ? nullptr : &verdicts.back();
  }
};

struct VoteSettings {
  config::SignalWeights weights;
  double vote_threshold = 0.5;
  std::size_t min_window = 10;
  // |z| above which a positive vote is raised as HIGH instead of MEDIUM.
  double high_severity_z = 4.0;
};

// Weighted vote across the statistical, rule-based and external-model
// signals.
//
// - fraction = sum(weight of firing signals) / sum(weight of available
//   signals); a signal is available when its detector produced a
//   non-degraded verdict of its own method.
// - anomaly when fraction >= vote_threshold and at least one signal fired.
//   A tie at the threshold counts as an anomaly.
// - with fewer than `min_window` readings of history the vote is skipped and
//   an insufficient-data verdict is returned.
// - `degraded` is set when a voting detector failed or no signal was
//   available.
AnomalyVerdict Vote(const std::vector<AnomalyVerdict>& signals,
                    const std::vector<DetectorFailure>& failures, std::size_t history_points,
                    const VoteSettings& settings);

// Runs the registered detector chain in order and appends the ensemble vote.
// A detector that returns false or throws a std::exception is recorded as a
// failure with a degraded placeholder verdict; the remaining detectors still
// run.
class EnsembleDetector {
public:
  EnsembleDetector(std::vector<std::unique_ptr<IDetector>> detectors, VoteSettings settings);

  EnsembleDetector(const EnsembleDetector&) = delete;
  EnsembleDetector& operator=(const EnsembleDetector&) = delete;

  DetectionReport Evaluate(const telemetry::TelemetryEvent& event,
                           const std::vector<telemetry::TelemetryEvent>& history) const;

  std::vector<std::string> DetectorNames() const;

private:
  std::vector<std::unique_ptr<IDetector>> detectors_;
  VoteSettings settings_;
};

// Statistical, RuleBased, ExternalModel (only with a scorer), Trend.
std::vector<std::unique_ptr<IDetector>> BuildDefaultChain(
    const config::PipelineConfig& config, std::shared_ptr<const model::IAnomalyScorer> scorer);

VoteSettings VoteSettingsFromConfig(const config::PipelineConfig& config);

// History depth the default chain needs, also used to size snapshots.
std::size_t RequiredHistory(const config::PipelineConfig& config);

} // namespace wellwatch::detection

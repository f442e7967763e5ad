#include "detection/ensemble_detector.hpp"

#include "core/json_utils.hpp"
#include "detection/model_detector.hpp"
#include "detection/rule_detector.hpp"
#include "detection/statistical_detector.hpp"
#include "detection/trend_detector.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <utility>

namespace wellwatch::detection {
namespace {

bool IsVotingMethod(DetectionMethod method) {
  return method == DetectionMethod::kStatistical || method == DetectionMethod::kRuleBased ||
         method == DetectionMethod::kExternalModel;
}

double WeightFor(DetectionMethod method, const config::SignalWeights& weights) {
  switch (method) {
  case DetectionMethod::kStatistical:
    return weights.statistical;
  case DetectionMethod::kRuleBased:
    return weights.rule_based;
  case DetectionMethod::kExternalModel:
    return weights.external_model;
  default:
    return 0.0;
  }
}

double MetricOr(const AnomalyVerdict& verdict, const std::string& key, double fallback) {
  const auto it = verdict.metrics.find(key);
  return it == verdict.metrics.end() ? fallback : it->second;
}

} // namespace

AnomalyVerdict Vote(const std::vector<AnomalyVerdict>& signals,
                    const std::vector<DetectorFailure>& failures, std::size_t history_points,
                    const VoteSettings& settings) {
  const bool voting_failure =
      std::any_of(failures.begin(), failures.end(),
                  [](const DetectorFailure& failure) { return IsVotingMethod(failure.method); });

  if (history_points < settings.min_window) {
    AnomalyVerdict verdict = MakeInsufficientDataVerdict(history_points, settings.min_window);
    verdict.degraded = voting_failure;
    return verdict;
  }

  AnomalyVerdict verdict;
  verdict.method = DetectionMethod::kEnsemble;
  verdict.degraded = voting_failure;

  double available = 0.0;
  double fired = 0.0;
  double max_z = 0.0;
  std::vector<std::string> contributing;
  for (const AnomalyVerdict& signal : signals) {
    if (!IsVotingMethod(signal.method) || signal.degraded) {
      continue;
    }
    const double weight = WeightFor(signal.method, settings.weights);
    available += weight;
    if (signal.method == DetectionMethod::kStatistical) {
      max_z = MetricOr(signal, "max_z", 0.0);
    }
    if (!signal.is_anomaly) {
      continue;
    }
    fired += weight;
    contributing.push_back(ToString(signal.method));
    for (const std::string& reason : signal.reasons) {
      verdict.reasons.push_back(std::string(ToString(signal.method)) + ": " + reason);
    }
  }

  if (available <= 0.0) {
    verdict.degraded = true;
    verdict.reasons.push_back("no detection signal available");
    return verdict;
  }

  const double fraction = fired / available;
  verdict.score = ClampScore(fraction);
  verdict.is_anomaly = fired > 0.0 && fraction >= settings.vote_threshold;
  verdict.metrics["vote_fraction"] = fraction;
  verdict.metrics["available_weight"] = available;
  verdict.metrics["max_z"] = max_z;

  if (verdict.is_anomaly) {
    Finding finding;
    finding.alert_type = "ANOMALY_DETECTED";
    finding.severity = max_z > settings.high_severity_z ? Severity::kHigh : Severity::kMedium;
    finding.message = "ensemble vote " + core::FormatFixed(fraction, 2) + " reached threshold " +
                      core::FormatFixed(settings.vote_threshold, 2);
    std::string methods;
    for (const std::string& method : contributing) {
      methods += methods.empty() ? method : "," + method;
    }
    finding.details["methods"] = methods;
    finding.details["vote_fraction"] = core::FormatFixed(fraction, 4);
    finding.details["max_z"] = core::FormatFixed(max_z, 4);
    verdict.findings.push_back(std::move(finding));
  }
  return verdict;
}

EnsembleDetector::EnsembleDetector(std::vector<std::unique_ptr<IDetector>> detectors,
                                   VoteSettings settings)
    : detectors_(std::move(detectors)), settings_(std::move(settings)) {}

DetectionReport EnsembleDetector::Evaluate(
    const telemetry::TelemetryEvent& event,
    const std::vector<telemetry::TelemetryEvent>& history) const {
  DetectionReport report;
  for (const auto& detector : detectors_) {
    std::optional<AnomalyVerdict> verdict;
    std::string error;
    bool ok = false;
    try {
      ok = detector->Evaluate(event, history, verdict, error);
    } catch (const std::exception& ex) {
      ok = false;
      error = std::string("detector threw: ") + ex.what();
    }

    if (!ok) {
      if (error.empty()) {
        error = "detector failed without a message";
      }
      report.failures.push_back(DetectorFailure{
          .detector = detector->Name(), .method = detector->Method(), .message = error});
      AnomalyVerdict placeholder;
      placeholder.method = detector->Method();
      placeholder.degraded = true;
      placeholder.reasons.push_back(error);
      report.verdicts.push_back(std::move(placeholder));
      continue;
    }
    if (verdict.has_value()) {
      report.verdicts.push_back(std::move(*verdict));
    }
  }

  report.verdicts.push_back(Vote(report.verdicts, report.failures, history.size(), settings_));
  return report;
}

std::vector<std::string> EnsembleDetector::DetectorNames() const {
  std::vector<std::string> names;
  names.reserve(detectors_.size());
  for (const auto& detector : detectors_) {
    names.push_back(detector->Name());
  }
  return names;
}

std::vector<std::unique_ptr<IDetector>> BuildDefaultChain(
    const config::PipelineConfig& config, std::shared_ptr<const model::IAnomalyScorer> scorer) {
  std::vector<std::unique_ptr<IDetector>> chain;
  chain.push_back(std::make_unique<StatisticalDetector>(config.window_size, config.min_window,
                                                        config.z_score_threshold));
  chain.push_back(std::make_unique<RuleDetector>(config.rules));
  if (scorer != nullptr) {
    chain.push_back(std::make_unique<ModelDetector>(std::move(scorer),
                                                    model::FeatureBuilder(config.window_size),
                                                    config.min_window, config.model_threshold));
  }
  chain.push_back(std::make_unique<TrendDetector>(config.trend));
  return chain;
}

VoteSettings VoteSettingsFromConfig(const config::PipelineConfig& config) {
  return VoteSettings{.weights = config.weights,
                      .vote_threshold = config.vote_threshold,
                      .min_window = config.min_window};
}

std::size_t RequiredHistory(const config::PipelineConfig& config) {
  const std::size_t trend_points =
      config.trend.detector_window > 0U ? config.trend.detector_window - 1U : 0U;
  return std::max({config.window_size, config.min_window, trend_points});
}

} // namespace wellwatch::detection

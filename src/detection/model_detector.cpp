#include "detection/model_detector.hpp"

#include "core/json_utils.hpp"

#include <cmath>
#include <utility>

namespace wellwatch::detection {

ModelDetector::ModelDetector(std::shared_ptr<const model::IAnomalyScorer> scorer,
                             model::FeatureBuilder features, std::size_t min_window,
                             double threshold)
    : scorer_(std::move(scorer)),
      features_(std::move(features)),
      min_window_(min_window),
      threshold_(threshold) {}

std::string ModelDetector::Name() const {
  return scorer_ == nullptr ? "external_model" : "external_model:" + scorer_->Name();
}

bool ModelDetector::Evaluate(const telemetry::TelemetryEvent& event,
                             const std::vector<telemetry::TelemetryEvent>& history,
                             std::optional<AnomalyVerdict>& verdict, std::string& error) const {
  error.clear();
  if (scorer_ == nullptr) {
    error = "no anomaly scorer configured";
    return false;
  }
  if (history.size() < min_window_) {
    verdict = MakeInsufficientDataVerdict(history.size(), min_window_);
    return true;
  }

  const model::FeatureVector features = features_.Build(event, history);
  double probability = 0.0;
  if (!scorer_->Score(features, probability, error)) {
    return false;
  }
  if (!std::isfinite(probability) || probability < 0.0 || probability > 1.0) {
    error = "scorer returned probability outside [0, 1]: " + core::FormatJsonNumber(probability);
    return false;
  }

  AnomalyVerdict result;
  result.method = DetectionMethod::kExternalModel;
  result.score = probability;
  result.is_anomaly = probability >= threshold_;
  result.metrics["probability"] = probability;
  if (result.is_anomaly) {
    result.reasons.push_back("model probability " + core::FormatFixed(probability, 3) +
                             " at or above " + core::FormatFixed(threshold_, 3));
  }
  verdict = std::move(result);
  return true;
}

} // namespace wellwatch::detection

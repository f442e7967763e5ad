#pragma once

#include "detection/detector.hpp"
#include "model/anomaly_scorer.hpp"
#include "model/feature_builder.hpp"

#include <cstddef>
#include <memory>

namespace wellwatch::detection {

// Wraps an offline-trained scorer: builds the feature vector, asks for a
// probability and fires at `threshold` or above. Scorer failures and
// out-of-range probabilities are reported as detector failures.
class ModelDetector final : public IDetector {
public:
  ModelDetector(std::shared_ptr<const model::IAnomalyScorer> scorer,
                model::FeatureBuilder features, std::size_t min_window, double threshold);

  std::string Name() const override;

  DetectionMethod Method() const override {
    return DetectionMethod::kExternalModel;
  }

  bool Evaluate(const telemetry::TelemetryEvent& event,
                const std::vector<telemetry::TelemetryEvent>& history,
                std::optional<AnomalyVerdict>& verdict, std::string& error) const override;

private:
  std::shared_ptr<const model::IAnomalyScorer> scorer_;
  model::FeatureBuilder features_;
  std::size_t min_window_ = 0;
  double threshold_ = 0.5;
};

} // namespace wellwatch::detection

#pragma once

#include "model/anomaly_scorer.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace wellwatch::model {

// Logistic model exported by the offline trainer:
//   {"bias": b, "coefficients": {"temperature_z_score": w, ...}}
//
// probability = sigmoid(b + sum(w_i * x_i)). Features absent from the input
// count as 0; input features without a coefficient are ignored.
class LinearModelScorer final : public IAnomalyScorer {
public:
  LinearModelScorer() = default;

  bool LoadFromText(std::string_view json_text, std::string& error);
  bool LoadFromFile(const std::filesystem::path& path, std::string& error);

  std::string Name() const override {
    return name_;
  }

  bool Score(const FeatureVector& features, double& probability,
             std::string& error) const override;

  double bias() const {
    return bias_;
  }

  const FeatureVector& coefficients() const {
    return coefficients_;
  }

private:
  std::string name_ = "linear_model";
  double bias_ = 0.0;
  FeatureVector coefficients_;
};

} // namespace wellwatch::model

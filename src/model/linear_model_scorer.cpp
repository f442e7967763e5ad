#include "model/linear_model_scorer.hpp"

#include "core/json_dom.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>

namespace wellwatch::model {
namespace {

double Sigmoid(double z) {
  return 1.0 / (1.0 + std::exp(-z));
}

} // namespace

bool LinearModelScorer::LoadFromText(std::string_view json_text, std::string& error) {
  core::json::Value root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  if (!root.IsObject()) {
    error = "model file root must be a JSON object";
    return false;
  }

  double bias = 0.0;
  if (const core::json::Value* bias_value = root.Find("bias"); bias_value != nullptr) {
    if (!bias_value->IsNumber() || !std::isfinite(bias_value->number_value)) {
      error = "model bias must be a finite number";
      return false;
    }
    bias = bias_value->number_value;
  }

  const core::json::Value* coefficients = root.Find("coefficients");
  if (coefficients == nullptr || !coefficients->IsObject()) {
    error = "model file must contain a 'coefficients' object";
    return false;
  }

  FeatureVector parsed;
  for (const auto& [feature, weight] : coefficients->object_value) {
    if (!weight.IsNumber() || !std::isfinite(weight.number_value)) {
      error = "coefficient '" + feature + "' must be a finite number";
      return false;
    }
    parsed[feature] = weight.number_value;
  }

  std::string name = "linear_model";
  if (const core::json::Value* name_value = root.Find("name"); name_value != nullptr) {
    if (!name_value->IsString() || name_value->string_value.empty()) {
      error = "model name must be a non-empty string";
      return false;
    }
    name = name_value->string_value;
  }

  name_ = std::move(name);
  bias_ = bias;
  coefficients_ = std::move(parsed);
  return true;
}

bool LinearModelScorer::LoadFromFile(const std::filesystem::path& path, std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open model file: " + path.string();
    return false;
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  if (!LoadFromText(buffer.str(), error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

bool LinearModelScorer::Score(const FeatureVector& features, double& probability,
                              std::string& error) const {
  double z = bias_;
  for (const auto& [feature, weight] : coefficients_) {
    const auto it = features.find(feature);
    if (it == features.end()) {
      continue;
    }
    if (!std::isfinite(it->second)) {
      error = "feature '" + feature + "' is not finite";
      return false;
    }
    z += weight * it->second;
  }
  if (!std::isfinite(z)) {
    error = "model logit is not finite";
    return false;
  }
  probability = Sigmoid(z);
  return true;
}

} // namespace wellwatch::model

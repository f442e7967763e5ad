#include "model/feature_builder.hpp"
#include "model/linear_model_scorer.hpp"

#include "../common/telemetry_fixtures.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <string>

using Catch::Approx;
using wellwatch::model::FeatureBuilder;
using wellwatch::model::FeatureVector;
using wellwatch::model::LinearModelScorer;
using wellwatch::tests::common::MakeEvent;

TEST_CASE("LinearModelScorer loads bias coefficients and name", "[model][scorer]") {
  LinearModelScorer scorer;
  std::string error;
  REQUIRE(scorer.LoadFromText(
      R"({"name": "pump_lr_v2", "bias": -2.0, "coefficients": {"temperature_z_score": 0.5, "is_weekend": 1.0}})",
      error));
  REQUIRE(scorer.Name() == "pump_lr_v2");
  REQUIRE(scorer.bias() == -2.0);
  REQUIRE(scorer.coefficients().size() == 2U);

  double probability = 0.0;
  REQUIRE(scorer.Score(FeatureVector{{"temperature_z_score", 4.0}, {"unused", 99.0}}, probability,
                       error));
  REQUIRE(probability == Approx(0.5));

  REQUIRE(scorer.Score(FeatureVector{}, probability, error));
  REQUIRE(probability == Approx(1.0 / (1.0 + std::exp(2.0))));
}

TEST_CASE("LinearModelScorer rejects malformed model files", "[model][scorer]") {
  LinearModelScorer scorer;
  std::string error;

  REQUIRE_FALSE(scorer.LoadFromText(R"({"bias": 1.0})", error));
  REQUIRE(error.find("'coefficients' object") != std::string::npos);

  REQUIRE_FALSE(scorer.LoadFromText(R"({"coefficients": {"x": "heavy"}})", error));
  REQUIRE(error == "coefficient 'x' must be a finite number");

  REQUIRE_FALSE(scorer.LoadFromText("[1, 2]", error));
  REQUIRE(error == "model file root must be a JSON object");

  REQUIRE_FALSE(scorer.LoadFromFile("/nonexistent/model.json", error));
  REQUIRE(error.find("unable to open model file") != std::string::npos);
}

TEST_CASE("LinearModelScorer fails on non-finite features", "[model][scorer]") {
  LinearModelScorer scorer;
  std::string error;
  REQUIRE(scorer.LoadFromText(R"({"coefficients": {"temperature": 1.0}})", error));

  double probability = 0.25;
  REQUIRE_FALSE(scorer.Score(
      FeatureVector{{"temperature", std::numeric_limits<double>::infinity()}}, probability,
      error));
  REQUIRE(error == "feature 'temperature' is not finite");
  REQUIRE(probability == 0.25);
}

TEST_CASE("FeatureBuilder derives rolling and cross-metric features", "[model][features]") {
  const FeatureBuilder builder(3);
  const std::vector<wellwatch::telemetry::TelemetryEvent> history{
      MakeEvent("well-1", 0.0, 70.0, 190.0), MakeEvent("well-1", 1.0, 78.0, 200.0),
      MakeEvent("well-1", 2.0, 80.0, 200.0)};

  const FeatureVector features = builder.Build(MakeEvent("well-1", 3.0, 82.0, 205.0), history);
  // Window holds the last two readings plus the current one: 78, 80, 82.
  REQUIRE(features.at("temperature") == 82.0);
  REQUIRE(features.at("temperature_rolling_mean") == Approx(80.0));
  REQUIRE(features.at("temperature_rolling_std") == Approx(2.0));
  REQUIRE(features.at("temperature_z_score") == Approx(1.0));
  REQUIRE(features.at("temperature_rate_of_change") == Approx(2.0));
  REQUIRE(features.at("pressure_rate_of_change") == Approx(5.0));
  REQUIRE(features.at("temp_pressure_ratio") == Approx(82.0 / 205.0));
  REQUIRE(features.at("temp_pressure_product") == Approx(82.0 * 205.0));
}

TEST_CASE("FeatureBuilder zeroes history features for a first reading", "[model][features]") {
  const FeatureBuilder builder(24);
  const FeatureVector features = builder.Build(MakeEvent("well-1", 0.0, 80.0, 200.0), {});
  REQUIRE(features.at("temperature_rate_of_change") == 0.0);
  REQUIRE(features.at("temperature_rolling_std") == 0.0);
  REQUIRE(features.at("temperature_z_score") == Approx(0.0).margin(1e-9));
}

TEST_CASE("FeatureBuilder encodes calendar position in UTC", "[model][features]") {
  const FeatureBuilder builder(4);

  // 1970-01-05 06:00 UTC, a Monday.
  const FeatureVector monday = builder.Build(MakeEvent("well-1", 4 * 86400.0 + 6 * 3600.0, 80.0,
                                                       200.0),
                                             {});
  REQUIRE(monday.at("hour_sin") == Approx(1.0));
  REQUIRE(monday.at("hour_cos") == Approx(0.0).margin(1e-9));
  REQUIRE(monday.at("day_sin") == Approx(0.0).margin(1e-9));
  REQUIRE(monday.at("day_cos") == Approx(1.0));
  REQUIRE(monday.at("is_weekend") == 0.0);

  // 1970-01-03, a Saturday.
  const FeatureVector saturday = builder.Build(MakeEvent("well-1", 2 * 86400.0, 80.0, 200.0), {});
  REQUIRE(saturday.at("is_weekend") == 1.0);
}

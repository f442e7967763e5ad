#include "trend/trend_analyzer.hpp"

#include "../common/telemetry_fixtures.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <numbers>
#include <string>
#include <vector>

using Catch::Approx;
using wellwatch::config::TrendConfig;
using wellwatch::trend::Confidence;
using wellwatch::trend::Direction;
using wellwatch::trend::TrendAnalyzer;

TEST_CASE("AnalyzeLinear reports an increasing trend with high confidence", "[trend][linear]") {
  const TrendAnalyzer analyzer{TrendConfig{}};
  std::vector<double> timestamps;
  std::vector<double> values;
  for (int i = 0; i < 10; ++i) {
    timestamps.push_back(1000.0 + i);
    values.push_back(80.0 + 0.5 * i);
  }

  const auto trend = analyzer.AnalyzeLinear(timestamps, values);
  REQUIRE(trend.sufficient_data);
  REQUIRE(trend.slope == Approx(0.5));
  REQUIRE(trend.r_squared == Approx(1.0));
  REQUIRE(trend.direction == Direction::kIncreasing);
  REQUIRE(trend.confidence == Confidence::kHigh);
}

TEST_CASE("AnalyzeLinear treats a slow drift as stable", "[trend][linear]") {
  const TrendAnalyzer analyzer{TrendConfig{}};
  // 0.5 per minute is below 0.01 per second.
  std::vector<double> timestamps;
  std::vector<double> values;
  for (int i = 0; i < 10; ++i) {
    timestamps.push_back(60.0 * i);
    values.push_back(80.0 + 0.5 * i);
  }

  const auto trend = analyzer.AnalyzeLinear(timestamps, values);
  REQUIRE(trend.sufficient_data);
  REQUIRE(trend.direction == Direction::kStable);
  REQUIRE(trend.slope == Approx(0.5 / 60.0));
}

TEST_CASE("AnalyzeLinear needs two distinct timestamps", "[trend][linear]") {
  const TrendAnalyzer analyzer{TrendConfig{}};
  const auto one_point = analyzer.AnalyzeLinear({1.0}, {80.0});
  REQUIRE_FALSE(one_point.sufficient_data);
  REQUIRE(one_point.note == "linear trend needs at least 2 points");

  const auto same_time = analyzer.AnalyzeLinear({5.0, 5.0}, {80.0, 81.0});
  REQUIRE_FALSE(same_time.sufficient_data);
}

TEST_CASE("DetectSeasonality finds the period of a periodic signal", "[trend][seasonality]") {
  const TrendAnalyzer analyzer{TrendConfig{}};
  std::vector<double> values;
  for (int i = 0; i < 96; ++i) {
    values.push_back(80.0 + 5.0 * std::sin(2.0 * std::numbers::pi * i / 12.0));
  }

  const auto seasonality = analyzer.DetectSeasonality(values);
  REQUIRE(seasonality.sufficient_data);
  REQUIRE(seasonality.seasonal);
  REQUIRE(seasonality.autocorrelation.size() == 24U);
  REQUIRE(seasonality.peaks.size() == 1U);
  REQUIRE(seasonality.peaks[0].lag == 12U);
  REQUIRE(seasonality.peaks[0].autocorrelation == Approx(0.875).margin(0.01));
}

TEST_CASE("DetectSeasonality needs twice the maximum lag", "[trend][seasonality]") {
  const TrendAnalyzer analyzer{TrendConfig{}};
  const auto seasonality = analyzer.DetectSeasonality(std::vector<double>(47, 80.0));
  REQUIRE_FALSE(seasonality.sufficient_data);
  REQUIRE(seasonality.note == "seasonality needs at least 48 points");

  const auto flat = analyzer.DetectSeasonality(std::vector<double>(48, 80.0));
  REQUIRE(flat.sufficient_data);
  REQUIRE_FALSE(flat.seasonal);
}

TEST_CASE("AnalyzeMovingAverage compares newest and oldest windows", "[trend][moving_average]") {
  const TrendAnalyzer analyzer{TrendConfig{}};
  std::vector<double> rising;
  for (int i = 1; i <= 12; ++i) {
    rising.push_back(static_cast<double>(i));
  }
  const auto up = analyzer.AnalyzeMovingAverage(rising);
  REQUIRE(up.sufficient_data);
  REQUIRE(up.averages.size() == 7U);
  REQUIRE(up.averages.front() == Approx(3.5));
  REQUIRE(up.averages.back() == Approx(9.5));
  REQUIRE(up.relative_change == Approx(6.0 / 3.5));
  REQUIRE(up.direction == Direction::kIncreasing);

  const auto steady = analyzer.AnalyzeMovingAverage(std::vector<double>(12, 200.0));
  REQUIRE(steady.direction == Direction::kStable);

  const auto too_short = analyzer.AnalyzeMovingAverage(std::vector<double>(11, 200.0));
  REQUIRE_FALSE(too_short.sufficient_data);
}

TEST_CASE("Analyze runs every analysis over device events", "[trend][report]") {
  const TrendAnalyzer analyzer{TrendConfig{}};
  std::vector<wellwatch::telemetry::TelemetryEvent> events;
  for (int i = 0; i < 12; ++i) {
    events.push_back(wellwatch::tests::common::MakeEvent("well-1", i, 80.0, 200.0 - 2.0 * i));
  }

  const auto report = analyzer.Analyze("well-1", events, wellwatch::telemetry::Metric::kPressure);
  REQUIRE(report.points == 12U);
  REQUIRE(report.linear.direction == Direction::kDecreasing);
  REQUIRE(report.moving_average.sufficient_data);
  REQUIRE_FALSE(report.seasonality.sufficient_data);

  const std::string json = wellwatch::trend::ToJson(report);
  REQUIRE(json.find("\"metric\":\"pressure\"") != std::string::npos);
  REQUIRE(json.find("\"direction\":\"decreasing\"") != std::string::npos);
}

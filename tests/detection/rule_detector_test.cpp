#include "detection/rule_detector.hpp"

#include "../common/telemetry_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <vector>

using wellwatch::config::RuleThresholds;
using wellwatch::detection::AnomalyVerdict;
using wellwatch::detection::RuleDetector;
using wellwatch::detection::Severity;
using wellwatch::tests::common::MakeEvent;

namespace {

AnomalyVerdict EvaluateReading(double temperature, double pressure) {
  const RuleDetector detector{RuleThresholds{}};
  std::optional<AnomalyVerdict> verdict;
  std::string error;
  REQUIRE(detector.Evaluate(MakeEvent("well-1", 1.0, temperature, pressure), {}, verdict, error));
  REQUIRE(verdict.has_value());
  return *verdict;
}

std::vector<std::string> AlertTypes(const AnomalyVerdict& verdict) {
  std::vector<std::string> types;
  for (const auto& finding : verdict.findings) {
    types.push_back(finding.alert_type);
  }
  return types;
}

} // namespace

TEST_CASE("RuleDetector accepts a reading inside the optimal range", "[detection][rules]") {
  const auto verdict = EvaluateReading(80.0, 200.0);
  REQUIRE_FALSE(verdict.is_anomaly);
  REQUIRE(verdict.findings.empty());
  REQUIRE(verdict.score == 0.0);
}

TEST_CASE("RuleDetector raises a critical alert above the high threshold",
          "[detection][rules]") {
  const auto verdict = EvaluateReading(125.0, 200.0);
  REQUIRE(verdict.is_anomaly);
  REQUIRE(AlertTypes(verdict) == std::vector<std::string>{"TEMPERATURE_HIGH"});
  REQUIRE(verdict.findings[0].severity == Severity::kCritical);
  REQUIRE(verdict.findings[0].details.at("threshold") == "120.00");
  REQUIRE(verdict.score == 0.9);
}

TEST_CASE("RuleDetector grades low readings as high severity", "[detection][rules]") {
  const auto verdict = EvaluateReading(80.0, 90.0);
  REQUIRE(AlertTypes(verdict) == std::vector<std::string>{"PRESSURE_LOW"});
  REQUIRE(verdict.findings[0].severity == Severity::kHigh);
}

TEST_CASE("RuleDetector reports extremes instead of plain breaches", "[detection][rules]") {
  const auto verdict = EvaluateReading(160.0, 200.0);
  REQUIRE(AlertTypes(verdict) == std::vector<std::string>{"TEMPERATURE_EXTREME"});
  REQUIRE(verdict.findings[0].severity == Severity::kCritical);
  REQUIRE(verdict.score == 1.0);
}

TEST_CASE("RuleDetector raises combined stress when both metrics run hot",
          "[detection][rules]") {
  const auto verdict = EvaluateReading(105.0, 260.0);
  REQUIRE(AlertTypes(verdict) == std::vector<std::string>{"COMBINED_STRESS"});
  REQUIRE(verdict.findings[0].severity == Severity::kHigh);
  REQUIRE(verdict.is_anomaly);
}

TEST_CASE("RuleDetector treats the widened normal range as a vote-only reason",
          "[detection][rules]") {
  // Normal temperature range is [75 * 0.8, 85 * 1.2] = [60, 102].
  const auto inside = EvaluateReading(101.0, 200.0);
  REQUIRE_FALSE(inside.is_anomaly);

  const auto outside = EvaluateReading(110.0, 200.0);
  REQUIRE(outside.is_anomaly);
  REQUIRE(outside.findings.empty());
  REQUIRE(outside.score == 0.6);
  REQUIRE(outside.reasons.size() == 1U);
  REQUIRE(outside.reasons[0].find("outside normal range [60.00, 102.00]") != std::string::npos);
}

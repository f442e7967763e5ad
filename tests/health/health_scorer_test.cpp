#include "health/health_scorer.hpp"

#include "../common/telemetry_fixtures.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <string>

using Catch::Approx;
using wellwatch::config::HealthThresholds;
using wellwatch::health::HealthScorer;
using wellwatch::health::HealthStatus;
using wellwatch::tests::common::AlternatingSeries;
using wellwatch::tests::common::ConstantSeries;

TEST_CASE("Steady readings without alerts score as healthy", "[health][score]") {
  const HealthScorer scorer{HealthThresholds{}};
  const auto health = scorer.Score("well-1", ConstantSeries("well-1", 50, 0.0, 80.0, 200.0), 0);

  REQUIRE(health.status == HealthStatus::kHealthy);
  REQUIRE(health.score == Approx(1.0));
  REQUIRE(health.temperature_stability == Approx(1.0));
  REQUIRE(health.pressure_stability == Approx(1.0));
  REQUIRE(health.samples == 50U);
  REQUIRE(health.last_seen.has_value());
  REQUIRE(*health.last_seen == 49.0);
}

TEST_CASE("Volatile readings with many alerts score as critical", "[health][score]") {
  const HealthScorer scorer{HealthThresholds{}};
  const auto health =
      scorer.Score("well-1", AlternatingSeries("well-1", 40, 0.0, 80.0, 12.0, 200.0, 60.0), 4);

  REQUIRE(health.temperature_stability == 0.0);
  REQUIRE(health.pressure_stability == 0.0);
  REQUIRE(health.alert_penalty == Approx(0.4));
  REQUIRE(health.score == 0.0);
  REQUIRE(health.status == HealthStatus::kCritical);
}

TEST_CASE("Alert penalty is capped and moves the status", "[health][penalty]") {
  const HealthScorer scorer{HealthThresholds{}};
  const auto series = ConstantSeries("well-1", 20, 0.0, 80.0, 200.0);

  const auto three_alerts = scorer.Score("well-1", series, 3);
  REQUIRE(three_alerts.score == Approx(0.7));
  REQUIRE(three_alerts.status == HealthStatus::kDegraded);

  const auto many_alerts = scorer.Score("well-1", series, 25);
  REQUIRE(many_alerts.alert_penalty == Approx(0.5));
  REQUIRE(many_alerts.score == Approx(0.5));
  REQUIRE(many_alerts.status == HealthStatus::kDegraded);
}

TEST_CASE("Only the newest history points feed the score", "[health][window]") {
  HealthThresholds thresholds;
  thresholds.history_points = 10;
  const HealthScorer scorer{thresholds};

  auto series = AlternatingSeries("well-1", 30, 0.0, 80.0, 20.0, 200.0, 100.0);
  const auto calm = ConstantSeries("well-1", 10, 30.0, 80.0, 200.0);
  series.insert(series.end(), calm.begin(), calm.end());

  const auto health = scorer.Score("well-1", series, 0);
  REQUIRE(health.samples == 10U);
  REQUIRE(health.status == HealthStatus::kHealthy);
}

TEST_CASE("A device without readings has no data", "[health][score]") {
  const HealthScorer scorer{HealthThresholds{}};
  const auto health = scorer.Score("ghost", {}, 2);
  REQUIRE(health.status == HealthStatus::kNoData);
  REQUIRE_FALSE(health.last_seen.has_value());
  REQUIRE(std::string(wellwatch::health::ToString(health.status)) == "NO_DATA");

  const std::string json = wellwatch::health::ToJson(health);
  REQUIRE(json.find("\"status\":\"NO_DATA\"") != std::string::npos);
}

TEST_CASE("Degenerate thresholds still produce a bounded score", "[health][thresholds]") {
  HealthThresholds thresholds;
  thresholds.history_points = 0;
  thresholds.temperature_std_bad = 0.0;
  thresholds.pressure_std_bad = 0.0;
  const HealthScorer scorer{thresholds};

  const auto newest_only =
      scorer.Score("well-1", AlternatingSeries("well-1", 20, 0.0, 80.0, 12.0, 200.0, 60.0), 0);
  REQUIRE(newest_only.samples == 1U);
  REQUIRE(newest_only.last_seen.has_value());
  REQUIRE(*newest_only.last_seen == 19.0);
  REQUIRE(newest_only.score == Approx(1.0));
  REQUIRE(newest_only.status == HealthStatus::kHealthy);

  thresholds.history_points = 10;
  const HealthScorer windowed{thresholds};
  const auto volatile_window =
      windowed.Score("well-1", AlternatingSeries("well-1", 20, 0.0, 80.0, 12.0, 200.0, 60.0), 0);
  REQUIRE(volatile_window.temperature_stability == 0.0);
  REQUIRE(volatile_window.pressure_stability == 0.0);
  REQUIRE(volatile_window.score == 0.0);
  REQUIRE(volatile_window.status == HealthStatus::kCritical);

  const auto steady_window =
      windowed.Score("well-1", ConstantSeries("well-1", 20, 0.0, 80.0, 200.0), 0);
  REQUIRE(steady_window.score == Approx(1.0));
}

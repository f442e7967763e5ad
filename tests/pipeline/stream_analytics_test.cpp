#include "pipeline/stream_analytics.hpp"

#include "../common/telemetry_fixtures.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <vector>

using Catch::Approx;
using wellwatch::config::PipelineConfig;
using wellwatch::core::errors::PipelineError;
using wellwatch::core::logging::Logger;
using wellwatch::core::logging::LogLevel;
using wellwatch::pipeline::IngestResult;
using wellwatch::pipeline::StreamAnalytics;
using wellwatch::pipeline::StreamProcessor;
using wellwatch::telemetry::TelemetryEvent;
using wellwatch::tests::common::ConstantSeries;
using wellwatch::tests::common::MakeEvent;

namespace {

void IngestAll(StreamProcessor& processor, const std::vector<TelemetryEvent>& events) {
  for (const auto& event : events) {
    IngestResult result;
    PipelineError error;
    REQUIRE(processor.Ingest(event, result, error));
  }
}

} // namespace

TEST_CASE("System overview summarizes fleet health and recent alerts", "[pipeline][analytics]") {
  std::ostringstream log;
  Logger logger(LogLevel::kError, log);
  StreamProcessor processor(PipelineConfig{}, logger);

  IngestAll(processor, ConstantSeries("well-calm", 30, 1000.0, 80.0, 200.0));
  // Extreme readings on a second device: critical rule alerts every minute.
  std::vector<TelemetryEvent> hot;
  for (int i = 0; i < 5; ++i) {
    hot.push_back(MakeEvent("well-hot", 1000.0 + 60.0 * i, 160.0 + i, 200.0));
  }
  IngestAll(processor, hot);

  const StreamAnalytics analytics(processor);
  const auto overview = analytics.GetSystemOverview();
  REQUIRE(overview.total_devices == 2U);
  REQUIRE(overview.healthy_devices == 1U);
  REQUIRE(overview.system_health_score == Approx(0.5));
  REQUIRE(overview.recent_alerts == 5U);
  REQUIRE(overview.critical_alerts == 5U);
  REQUIRE(overview.stats.events_processed == 35U);
  REQUIRE(overview.device_health.at("well-calm").status ==
          wellwatch::health::HealthStatus::kHealthy);
  REQUIRE(overview.device_health.at("well-hot").recent_alert_count == 5U);

  const std::string json = wellwatch::pipeline::ToJson(overview);
  REQUIRE(json.find("\"total_devices\":2") != std::string::npos);
  REQUIRE(json.find("\"processing_stats\":{") != std::string::npos);
  REQUIRE(json.find("\"well-hot\":{") != std::string::npos);
}

TEST_CASE("Device analytics reports ranges, summaries and alert types", "[pipeline][analytics]") {
  std::ostringstream log;
  Logger logger(LogLevel::kError, log);
  StreamProcessor processor(PipelineConfig{}, logger);

  std::vector<TelemetryEvent> events;
  for (int i = 0; i < 4; ++i) {
    events.push_back(MakeEvent("well-1", 3600.0 * i, 70.0 + 2.0 * i, 90.0));
  }
  IngestAll(processor, events);

  const StreamAnalytics analytics(processor);
  const auto device = analytics.GetDeviceAnalytics("well-1");
  REQUIRE(device.has_data);
  REQUIRE(device.data_points == 4U);
  REQUIRE(device.duration_hours == Approx(3.0));
  REQUIRE(device.temperature.mean == Approx(73.0));
  REQUIRE(device.temperature.min == 70.0);
  REQUIRE(device.temperature.max == 76.0);
  REQUIRE(device.temperature.trend == Approx(2.0));
  REQUIRE(device.pressure.stddev == Approx(0.0).margin(1e-12));
  REQUIRE(device.recent_alerts == 4U);
  REQUIRE(device.alert_types == std::vector<std::string>{"PRESSURE_LOW"});

  const std::string json = wellwatch::pipeline::ToJson(device);
  REQUIRE(json.find("\"alert_types\":[\"PRESSURE_LOW\"]") != std::string::npos);
}

TEST_CASE("Device analytics without data says so", "[pipeline][analytics]") {
  std::ostringstream log;
  Logger logger(LogLevel::kError, log);
  StreamProcessor processor(PipelineConfig{}, logger);

  const StreamAnalytics analytics(processor);
  const auto device = analytics.GetDeviceAnalytics("ghost");
  REQUIRE_FALSE(device.has_data);
  REQUIRE(wellwatch::pipeline::ToJson(device) ==
          R"({"device_id":"ghost","error":"no data available for device"})");

  const auto overview = analytics.GetSystemOverview();
  REQUIRE(overview.total_devices == 0U);
  REQUIRE(overview.system_health_score == 0.0);
}

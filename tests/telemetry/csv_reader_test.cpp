#include "telemetry/csv_reader.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <vector>

using wellwatch::telemetry::CsvRowIssue;
using wellwatch::telemetry::TelemetryEvent;

TEST_CASE("ReadTelemetryCsv resolves columns from the header", "[telemetry][csv]") {
  std::istringstream input("id,status,pressure,temperature,ts,device_id\r\n"
                           "1,RUNNING,201.5,79.25,1700000000,well-1\r\n"
                           "2,,199.0,80.5,1700000001.5,well-2\r\n");
  std::vector<TelemetryEvent> events;
  std::vector<CsvRowIssue> issues;
  std::string error;

  REQUIRE(wellwatch::telemetry::ReadTelemetryCsv(input, events, issues, error));
  REQUIRE(issues.empty());
  REQUIRE(events.size() == 2U);
  REQUIRE(events[0].device_id == "well-1");
  REQUIRE(events[0].timestamp == 1700000000.0);
  REQUIRE(events[0].temperature == 79.25);
  REQUIRE(events[0].pressure == 201.5);
  REQUIRE(events[0].status == "RUNNING");
  REQUIRE(events[1].status == "OK");
  REQUIRE(events[1].timestamp == 1700000001.5);
}

TEST_CASE("ReadTelemetryCsv accepts headerless rows", "[telemetry][csv]") {
  std::istringstream input("well-9,10,80,200\n\nwell-9,11,81,201,ALARM\n");
  std::vector<TelemetryEvent> events;
  std::vector<CsvRowIssue> issues;
  std::string error;

  REQUIRE(wellwatch::telemetry::ReadTelemetryCsv(input, events, issues, error));
  REQUIRE(events.size() == 2U);
  REQUIRE(events[0].status == "OK");
  REQUIRE(events[1].status == "ALARM");
}

TEST_CASE("ReadTelemetryCsv skips bad rows and reports their line numbers", "[telemetry][csv]") {
  std::istringstream input("device_id,ts,temperature,pressure\n"
                           "well-1,1,80,200\n"
                           "well-1,abc,80,200\n"
                           "well-1,3\n"
                           "well-1,4,82,nan\n");
  std::vector<TelemetryEvent> events;
  std::vector<CsvRowIssue> issues;
  std::string error;

  REQUIRE(wellwatch::telemetry::ReadTelemetryCsv(input, events, issues, error));
  REQUIRE(events.size() == 2U);
  REQUIRE(issues.size() == 2U);
  REQUIRE(issues[0].line_number == 3U);
  REQUIRE(issues[0].message.find("invalid ts value") != std::string::npos);
  REQUIRE(issues[1].line_number == 4U);
  REQUIRE(issues[1].message.find("expected at least 4 columns") != std::string::npos);
}

TEST_CASE("ReadTelemetryCsv rejects a header without required columns", "[telemetry][csv]") {
  std::istringstream input("device_id,ts,temperature\nwell-1,1,80\n");
  std::vector<TelemetryEvent> events;
  std::vector<CsvRowIssue> issues;
  std::string error;

  REQUIRE_FALSE(wellwatch::telemetry::ReadTelemetryCsv(input, events, issues, error));
  REQUIRE(error.find("device_id, ts, temperature and pressure") != std::string::npos);
}

TEST_CASE("ReadTelemetryCsvFile fails for a missing file", "[telemetry][csv]") {
  std::vector<TelemetryEvent> events;
  std::vector<CsvRowIssue> issues;
  std::string error;
  REQUIRE_FALSE(wellwatch::telemetry::ReadTelemetryCsvFile("/nonexistent/wellwatch.csv", events,
                                                           issues, error));
  REQUIRE(error.find("failed to open telemetry csv") != std::string::npos);
}

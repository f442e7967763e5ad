#include "core/logging/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using wellwatch::core::logging::Logger;
using wellwatch::core::logging::LogLevel;

TEST_CASE("ParseLogLevel accepts known levels case-insensitively", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;

  REQUIRE(wellwatch::core::logging::ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(wellwatch::core::logging::ParseLogLevel("warning", level, error));
  REQUIRE(level == LogLevel::kWarn);
  REQUIRE(error.empty());
}

TEST_CASE("ParseLogLevel rejects unknown and empty values", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;

  REQUIRE_FALSE(wellwatch::core::logging::ParseLogLevel("verbose", level, error));
  REQUIRE(error.find("debug|info|warn|error") != std::string::npos);
  REQUIRE_FALSE(wellwatch::core::logging::ParseLogLevel("", level, error));
  REQUIRE(error.find("missing value") != std::string::npos);
}

TEST_CASE("Logger writes one key=value record per line", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kInfo, out);
  logger.SetInstanceId("replay-1");

  logger.Info("alert dispatched", {{"device_id", "pump-7"}, {"note", "say \"hi\""}});

  const std::string line = out.str();
  REQUIRE(line.find("level=INFO") != std::string::npos);
  REQUIRE(line.find("instance_id=\"replay-1\"") != std::string::npos);
  REQUIRE(line.find("msg=\"alert dispatched\"") != std::string::npos);
  REQUIRE(line.find("device_id=\"pump-7\"") != std::string::npos);
  REQUIRE(line.find("note=\"say \\\"hi\\\"\"") != std::string::npos);
  REQUIRE(line.back() == '\n');
}

TEST_CASE("Logger drops records below the minimum level", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kWarn, out);

  logger.Debug("hidden");
  logger.Info("hidden too");
  REQUIRE(out.str().empty());

  logger.Warn("shown");
  REQUIRE(out.str().find("level=WARN") != std::string::npos);
  REQUIRE_FALSE(logger.ShouldLog(LogLevel::kInfo));
  REQUIRE(logger.ShouldLog(LogLevel::kError));
}

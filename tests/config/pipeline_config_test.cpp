#include "config/pipeline_config.hpp"

#include "../common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using wellwatch::config::ConfigIssue;
using wellwatch::config::PipelineConfig;

namespace {

bool HasIssue(const std::vector<ConfigIssue>& issues, const std::string& path,
              const std::string& message) {
  for (const auto& issue : issues) {
    if (issue.path == path && issue.message == message) {
      return true;
    }
  }
  return false;
}

} // namespace

TEST_CASE("Default pipeline config is valid", "[config][defaults]") {
  const PipelineConfig config;
  std::vector<ConfigIssue> issues;
  REQUIRE(wellwatch::config::ValidatePipelineConfig(config, issues));
  REQUIRE(issues.empty());
  REQUIRE(config.window_size == 24U);
  REQUIRE(config.min_window == 10U);
  REQUIRE(config.weights.statistical == 0.5);
  REQUIRE(config.dedup_window_seconds == 60.0);
}

TEST_CASE("ParsePipelineConfigText overlays values on the defaults", "[config][parse]") {
  PipelineConfig config;
  std::vector<ConfigIssue> issues;
  std::string error;
  REQUIRE(wellwatch::config::ParsePipelineConfigText(
      R"({"window_size": 48, "z_score_threshold": 2.5,
          "rules": {"temperature_high": 110},
          "workers": {"count": 4},
          "dispatch": {"sink_timeout_ms": 750}})",
      config, issues, error));
  REQUIRE(issues.empty());
  REQUIRE(config.window_size == 48U);
  REQUIRE(config.z_score_threshold == 2.5);
  REQUIRE(config.rules.temperature_high == 110.0);
  REQUIRE(config.rules.temperature_low == 40.0);
  REQUIRE(config.workers.count == 4U);
  REQUIRE(config.dispatch.sink_timeout_ms == 750U);
}

TEST_CASE("ParsePipelineConfigText reports unknown keys and wrong types", "[config][parse]") {
  PipelineConfig config;
  std::vector<ConfigIssue> issues;
  std::string error;
  REQUIRE(wellwatch::config::ParsePipelineConfigText(
      R"({"windowsize": 10, "min_window": -3, "vote_threshold": "high",
          "rules": {"temperature_hi": 1}, "weights": 5})",
      config, issues, error));
  REQUIRE(HasIssue(issues, "$.windowsize", "unknown key"));
  REQUIRE(HasIssue(issues, "$.min_window", "must be a non-negative integer"));
  REQUIRE(HasIssue(issues, "$.vote_threshold", "must be a finite number"));
  REQUIRE(HasIssue(issues, "$.rules.temperature_hi", "unknown key"));
  REQUIRE(HasIssue(issues, "$.weights", "must be an object"));
  REQUIRE(config.min_window == 10U);
}

TEST_CASE("ValidatePipelineConfig catches inconsistent ranges", "[config][validate]") {
  PipelineConfig config;
  config.min_window = 30;
  config.vote_threshold = 1.5;
  config.rules.temperature_low = 130.0;
  config.health_thresholds.degraded = 0.9;
  config.weights = {.statistical = 0.0, .rule_based = 0.0, .external_model = 0.0};
  config.buffer_capacity_per_device = 10;

  std::vector<ConfigIssue> issues;
  REQUIRE_FALSE(wellwatch::config::ValidatePipelineConfig(config, issues));
  REQUIRE(HasIssue(issues, "$.min_window", "must not exceed window_size"));
  REQUIRE(HasIssue(issues, "$.vote_threshold", "must be within [0, 1]"));
  REQUIRE(HasIssue(issues, "$.rules.temperature_low", "must be below temperature_high"));
  REQUIRE(HasIssue(issues, "$.health_thresholds.degraded", "must not exceed healthy"));
  REQUIRE(HasIssue(issues, "$.weights", "at least one weight must be > 0"));
  REQUIRE(HasIssue(issues, "$.buffer_capacity_per_device", "must hold window_size + 1 events"));
}

TEST_CASE("ParsePipelineConfigText rejects non-object documents", "[config][parse]") {
  PipelineConfig config;
  std::vector<ConfigIssue> issues;
  std::string error;
  REQUIRE_FALSE(wellwatch::config::ParsePipelineConfigText("[]", config, issues, error));
  REQUIRE(error == "pipeline config root must be a JSON object");

  REQUIRE_FALSE(wellwatch::config::ParsePipelineConfigText("{", config, issues, error));
  REQUIRE(error.find("JSON parse error") != std::string::npos);
}

TEST_CASE("LoadPipelineConfigFile reads a file and echoes it as JSON", "[config][load]") {
  const auto root = wellwatch::tests::common::CreateUniqueTempDir("wellwatch-config");
  const auto path = root / "pipeline.json";
  wellwatch::tests::common::WriteTextFile(path, R"({"dedup_window_seconds": 120})");

  PipelineConfig config;
  std::vector<ConfigIssue> issues;
  std::string error;
  REQUIRE(wellwatch::config::LoadPipelineConfigFile(path, config, issues, error));
  REQUIRE(issues.empty());
  REQUIRE(config.dedup_window_seconds == 120.0);
  REQUIRE(wellwatch::config::ToJson(config).find("\"dedup_window_seconds\":120") !=
          std::string::npos);

  REQUIRE_FALSE(wellwatch::config::LoadPipelineConfigFile(root / "missing.json", config, issues,
                                                          error));
  REQUIRE(error.find("unable to open pipeline config") != std::string::npos);
  wellwatch::tests::common::RemovePathBestEffort(root);
}

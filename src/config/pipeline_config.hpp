#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace wellwatch::config {

// Absolute rule thresholds. High/low breaches and extremes raise alerts
// directly; the normal range and the cross-parameter rule feed the vote.
struct RuleThresholds {
  double temperature_high = 120.0;
  double temperature_low = 40.0;
  double pressure_high = 300.0;
  double pressure_low = 100.0;

  double temperature_extreme_high = 150.0;
  double temperature_extreme_low = -50.0;
  double pressure_extreme_high = 500.0;
  double pressure_extreme_low = 0.0;

  // Optimal operating ranges. The normal range is the optimal range widened
  // by `normal_range_tolerance` (relative) on both sides.
  double temperature_normal_min = 75.0;
  double temperature_normal_max = 85.0;
  double pressure_normal_min = 180.0;
  double pressure_normal_max = 220.0;
  double normal_range_tolerance = 0.2;

  // Cross-parameter rule: both metrics above these at the same time.
  double combined_temperature = 100.0;
  double combined_pressure = 250.0;
};

// Vote weights of the ensemble signals. Only signals that produced a verdict
// take part in the normalization.
struct SignalWeights {
  double statistical = 0.5;
  double rule_based = 0.3;
  double external_model = 0.2;
};

struct HealthThresholds {
  double healthy = 0.7;
  double degraded = 0.4;
  // Rolling std at which a metric's stability reaches 0.
  double temperature_std_bad = 10.0;
  double pressure_std_bad = 50.0;
  double alert_lookback_seconds = 3600.0;
  std::size_t history_points = 100;
};

struct TrendConfig {
  // Trend detector (alerting).
  std::size_t detector_window = 30;
  std::size_t detector_min_points = 20;
  double temperature_slope_alert = 0.5;
  double pressure_slope_alert = 2.0;

  // TrendAnalyzer (queries).
  double stable_slope = 0.01;
  std::size_t max_lag = 24;
  std::size_t moving_average_window = 6;
  double moving_average_change = 0.05;
};

struct DispatchConfig {
  std::uint32_t sink_timeout_ms = 2000;
  std::size_t sink_queue_capacity = 1024;
  std::uint32_t drain_timeout_ms = 5000;
  std::size_t alert_log_capacity = 10000;
};

struct WorkerConfig {
  // 0 runs the pipeline synchronously inside Ingest().
  std::size_t count = 0;
  std::size_t queue_capacity = 1024;
};

// One configuration object, built once and injected into every component.
struct PipelineConfig {
  std::size_t window_size = 24;
  std::size_t min_window = 10;
  double z_score_threshold = 3.0;
  double vote_threshold = 0.5;
  double model_threshold = 0.5;
  double dedup_window_seconds = 60.0;
  std::size_t buffer_capacity_per_device = 10000;

  HealthThresholds health_thresholds;
  RuleThresholds rules;
  SignalWeights weights;
  TrendConfig trend;
  DispatchConfig dispatch;
  WorkerConfig workers;
};

struct ConfigIssue {
  std::string path;
  std::string message;
};

// Range and consistency checks. Returns true when `issues` stayed empty.
bool ValidatePipelineConfig(const PipelineConfig& config, std::vector<ConfigIssue>& issues);

// Parses a JSON document on top of the defaults already in `config`.
//
// Contract:
// - returns false only when the text is not JSON or the root is not an object;
//   `error` carries the parser diagnostic.
// - unknown keys, wrong types and out-of-range values become `issues`
//   (path like `$.rules.temperature_high`); the caller decides whether a
//   non-empty issue list is fatal.
bool ParsePipelineConfigText(std::string_view json_text, PipelineConfig& config,
                             std::vector<ConfigIssue>& issues, std::string& error);

bool LoadPipelineConfigFile(const std::filesystem::path& path, PipelineConfig& config,
                            std::vector<ConfigIssue>& issues, std::string& error);

// Effective configuration rendered as JSON (CLI summaries, logs).
std::string ToJson(const PipelineConfig& config);

} // namespace wellwatch::config

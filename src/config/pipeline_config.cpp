#include "config/pipeline_config.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <utility>

namespace wellwatch::config {
namespace {

using JsonValue = core::json::Value;

// One settable leaf of the config tree. Exactly one of the targets is set.
struct FieldBinding {
  std::string key;
  double* number = nullptr;
  std::size_t* count = nullptr;
  std::uint32_t* millis = nullptr;
};

void AddIssue(std::vector<ConfigIssue>& issues, std::string path, std::string message) {
  issues.push_back(ConfigIssue{.path = std::move(path), .message = std::move(message)});
}

bool TryGetFiniteNumber(const JsonValue& value, double& out) {
  if (!value.IsNumber() || !std::isfinite(value.number_value)) {
    return false;
  }
  out = value.number_value;
  return true;
}

bool TryGetNonNegativeInteger(const JsonValue& value, std::uint64_t& out) {
  double parsed = 0.0;
  if (!TryGetFiniteNumber(value, parsed) || parsed < 0.0 || std::floor(parsed) != parsed ||
      parsed > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(parsed);
  return true;
}

void ApplyBindings(const JsonValue& object, const std::string& path,
                   const std::vector<FieldBinding>& bindings,
                   const std::set<std::string>& nested_keys, std::vector<ConfigIssue>& issues) {
  for (const auto& [key, value] : object.object_value) {
    const std::string field_path = path + "." + key;
    if (nested_keys.count(key) != 0U) {
      continue;
    }

    const FieldBinding* binding = nullptr;
    for (const auto& candidate : bindings) {
      if (candidate.key == key) {
        binding = &candidate;
        break;
      }
    }
    if (binding == nullptr) {
      AddIssue(issues, field_path, "unknown key");
      continue;
    }

    if (binding->number != nullptr) {
      double parsed = 0.0;
      if (!TryGetFiniteNumber(value, parsed)) {
        AddIssue(issues, field_path, "must be a finite number");
        continue;
      }
      *binding->number = parsed;
      continue;
    }

    std::uint64_t parsed = 0;
    if (!TryGetNonNegativeInteger(value, parsed)) {
      AddIssue(issues, field_path, "must be a non-negative integer");
      continue;
    }
    if (binding->count != nullptr) {
      *binding->count = static_cast<std::size_t>(parsed);
    } else {
      *binding->millis = static_cast<std::uint32_t>(parsed);
    }
  }
}

void ApplySection(const JsonValue& root, const std::string& key,
                  const std::vector<FieldBinding>& bindings, std::vector<ConfigIssue>& issues) {
  const JsonValue* section = root.Find(key);
  if (section == nullptr) {
    return;
  }
  const std::string path = "$." + key;
  if (!section->IsObject()) {
    AddIssue(issues, path, "must be an object");
    return;
  }
  ApplyBindings(*section, path, bindings, {}, issues);
}

void RequirePositive(double value, const char* path, std::vector<ConfigIssue>& issues) {
  if (!(value > 0.0)) {
    AddIssue(issues, path, "must be > 0");
  }
}

void RequireNonNegative(double value, const char* path, std::vector<ConfigIssue>& issues) {
  if (value < 0.0) {
    AddIssue(issues, path, "must be >= 0");
  }
}

void RequireUnitInterval(double value, const char* path, std::vector<ConfigIssue>& issues) {
  if (value < 0.0 || value > 1.0) {
    AddIssue(issues, path, "must be within [0, 1]");
  }
}

void RequireOrdered(double low, double high, const char* path, const char* message,
                    std::vector<ConfigIssue>& issues) {
  if (!(low < high)) {
    AddIssue(issues, path, message);
  }
}

} // namespace

bool ValidatePipelineConfig(const PipelineConfig& config, std::vector<ConfigIssue>& issues) {
  const std::size_t issues_before = issues.size();

  if (config.window_size < 2U) {
    AddIssue(issues, "$.window_size", "must be >= 2");
  }
  if (config.min_window < 2U) {
    AddIssue(issues, "$.min_window", "must be >= 2");
  }
  if (config.min_window > config.window_size) {
    AddIssue(issues, "$.min_window", "must not exceed window_size");
  }
  RequirePositive(config.z_score_threshold, "$.z_score_threshold", issues);
  RequireUnitInterval(config.vote_threshold, "$.vote_threshold", issues);
  RequireUnitInterval(config.model_threshold, "$.model_threshold", issues);
  RequireNonNegative(config.dedup_window_seconds, "$.dedup_window_seconds", issues);
  if (config.buffer_capacity_per_device == 0U) {
    AddIssue(issues, "$.buffer_capacity_per_device", "must be > 0");
  } else if (config.buffer_capacity_per_device < config.window_size + 1U) {
    AddIssue(issues, "$.buffer_capacity_per_device", "must hold window_size + 1 events");
  }

  const HealthThresholds& health = config.health_thresholds;
  RequireUnitInterval(health.healthy, "$.health_thresholds.healthy", issues);
  RequireUnitInterval(health.degraded, "$.health_thresholds.degraded", issues);
  if (health.degraded > health.healthy) {
    AddIssue(issues, "$.health_thresholds.degraded", "must not exceed healthy");
  }
  RequirePositive(health.temperature_std_bad, "$.health_thresholds.temperature_std_bad", issues);
  RequirePositive(health.pressure_std_bad, "$.health_thresholds.pressure_std_bad", issues);
  RequireNonNegative(health.alert_lookback_seconds, "$.health_thresholds.alert_lookback_seconds",
                     issues);
  if (health.history_points < 2U) {
    AddIssue(issues, "$.health_thresholds.history_points", "must be >= 2");
  }

  const RuleThresholds& rules = config.rules;
  RequireOrdered(rules.temperature_low, rules.temperature_high, "$.rules.temperature_low",
                 "must be below temperature_high", issues);
  RequireOrdered(rules.pressure_low, rules.pressure_high, "$.rules.pressure_low",
                 "must be below pressure_high", issues);
  RequireOrdered(rules.temperature_extreme_low, rules.temperature_extreme_high,
                 "$.rules.temperature_extreme_low", "must be below temperature_extreme_high",
                 issues);
  RequireOrdered(rules.pressure_extreme_low, rules.pressure_extreme_high,
                 "$.rules.pressure_extreme_low", "must be below pressure_extreme_high", issues);
  RequireOrdered(rules.temperature_normal_min, rules.temperature_normal_max,
                 "$.rules.temperature_normal_min", "must be below temperature_normal_max", issues);
  RequireOrdered(rules.pressure_normal_min, rules.pressure_normal_max,
                 "$.rules.pressure_normal_min", "must be below pressure_normal_max", issues);
  RequireUnitInterval(rules.normal_range_tolerance, "$.rules.normal_range_tolerance", issues);

  const SignalWeights& weights = config.weights;
  RequireNonNegative(weights.statistical, "$.weights.statistical", issues);
  RequireNonNegative(weights.rule_based, "$.weights.rule_based", issues);
  RequireNonNegative(weights.external_model, "$.weights.external_model", issues);
  if (weights.statistical + weights.rule_based + weights.external_model <= 0.0) {
    AddIssue(issues, "$.weights", "at least one weight must be > 0");
  }

  const TrendConfig& trend = config.trend;
  if (trend.detector_min_points < 3U) {
    AddIssue(issues, "$.trend.detector_min_points", "must be >= 3");
  }
  if (trend.detector_window < trend.detector_min_points) {
    AddIssue(issues, "$.trend.detector_window", "must be >= detector_min_points");
  }
  RequirePositive(trend.temperature_slope_alert, "$.trend.temperature_slope_alert", issues);
  RequirePositive(trend.pressure_slope_alert, "$.trend.pressure_slope_alert", issues);
  RequireNonNegative(trend.stable_slope, "$.trend.stable_slope", issues);
  if (trend.max_lag == 0U) {
    AddIssue(issues, "$.trend.max_lag", "must be > 0");
  }
  if (trend.moving_average_window == 0U) {
    AddIssue(issues, "$.trend.moving_average_window", "must be > 0");
  }
  RequireNonNegative(trend.moving_average_change, "$.trend.moving_average_change", issues);

  if (config.dispatch.sink_timeout_ms == 0U) {
    AddIssue(issues, "$.dispatch.sink_timeout_ms", "must be > 0");
  }
  if (config.dispatch.sink_queue_capacity == 0U) {
    AddIssue(issues, "$.dispatch.sink_queue_capacity", "must be > 0");
  }
  if (config.dispatch.alert_log_capacity == 0U) {
    AddIssue(issues, "$.dispatch.alert_log_capacity", "must be > 0");
  }
  if (config.workers.queue_capacity == 0U) {
    AddIssue(issues, "$.workers.queue_capacity", "must be > 0");
  }

  return issues.size() == issues_before;
}

bool ParsePipelineConfigText(std::string_view json_text, PipelineConfig& config,
                             std::vector<ConfigIssue>& issues, std::string& error) {
  error.clear();

  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  if (!root.IsObject()) {
    error = "pipeline config root must be a JSON object";
    return false;
  }

  const std::vector<FieldBinding> top_level = {
      {.key = "window_size", .count = &config.window_size},
      {.key = "min_window", .count = &config.min_window},
      {.key = "z_score_threshold", .number = &config.z_score_threshold},
      {.key = "vote_threshold", .number = &config.vote_threshold},
      {.key = "model_threshold", .number = &config.model_threshold},
      {.key = "dedup_window_seconds", .number = &config.dedup_window_seconds},
      {.key = "buffer_capacity_per_device", .count = &config.buffer_capacity_per_device},
  };
  const std::set<std::string> sections = {"health_thresholds", "rules", "weights",
                                          "trend",             "dispatch", "workers"};
  ApplyBindings(root, "$", top_level, sections, issues);

  HealthThresholds& health = config.health_thresholds;
  ApplySection(root, "health_thresholds",
               {
                   {.key = "healthy", .number = &health.healthy},
                   {.key = "degraded", .number = &health.degraded},
                   {.key = "temperature_std_bad", .number = &health.temperature_std_bad},
                   {.key = "pressure_std_bad", .number = &health.pressure_std_bad},
                   {.key = "alert_lookback_seconds", .number = &health.alert_lookback_seconds},
                   {.key = "history_points", .count = &health.history_points},
               },
               issues);

  RuleThresholds& rules = config.rules;
  ApplySection(root, "rules",
               {
                   {.key = "temperature_high", .number = &rules.temperature_high},
                   {.key = "temperature_low", .number = &rules.temperature_low},
                   {.key = "pressure_high", .number = &rules.pressure_high},
                   {.key = "pressure_low", .number = &rules.pressure_low},
                   {.key = "temperature_extreme_high", .number = &rules.temperature_extreme_high},
                   {.key = "temperature_extreme_low", .number = &rules.temperature_extreme_low},
                   {.key = "pressure_extreme_high", .number = &rules.pressure_extreme_high},
                   {.key = "pressure_extreme_low", .number = &rules.pressure_extreme_low},
                   {.key = "temperature_normal_min", .number = &rules.temperature_normal_min},
                   {.key = "temperature_normal_max", .number = &rules.temperature_normal_max},
                   {.key = "pressure_normal_min", .number = &rules.pressure_normal_min},
                   {.key = "pressure_normal_max", .number = &rules.pressure_normal_max},
                   {.key = "normal_range_tolerance", .number = &rules.normal_range_tolerance},
                   {.key = "combined_temperature", .number = &rules.combined_temperature},
                   {.key = "combined_pressure", .number = &rules.combined_pressure},
               },
               issues);

  SignalWeights& weights = config.weights;
  ApplySection(root, "weights",
               {
                   {.key = "statistical", .number = &weights.statistical},
                   {.key = "rule_based", .number = &weights.rule_based},
                   {.key = "external_model", .number = &weights.external_model},
               },
               issues);

  TrendConfig& trend = config.trend;
  ApplySection(root, "trend",
               {
                   {.key = "detector_window", .count = &trend.detector_window},
                   {.key = "detector_min_points", .count = &trend.detector_min_points},
                   {.key = "temperature_slope_alert", .number = &trend.temperature_slope_alert},
                   {.key = "pressure_slope_alert", .number = &trend.pressure_slope_alert},
                   {.key = "stable_slope", .number = &trend.stable_slope},
                   {.key = "max_lag", .count = &trend.max_lag},
                   {.key = "moving_average_window", .count = &trend.moving_average_window},
                   {.key = "moving_average_change", .number = &trend.moving_average_change},
               },
               issues);

  DispatchConfig& dispatch = config.dispatch;
  ApplySection(root, "dispatch",
               {
                   {.key = "sink_timeout_ms", .millis = &dispatch.sink_timeout_ms},
                   {.key = "sink_queue_capacity", .count = &dispatch.sink_queue_capacity},
                   {.key = "drain_timeout_ms", .millis = &dispatch.drain_timeout_ms},
                   {.key = "alert_log_capacity", .count = &dispatch.alert_log_capacity},
               },
               issues);

  ApplySection(root, "workers",
               {
                   {.key = "count", .count = &config.workers.count},
                   {.key = "queue_capacity", .count = &config.workers.queue_capacity},
               },
               issues);

  ValidatePipelineConfig(config, issues);
  return true;
}

bool LoadPipelineConfigFile(const std::filesystem::path& path, PipelineConfig& config,
                            std::vector<ConfigIssue>& issues, std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open pipeline config: " + path.string();
    return false;
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  if (!ParsePipelineConfigText(buffer.str(), config, issues, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

std::string ToJson(const PipelineConfig& config) {
  using core::FormatJsonNumber;
  const auto& h = config.health_thresholds;
  const auto& r = config.rules;
  const auto& w = config.weights;
  const auto& t = config.trend;
  const auto& d = config.dispatch;

  std::ostringstream out;
  out << "{\"window_size\":" << config.window_size << ",\"min_window\":" << config.min_window
      << ",\"z_score_threshold\":" << FormatJsonNumber(config.z_score_threshold)
      << ",\"vote_threshold\":" << FormatJsonNumber(config.vote_threshold)
      << ",\"model_threshold\":" << FormatJsonNumber(config.model_threshold)
      << ",\"dedup_window_seconds\":" << FormatJsonNumber(config.dedup_window_seconds)
      << ",\"buffer_capacity_per_device\":" << config.buffer_capacity_per_device;

  out << ",\"health_thresholds\":{\"healthy\":" << FormatJsonNumber(h.healthy)
      << ",\"degraded\":" << FormatJsonNumber(h.degraded)
      << ",\"temperature_std_bad\":" << FormatJsonNumber(h.temperature_std_bad)
      << ",\"pressure_std_bad\":" << FormatJsonNumber(h.pressure_std_bad)
      << ",\"alert_lookback_seconds\":" << FormatJsonNumber(h.alert_lookback_seconds)
      << ",\"history_points\":" << h.history_points << "}";

  out << ",\"rules\":{\"temperature_high\":" << FormatJsonNumber(r.temperature_high)
      << ",\"temperature_low\":" << FormatJsonNumber(r.temperature_low)
      << ",\"pressure_high\":" << FormatJsonNumber(r.pressure_high)
      << ",\"pressure_low\":" << FormatJsonNumber(r.pressure_low)
      << ",\"temperature_extreme_high\":" << FormatJsonNumber(r.temperature_extreme_high)
      << ",\"temperature_extreme_low\":" << FormatJsonNumber(r.temperature_extreme_low)
      << ",\"pressure_extreme_high\":" << FormatJsonNumber(r.pressure_extreme_high)
      << ",\"pressure_extreme_low\":" << FormatJsonNumber(r.pressure_extreme_low)
      << ",\"temperature_normal_min\":" << FormatJsonNumber(r.temperature_normal_min)
      << ",\"temperature_normal_max\":" << FormatJsonNumber(r.temperature_normal_max)
      << ",\"pressure_normal_min\":" << FormatJsonNumber(r.pressure_normal_min)
      << ",\"pressure_normal_max\":" << FormatJsonNumber(r.pressure_normal_max)
      << ",\"normal_range_tolerance\":" << FormatJsonNumber(r.normal_range_tolerance)
      << ",\"combined_temperature\":" << FormatJsonNumber(r.combined_temperature)
      << ",\"combined_pressure\":" << FormatJsonNumber(r.combined_pressure) << "}";

  out << ",\"weights\":{\"statistical\":" << FormatJsonNumber(w.statistical)
      << ",\"rule_based\":" << FormatJsonNumber(w.rule_based)
      << ",\"external_model\":" << FormatJsonNumber(w.external_model) << "}";

  out << ",\"trend\":{\"detector_window\":" << t.detector_window
      << ",\"detector_min_points\":" << t.detector_min_points
      << ",\"temperature_slope_alert\":" << FormatJsonNumber(t.temperature_slope_alert)
      << ",\"pressure_slope_alert\":" << FormatJsonNumber(t.pressure_slope_alert)
      << ",\"stable_slope\":" << FormatJsonNumber(t.stable_slope) << ",\"max_lag\":" << t.max_lag
      << ",\"moving_average_window\":" << t.moving_average_window
      << ",\"moving_average_change\":" << FormatJsonNumber(t.moving_average_change) << "}";

  out << ",\"dispatch\":{\"sink_timeout_ms\":" << d.sink_timeout_ms
      << ",\"sink_queue_capacity\":" << d.sink_queue_capacity
      << ",\"drain_timeout_ms\":" << d.drain_timeout_ms
      << ",\"alert_log_capacity\":" << d.alert_log_capacity << "}";

  out << ",\"workers\":{\"count\":" << config.workers.count
      << ",\"queue_capacity\":" << config.workers.queue_capacity << "}}";
  return out.str();
}

} // namespace wellwatch::config

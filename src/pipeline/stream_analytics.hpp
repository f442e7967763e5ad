#pragma once

#include "health/health_scorer.hpp"
#include "pipeline/processor_stats.hpp"
#include "pipeline/stream_processor.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wellwatch::pipeline {

struct SystemOverview {
  std::size_t total_devices = 0;
  std::size_t healthy_devices = 0;
  // healthy / total; 0 without devices.
  double system_health_score = 0.0;
  std::size_t recent_alerts = 0;
  std::size_t critical_alerts = 0;
  ProcessorStatsSnapshot stats;
  std::map<std::string, health::DeviceHealth> device_health;
};

struct MetricSummary {
  double mean = 0.0;
  double stddev = 0.0;
  double min = 0.0;
  double max = 0.0;
  // Least-squares change per reading.
  double trend = 0.0;
};

struct DeviceAnalytics {
  std::string device_id;
  bool has_data = false;
  std::size_t data_points = 0;
  double start = 0.0;
  double end = 0.0;
  double duration_hours = 0.0;
  MetricSummary temperature;
  MetricSummary pressure;
  std::size_t recent_alerts = 0;
  // Sorted, distinct.
  std::vector<std::string> alert_types;
};

// Fleet-level and per-device read-only views over a StreamProcessor.
class StreamAnalytics {
public:
  explicit StreamAnalytics(const StreamProcessor& processor);

  // Recent and critical alert counts cover the last hour of event time.
  SystemOverview GetSystemOverview() const;

  // Alert figures cover the last 24 hours of event time.
  DeviceAnalytics GetDeviceAnalytics(const std::string& device_id) const;

private:
  const StreamProcessor& processor_;
};

std::string ToJson(const SystemOverview& overview);
std::string ToJson(const DeviceAnalytics& analytics);

} // namespace wellwatch::pipeline

#include "pipeline/stream_analytics.hpp"

#include "core/json_utils.hpp"
#include "detection/window_stats.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace wellwatch::pipeline {
namespace {

constexpr double kOverviewAlertWindowSeconds = 3600.0;
constexpr double kDeviceAlertWindowSeconds = 86400.0;
constexpr double kSecondsPerHour = 3600.0;

MetricSummary Summarize(const std::vector<telemetry::TelemetryEvent>& events,
                        telemetry::Metric metric) {
  const std::vector<double> values = detection::MetricSeries(events, metric);
  const detection::SeriesStats stats = detection::Summarize(values, 1);

  MetricSummary summary;
  summary.mean = stats.mean;
  summary.stddev = stats.stddev;
  summary.min = stats.min;
  summary.max = stats.max;
  detection::LinearFit fit;
  if (detection::FitLineByIndex(values, fit)) {
    summary.trend = fit.slope;
  }
  return summary;
}

void AppendMetric(std::ostringstream& out, const char* name, const MetricSummary& summary) {
  using core::FormatJsonNumber;
  out << "\"" << name << "\":{\"mean\":" << FormatJsonNumber(summary.mean)
      << ",\"std\":" << FormatJsonNumber(summary.stddev)
      << ",\"min\":" << FormatJsonNumber(summary.min) << ",\"max\":" << FormatJsonNumber(summary.max)
      << ",\"trend\":" << FormatJsonNumber(summary.trend) << "}";
}

} // namespace

StreamAnalytics::StreamAnalytics(const StreamProcessor& processor) : processor_(processor) {}

SystemOverview StreamAnalytics::GetSystemOverview() const {
  SystemOverview overview;
  for (const std::string& device_id : processor_.DeviceIds()) {
    health::DeviceHealth health = processor_.GetDeviceHealth(device_id);
    if (health.status == health::HealthStatus::kHealthy) {
      ++overview.healthy_devices;
    }
    overview.device_health.emplace(device_id, std::move(health));
  }
  overview.total_devices = overview.device_health.size();
  if (overview.total_devices > 0U) {
    overview.system_health_score = static_cast<double>(overview.healthy_devices) /
                                   static_cast<double>(overview.total_devices);
  }

  const std::vector<alerting::Alert> alerts =
      processor_.GetRecentAlerts(kOverviewAlertWindowSeconds);
  overview.recent_alerts = alerts.size();
  for (const alerting::Alert& alert : alerts) {
    if (alert.severity == detection::Severity::kCritical) {
      ++overview.critical_alerts;
    }
  }
  overview.stats = processor_.GetProcessorStats();
  return overview;
}

DeviceAnalytics StreamAnalytics::GetDeviceAnalytics(const std::string& device_id) const {
  DeviceAnalytics analytics;
  analytics.device_id = device_id;

  const std::vector<telemetry::TelemetryEvent> events = processor_.DeviceEvents(device_id);
  if (events.empty()) {
    return analytics;
  }

  analytics.has_data = true;
  analytics.data_points = events.size();
  analytics.start = events.front().timestamp;
  analytics.end = events.front().timestamp;
  for (const auto& event : events) {
    analytics.start = std::min(analytics.start, event.timestamp);
    analytics.end = std::max(analytics.end, event.timestamp);
  }
  analytics.duration_hours = (analytics.end - analytics.start) / kSecondsPerHour;
  analytics.temperature = Summarize(events, telemetry::Metric::kTemperature);
  analytics.pressure = Summarize(events, telemetry::Metric::kPressure);

  const std::vector<alerting::Alert> alerts =
      processor_.GetDeviceAlerts(device_id, kDeviceAlertWindowSeconds);
  analytics.recent_alerts = alerts.size();
  std::set<std::string> types;
  for (const alerting::Alert& alert : alerts) {
    types.insert(alert.alert_type);
  }
  analytics.alert_types.assign(types.begin(), types.end());
  return analytics;
}

std::string ToJson(const SystemOverview& overview) {
  std::ostringstream out;
  out << "{\"total_devices\":" << overview.total_devices
      << ",\"healthy_devices\":" << overview.healthy_devices
      << ",\"system_health_score\":" << core::FormatJsonNumber(overview.system_health_score)
      << ",\"recent_alerts\":" << overview.recent_alerts
      << ",\"critical_alerts\":" << overview.critical_alerts
      << ",\"processing_stats\":" << ToJson(overview.stats) << ",\"device_health\":{";
  bool first = true;
  for (const auto& [device_id, health] : overview.device_health) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << core::QuoteJson(device_id) << ":" << health::ToJson(health);
  }
  out << "}}";
  return out.str();
}

std::string ToJson(const DeviceAnalytics& analytics) {
  std::ostringstream out;
  out << "{\"device_id\":" << core::QuoteJson(analytics.device_id);
  if (!analytics.has_data) {
    out << ",\"error\":\"no data available for device\"}";
    return out.str();
  }
  out << ",\"data_points\":" << analytics.data_points << ",\"time_range\":{\"start\":"
      << core::FormatJsonNumber(analytics.start, 15)
      << ",\"end\":" << core::FormatJsonNumber(analytics.end, 15)
      << ",\"duration_hours\":" << core::FormatJsonNumber(analytics.duration_hours) << "},";
  AppendMetric(out, "temperature", analytics.temperature);
  out << ",";
  AppendMetric(out, "pressure", analytics.pressure);
  out << ",\"recent_alerts\":" << analytics.recent_alerts << ",\"alert_types\":[";
  for (std::size_t i = 0; i < analytics.alert_types.size(); ++i) {
    if (i > 0U) {
      out << ",";
    }
    out << core::QuoteJson(analytics.alert_types[i]);
  }
  out << "]}";
  return out.str();
}

} // namespace wellwatch::pipeline

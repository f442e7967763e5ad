#pragma once

#include "alerting/alert.hpp"
#include "alerting/alert_dispatcher.hpp"
#include "alerting/alert_sink.hpp"
#include "config/pipeline_config.hpp"
#include "core/errors/pipeline_error.hpp"
#include "core/logging/logger.hpp"
#include "detection/detector.hpp"
#include "detection/ensemble_detector.hpp"
#include "detection/verdict.hpp"
#include "health/health_scorer.hpp"
#include "history/history_store.hpp"
#include "model/anomaly_scorer.hpp"
#include "pipeline/processor_stats.hpp"
#include "pipeline/sharded_executor.hpp"
#include "telemetry/telemetry_event.hpp"
#include "trend/trend_analyzer.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wellwatch::pipeline {

struct IngestResult {
  // True when the event was handed to a worker; verdicts and alerts are then
  // not available to the caller.
  bool queued = false;
  std::vector<detection::AnomalyVerdict> verdicts;
  std::vector<alerting::Alert> alerts;
};

// Orchestrates the per-event pipeline:
//   validate -> append to device history -> detector chain + ensemble vote ->
//   alert dispatch -> stats.
//
// Concurrency:
// - a device's events are processed one at a time and in arrival order
//   (writer lock of its DeviceHistory, plus device-sharded workers when
//   `workers.count > 0`). Different devices run in parallel.
// - queries take snapshots and never block ingestion for longer than a copy.
// - "now" for time-windowed queries is the watermark: the newest event
//   timestamp ingested so far.
class StreamProcessor {
public:
  StreamProcessor(config::PipelineConfig config, core::logging::Logger& logger,
                  std::shared_ptr<const model::IAnomalyScorer> scorer = nullptr);

  // Custom detector chain, in evaluation order.
  StreamProcessor(config::PipelineConfig config, core::logging::Logger& logger,
                  std::vector<std::unique_ptr<detection::IDetector>> detectors);

  ~StreamProcessor();

  StreamProcessor(const StreamProcessor&) = delete;
  StreamProcessor& operator=(const StreamProcessor&) = delete;

  bool AddSink(std::shared_ptr<alerting::IAlertSink> sink, std::string& error);

  // Contract:
  // - invalid events, events offered after Drain and every event of a
  //   processor built from a config that failed validation return false
  //   with `error.kind` set and are counted in `events_rejected`.
  // - detector and sink failures never fail ingestion; they show up as
  //   degraded verdicts and `processing_errors`.
  bool Ingest(const telemetry::TelemetryEvent& event, IngestResult& result,
              core::errors::PipelineError& error);

  health::DeviceHealth GetDeviceHealth(const std::string& device_id) const;

  // Alerts whose timestamp lies within `window_seconds` of the watermark.
  std::vector<alerting::Alert> GetRecentAlerts(double window_seconds) const;

  std::vector<alerting::Alert> GetDeviceAlerts(const std::string& device_id,
                                               double window_seconds) const;

  ProcessorStatsSnapshot GetProcessorStats() const;

  // Trend report over the device's full retained history. Unknown devices
  // yield a report with no data.
  trend::TrendReport AnalyzeTrend(const std::string& device_id, telemetry::Metric metric) const;

  // Suppresses future alerts of `alert_type` for the device for `seconds`
  // from the watermark.
  void Silence(const std::string& device_id, const std::string& alert_type, double seconds);

  // Stops accepting events, waits for Ingest calls already in progress and
  // queued pipeline work, then drains the sinks within
  // `dispatch.drain_timeout_ms`. Idempotent.
  void Drain();

  std::vector<std::string> DeviceIds() const;
  std::vector<telemetry::TelemetryEvent> DeviceEvents(const std::string& device_id) const;

  // Newest ingested event timestamp; empty before the first event.
  std::optional<double> Watermark() const;

  const config::PipelineConfig& config() const {
    return config_;
  }

  const health::HealthScorer& health_scorer() const {
    return health_;
  }

  std::vector<std::string> DetectorNames() const {
    return ensemble_.DetectorNames();
  }

private:
  void Process(const telemetry::TelemetryEvent& event, IngestResult& result);
  void AdvanceWatermark(double timestamp);
  double WatermarkOrZero() const;

  const config::PipelineConfig config_;
  core::logging::Logger& logger_;

  ProcessorStats stats_;
  history::HistoryStore store_;
  detection::EnsembleDetector ensemble_;
  health::HealthScorer health_;
  trend::TrendAnalyzer trend_;
  alerting::AlertDispatcher dispatcher_;
  std::unique_ptr<ShardedExecutor> executor_;

  const std::size_t required_history_;
  // Ingest calls past the accepting check; Drain waits for them to leave.
  std::mutex ingest_mu_;
  std::condition_variable ingest_cv_;
  std::size_t in_flight_ = 0;
  bool accepting_ = true;
  // False when ValidatePipelineConfig reported issues at construction.
  bool config_valid_ = true;
  std::atomic<bool> drained_{false};
  std::atomic<double> watermark_{-1.0};
};

} // namespace wellwatch::pipeline

#pragma once

#include "alerting/alert.hpp"
#include "alerting/alert_sink.hpp"
#include "alerting/dedup_cache.hpp"
#include "alerting/sink_worker.hpp"
#include "config/pipeline_config.hpp"
#include "core/logging/logger.hpp"
#include "detection/verdict.hpp"
#include "pipeline/processor_stats.hpp"
#include "telemetry/telemetry_event.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace wellwatch::alerting {

// Turns verdict findings into alerts, deduplicates them and fans them out to
// every registered sink.
//
// Contract:
// - one alert per finding; the ensemble, rule and trend detectors are the
//   only producers of findings.
// - an alert whose (device_id, alert_type) was dispatched less than
//   dedup_window_seconds earlier (event time) is suppressed and counted in
//   `alerts_suppressed`.
// - dispatch is fire-and-forget: alerts are queued to each sink's worker and
//   the caller never waits on delivery. Failed, timed-out and dropped
//   deliveries each add one `processing_errors`.
// - dispatched alerts are kept in a bounded log for recent-alert queries.
class AlertDispatcher {
public:
  AlertDispatcher(config::DispatchConfig dispatch, double dedup_window_seconds,
                  pipeline::ProcessorStats& stats, core::logging::Logger& logger);
  ~AlertDispatcher();

  AlertDispatcher(const AlertDispatcher&) = delete;
  AlertDispatcher& operator=(const AlertDispatcher&) = delete;

  // Starts a worker for `sink`. Sinks added after Drain are rejected.
  bool AddSink(std::shared_ptr<IAlertSink> sink, std::string& error);

  // Dispatches the findings of `verdicts` for `event`. Returns the alerts
  // that passed deduplication, in finding order.
  std::vector<Alert> Dispatch(const telemetry::TelemetryEvent& event,
                              const std::vector<detection::AnomalyVerdict>& verdicts);

  // Dispatches a prebuilt alert (id and dedup key are assigned here). Returns
  // false when it was suppressed, or when the dispatcher is already drained
  // (counted as a processing error).
  bool DispatchAlert(Alert alert, Alert* dispatched = nullptr);

  // Suppresses future alerts for the key until `from_timestamp + seconds`.
  void Silence(const std::string& device_id, const std::string& alert_type,
               double from_timestamp, double seconds);

  // Alerts with timestamp >= since_timestamp, oldest first.
  std::vector<Alert> AlertsSince(double since_timestamp) const;
  std::size_t CountDeviceAlertsSince(const std::string& device_id, double since_timestamp) const;
  std::vector<Alert> DeviceAlertsSince(const std::string& device_id,
                                       double since_timestamp) const;

  // Stops accepting alerts and waits for sink queues up to `timeout` (shared
  // by all sinks). Returns the number of discarded deliveries.
  std::size_t Drain(std::chrono::milliseconds timeout);

  std::vector<std::string> SinkNames() const;

  std::size_t DedupEntries() const {
    return dedup_.Size();
  }

private:
  void OnDelivery(const DeliveryOutcome& outcome);

  const config::DispatchConfig dispatch_;
  const double dedup_window_seconds_;
  pipeline::ProcessorStats& stats_;
  core::logging::Logger& logger_;

  DedupCache dedup_;
  std::atomic<std::uint64_t> next_alert_seq_{1};

  mutable std::mutex log_mu_;
  std::deque<Alert> alert_log_;

  mutable std::mutex sinks_mu_;
  std::vector<std::unique_ptr<SinkWorker>> sinks_;
  bool drained_ = false;
};

} // namespace wellwatch::alerting

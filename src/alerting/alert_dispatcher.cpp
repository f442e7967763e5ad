#include "alerting/alert_dispatcher.hpp"

#include "core/errors/pipeline_error.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace wellwatch::alerting {
namespace {

const char* const kSinkDeliveryKind = core::errors::ToString(core::errors::ErrorKind::kSinkDelivery);

std::string FormatAlertId(std::uint64_t seq) {
  std::ostringstream out;
  out << "alert-" << std::setw(8) << std::setfill('0') << seq;
  return out.str();
}

} // namespace

AlertDispatcher::AlertDispatcher(config::DispatchConfig dispatch, double dedup_window_seconds,
                                 pipeline::ProcessorStats& stats,
                                 core::logging::Logger& logger)
    : dispatch_(std::move(dispatch)),
      dedup_window_seconds_(dedup_window_seconds),
      stats_(stats),
      logger_(logger),
      dedup_(dedup_window_seconds) {}

AlertDispatcher::~AlertDispatcher() {
  Drain(std::chrono::milliseconds(dispatch_.drain_timeout_ms));
}

bool AlertDispatcher::AddSink(std::shared_ptr<IAlertSink> sink, std::string& error) {
  if (sink == nullptr) {
    error = "alert sink cannot be null";
    return false;
  }
  std::lock_guard<std::mutex> lock(sinks_mu_);
  if (drained_) {
    error = "alert dispatcher is drained; cannot add sink '" + sink->Name() + "'";
    return false;
  }
  const std::string name = sink->Name();
  const char* channel = ToString(sink->GetChannel());
  sinks_.push_back(std::make_unique<SinkWorker>(
      std::move(sink), dispatch_.sink_queue_capacity,
      std::chrono::milliseconds(dispatch_.sink_timeout_ms),
      [this](const DeliveryOutcome& outcome) { OnDelivery(outcome); }));
  logger_.Info("alert sink registered", {{"sink", name}, {"channel", channel}});
  return true;
}

std::vector<Alert> AlertDispatcher::Dispatch(
    const telemetry::TelemetryEvent& event,
    const std::vector<detection::AnomalyVerdict>& verdicts) {
  std::vector<Alert> dispatched;
  for (const detection::AnomalyVerdict& verdict : verdicts) {
    for (const detection::Finding& finding : verdict.findings) {
      Alert alert;
      alert.device_id = event.device_id;
      alert.alert_type = finding.alert_type;
      alert.severity = finding.severity;
      alert.timestamp = event.timestamp;
      alert.message = finding.message;
      alert.source = detection::ToString(verdict.method);
      alert.payload = finding.details;
      alert.payload["status"] = event.status;

      Alert accepted;
      if (DispatchAlert(std::move(alert), &accepted)) {
        dispatched.push_back(std::move(accepted));
      }
    }
  }
  return dispatched;
}

bool AlertDispatcher::DispatchAlert(Alert alert, Alert* dispatched) {
  {
    std::lock_guard<std::mutex> lock(sinks_mu_);
    if (drained_) {
      stats_.RecordProcessingError();
      logger_.Warn("alert refused: dispatcher is drained",
                   {{"device_id", alert.device_id},
                    {"alert_type", alert.alert_type},
                    {"error_kind", kSinkDeliveryKind}});
      return false;
    }
  }
  alert.dedup_key =
      MakeDedupKey(alert.device_id, alert.alert_type, alert.timestamp, dedup_window_seconds_);
  if (!dedup_.Admit(alert.device_id, alert.alert_type, alert.timestamp)) {
    stats_.RecordAlertSuppressed();
    logger_.Debug("alert suppressed as duplicate",
                  {{"device_id", alert.device_id}, {"alert_type", alert.alert_type},
                   {"dedup_key", alert.dedup_key}});
    return false;
  }

  alert.id = FormatAlertId(next_alert_seq_.fetch_add(1, std::memory_order_relaxed));
  stats_.RecordAlertGenerated();
  logger_.Info("alert dispatched", {{"alert_id", alert.id},
                                    {"device_id", alert.device_id},
                                    {"alert_type", alert.alert_type},
                                    {"severity", detection::ToString(alert.severity)}});

  {
    std::lock_guard<std::mutex> lock(log_mu_);
    alert_log_.push_back(alert);
    while (alert_log_.size() > dispatch_.alert_log_capacity) {
      alert_log_.pop_front();
    }
  }

  {
    std::lock_guard<std::mutex> lock(sinks_mu_);
    for (const auto& worker : sinks_) {
      if (!worker->Enqueue(alert)) {
        stats_.RecordProcessingError();
        logger_.Warn("alert dropped: sink queue unavailable",
                     {{"sink", worker->SinkName()},
                      {"alert_id", alert.id},
                      {"error_kind", kSinkDeliveryKind}});
      }
    }
  }

  if (dispatched != nullptr) {
    *dispatched = std::move(alert);
  }
  return true;
}

void AlertDispatcher::Silence(const std::string& device_id, const std::string& alert_type,
                              double from_timestamp, double seconds) {
  dedup_.Silence(device_id, alert_type, from_timestamp + std::max(0.0, seconds));
  logger_.Info("alert key silenced", {{"device_id", device_id}, {"alert_type", alert_type}});
}

std::vector<Alert> AlertDispatcher::AlertsSince(double since_timestamp) const {
  std::lock_guard<std::mutex> lock(log_mu_);
  std::vector<Alert> out;
  for (const Alert& alert : alert_log_) {
    if (alert.timestamp >= since_timestamp) {
      out.push_back(alert);
    }
  }
  return out;
}

std::size_t AlertDispatcher::CountDeviceAlertsSince(const std::string& device_id,
                                                    double since_timestamp) const {
  std::lock_guard<std::mutex> lock(log_mu_);
  return static_cast<std::size_t>(
      std::count_if(alert_log_.begin(), alert_log_.end(), [&](const Alert& alert) {
        return alert.device_id == device_id && alert.timestamp >= since_timestamp;
      }));
}

std::vector<Alert> AlertDispatcher::DeviceAlertsSince(const std::string& device_id,
                                                      double since_timestamp) const {
  std::lock_guard<std::mutex> lock(log_mu_);
  std::vector<Alert> out;
  for (const Alert& alert : alert_log_) {
    if (alert.device_id == device_id && alert.timestamp >= since_timestamp) {
      out.push_back(alert);
    }
  }
  return out;
}

std::size_t AlertDispatcher::Drain(std::chrono::milliseconds timeout) {
  std::vector<std::unique_ptr<SinkWorker>> workers;
  {
    std::lock_guard<std::mutex> lock(sinks_mu_);
    if (drained_) {
      return 0;
    }
    drained_ = true;
    workers = std::move(sinks_);
    sinks_.clear();
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::size_t discarded = 0;
  for (const auto& worker : workers) {
    const auto remaining = std::max(std::chrono::milliseconds(0),
                                    std::chrono::duration_cast<std::chrono::milliseconds>(
                                        deadline - std::chrono::steady_clock::now()));
    const std::size_t dropped = worker->Drain(remaining);
    if (dropped > 0U) {
      logger_.Warn("sink drain deadline passed; queued alerts discarded",
                   {{"sink", worker->SinkName()},
                    {"discarded", std::to_string(dropped)},
                    {"error_kind", kSinkDeliveryKind}});
      for (std::size_t i = 0; i < dropped; ++i) {
        stats_.RecordProcessingError();
      }
    }
    discarded += dropped;
  }
  return discarded;
}

std::vector<std::string> AlertDispatcher::SinkNames() const {
  std::lock_guard<std::mutex> lock(sinks_mu_);
  std::vector<std::string> names;
  for (const auto& worker : sinks_) {
    names.push_back(worker->SinkName());
  }
  return names;
}

void AlertDispatcher::OnDelivery(const DeliveryOutcome& outcome) {
  if (outcome.delivered) {
    stats_.RecordSinkDelivery();
    logger_.Debug("alert delivered", {{"sink", outcome.sink}, {"alert_id", outcome.alert_id}});
    return;
  }
  stats_.RecordProcessingError();
  logger_.Warn("alert delivery failed", {{"sink", outcome.sink},
                                         {"alert_id", outcome.alert_id},
                                         {"error", outcome.error},
                                         {"error_kind", kSinkDeliveryKind},
                                         {"elapsed_ms", std::to_string(outcome.elapsed.count())}});
}

} // namespace wellwatch::alerting

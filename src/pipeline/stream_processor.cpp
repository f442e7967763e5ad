#include "pipeline/stream_processor.hpp"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <utility>
#include <vector>

namespace wellwatch::pipeline {
namespace {

// Holds one slot of the in-flight ingest count for the duration of a call.
class InFlightScope {
public:
  InFlightScope(std::mutex& mu, std::condition_variable& cv, std::size_t& count)
      : mu_(mu), cv_(cv), count_(count) {}

  ~InFlightScope() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      --count_;
    }
    cv_.notify_all();
  }

  InFlightScope(const InFlightScope&) = delete;
  InFlightScope& operator=(const InFlightScope&) = delete;

private:
  std::mutex& mu_;
  std::condition_variable& cv_;
  std::size_t& count_;
};

} // namespace

StreamProcessor::StreamProcessor(config::PipelineConfig config, core::logging::Logger& logger,
                                 std::shared_ptr<const model::IAnomalyScorer> scorer)
    : StreamProcessor(config, logger, detection::BuildDefaultChain(config, std::move(scorer))) {}

StreamProcessor::StreamProcessor(config::PipelineConfig config, core::logging::Logger& logger,
                                 std::vector<std::unique_ptr<detection::IDetector>> detectors)
    : config_(std::move(config)),
      logger_(logger),
      store_(config_.buffer_capacity_per_device),
      ensemble_(std::move(detectors), detection::VoteSettingsFromConfig(config_)),
      health_(config_.health_thresholds),
      trend_(config_.trend),
      dispatcher_(config_.dispatch, config_.dedup_window_seconds, stats_, logger),
      required_history_(detection::RequiredHistory(config_)) {
  std::vector<config::ConfigIssue> issues;
  config_valid_ = config::ValidatePipelineConfig(config_, issues);
  for (const config::ConfigIssue& issue : issues) {
    logger_.Error("pipeline config rejected",
                  {{"path", issue.path},
                   {"error", issue.message},
                   {"error_kind", core::errors::ToString(core::errors::ErrorKind::kConfig)}});
  }

  if (config_.workers.count > 0U) {
    executor_ = std::make_unique<ShardedExecutor>(config_.workers.count,
                                                  config_.workers.queue_capacity);
  }

  std::string detectors_list;
  for (const std::string& name : ensemble_.DetectorNames()) {
    detectors_list += detectors_list.empty() ? name : "," + name;
  }
  logger_.Info("stream processor started",
               {{"detectors", detectors_list},
                {"workers", std::to_string(config_.workers.count)},
                {"window_size", std::to_string(config_.window_size)},
                {"capacity_per_device", std::to_string(config_.buffer_capacity_per_device)}});
}

StreamProcessor::~StreamProcessor() {
  Drain();
}

bool StreamProcessor::AddSink(std::shared_ptr<alerting::IAlertSink> sink, std::string& error) {
  return dispatcher_.AddSink(std::move(sink), error);
}

bool StreamProcessor::Ingest(const telemetry::TelemetryEvent& event, IngestResult& result,
                             core::errors::PipelineError& error) {
  result = IngestResult{};
  error.Clear();

  {
    std::lock_guard<std::mutex> lock(ingest_mu_);
    if (!accepting_) {
      stats_.RecordEventRejected();
      return error.Set(core::errors::ErrorKind::kShuttingDown,
                       "stream processor is draining; event rejected");
    }
    ++in_flight_;
  }
  const InFlightScope in_flight(ingest_mu_, ingest_cv_, in_flight_);

  if (!config_valid_) {
    stats_.RecordEventRejected();
    return error.Set(core::errors::ErrorKind::kConfig,
                     "stream processor config is invalid; event rejected");
  }

  std::string validation_error;
  if (!telemetry::ValidateEvent(event, validation_error)) {
    stats_.RecordEventRejected();
    logger_.Warn("telemetry event rejected",
                 {{"device_id", event.device_id},
                  {"error", validation_error},
                  {"error_kind", core::errors::ToString(core::errors::ErrorKind::kInvalidEvent)}});
    return error.Set(core::errors::ErrorKind::kInvalidEvent, validation_error);
  }

  if (executor_ == nullptr) {
    Process(event, result);
    return true;
  }

  const bool submitted = executor_->Submit(event.device_id, [this, event] {
    IngestResult discarded;
    try {
      Process(event, discarded);
    } catch (const std::exception& ex) {
      stats_.RecordProcessingError();
      logger_.Error("pipeline worker failed",
                    {{"device_id", event.device_id},
                     {"error", ex.what()},
                     {"error_kind", core::errors::ToString(
                                        core::errors::ErrorKind::kProcessorExecution)}});
    }
  });
  if (!submitted) {
    stats_.RecordEventRejected();
    return error.Set(core::errors::ErrorKind::kShuttingDown,
                     "stream processor is draining; event rejected");
  }
  result.queued = true;
  return true;
}

void StreamProcessor::Process(const telemetry::TelemetryEvent& event, IngestResult& result) {
  const std::shared_ptr<history::DeviceHistory> history = store_.GetOrCreate(event.device_id);
  const auto writer = history->AcquireWriterLock();

  const std::vector<telemetry::TelemetryEvent> preceding = history->Recent(required_history_);
  history->Append(event);
  AdvanceWatermark(event.timestamp);

  detection::DetectionReport report = ensemble_.Evaluate(event, preceding);
  for (const detection::DetectorFailure& failure : report.failures) {
    stats_.RecordProcessingError();
    logger_.Warn("detector failed",
                 {{"device_id", event.device_id},
                  {"detector", failure.detector},
                  {"error", failure.message},
                  {"error_kind",
                   core::errors::ToString(core::errors::ErrorKind::kProcessorExecution)}});
  }

  const detection::AnomalyVerdict* ensemble = report.Ensemble();
  if (ensemble != nullptr && ensemble->method == detection::DetectionMethod::kInsufficientData) {
    logger_.Debug("insufficient history for ensemble vote",
                  {{"device_id", event.device_id},
                   {"history_points", std::to_string(preceding.size())},
                   {"error_kind",
                    core::errors::ToString(core::errors::ErrorKind::kInsufficientData)}});
  }

  result.alerts = dispatcher_.Dispatch(event, report.verdicts);
  result.verdicts = std::move(report.verdicts);
  stats_.RecordEventProcessed();
}

health::DeviceHealth StreamProcessor::GetDeviceHealth(const std::string& device_id) const {
  const std::shared_ptr<history::DeviceHistory> history = store_.Find(device_id);
  if (history == nullptr) {
    return health_.Score(device_id, {}, 0U);
  }
  const std::vector<telemetry::TelemetryEvent> recent =
      history->Recent(config_.health_thresholds.history_points);
  const std::size_t alerts = dispatcher_.CountDeviceAlertsSince(
      device_id, WatermarkOrZero() - config_.health_thresholds.alert_lookback_seconds);
  return health_.Score(device_id, recent, alerts);
}

std::vector<alerting::Alert> StreamProcessor::GetRecentAlerts(double window_seconds) const {
  if (!Watermark().has_value()) {
    return {};
  }
  return dispatcher_.AlertsSince(WatermarkOrZero() - window_seconds);
}

std::vector<alerting::Alert> StreamProcessor::GetDeviceAlerts(const std::string& device_id,
                                                              double window_seconds) const {
  if (!Watermark().has_value()) {
    return {};
  }
  return dispatcher_.DeviceAlertsSince(device_id, WatermarkOrZero() - window_seconds);
}

ProcessorStatsSnapshot StreamProcessor::GetProcessorStats() const {
  return stats_.Snapshot();
}

trend::TrendReport StreamProcessor::AnalyzeTrend(const std::string& device_id,
                                                 telemetry::Metric metric) const {
  return trend_.Analyze(device_id, DeviceEvents(device_id), metric);
}

void StreamProcessor::Silence(const std::string& device_id, const std::string& alert_type,
                              double seconds) {
  dispatcher_.Silence(device_id, alert_type, WatermarkOrZero(), seconds);
}

void StreamProcessor::Drain() {
  if (drained_.exchange(true)) {
    return;
  }
  {
    std::unique_lock<std::mutex> lock(ingest_mu_);
    accepting_ = false;
    ingest_cv_.wait(lock, [this] { return in_flight_ == 0U; });
  }
  if (executor_ != nullptr) {
    executor_->Drain();
  }
  const std::size_t discarded =
      dispatcher_.Drain(std::chrono::milliseconds(config_.dispatch.drain_timeout_ms));

  const ProcessorStatsSnapshot stats = stats_.Snapshot();
  logger_.Info("stream processor drained",
               {{"events_processed", std::to_string(stats.events_processed)},
                {"alerts_generated", std::to_string(stats.alerts_generated)},
                {"processing_errors", std::to_string(stats.processing_errors)},
                {"discarded_deliveries", std::to_string(discarded)}});
}

std::vector<std::string> StreamProcessor::DeviceIds() const {
  return store_.DeviceIds();
}

std::vector<telemetry::TelemetryEvent> StreamProcessor::DeviceEvents(
    const std::string& device_id) const {
  const std::shared_ptr<history::DeviceHistory> history = store_.Find(device_id);
  if (history == nullptr) {
    return {};
  }
  return history->Snapshot();
}

std::optional<double> StreamProcessor::Watermark() const {
  const double value = watermark_.load();
  if (value < 0.0) {
    return std::nullopt;
  }
  return value;
}

void StreamProcessor::AdvanceWatermark(double timestamp) {
  double current = watermark_.load();
  while (current < timestamp && !watermark_.compare_exchange_weak(current, timestamp)) {
  }
}

double StreamProcessor::WatermarkOrZero() const {
  const double value = watermark_.load();
  return value < 0.0 ? 0.0 : value;
}

} // namespace wellwatch::pipeline

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace wellwatch::pipeline {

struct ProcessorStatsSnapshot {
  std::uint64_t events_processed = 0;
  std::uint64_t events_rejected = 0;
  std::uint64_t alerts_generated = 0;
  std::uint64_t alerts_suppressed = 0;
  std::uint64_t processing_errors = 0;
  std::uint64_t sink_deliveries = 0;
  // Wall-clock time of the last processed event; empty before the first one.
  std::optional<std::chrono::system_clock::time_point> last_processed;
};

// Process-lifetime counters shared by pipeline workers and sink workers.
// Every counter only ever increases.
class ProcessorStats {
public:
  ProcessorStats() = default;

  ProcessorStats(const ProcessorStats&) = delete;
  ProcessorStats& operator=(const ProcessorStats&) = delete;

  void RecordEventProcessed();
  void RecordEventRejected() {
    events_rejected_.fetch_add(1, std::memory_order_relaxed);
  }
  void RecordAlertGenerated() {
    alerts_generated_.fetch_add(1, std::memory_order_relaxed);
  }
  void RecordAlertSuppressed() {
    alerts_suppressed_.fetch_add(1, std::memory_order_relaxed);
  }
  void RecordProcessingError() {
    processing_errors_.fetch_add(1, std::memory_order_relaxed);
  }
  void RecordSinkDelivery() {
    sink_deliveries_.fetch_add(1, std::memory_order_relaxed);
  }

  ProcessorStatsSnapshot Snapshot() const;

private:
  std::atomic<std::uint64_t> events_processed_{0};
  std::atomic<std::uint64_t> events_rejected_{0};
  std::atomic<std::uint64_t> alerts_generated_{0};
  std::atomic<std::uint64_t> alerts_suppressed_{0};
  std::atomic<std::uint64_t> processing_errors_{0};
  std::atomic<std::uint64_t> sink_deliveries_{0};
  // Milliseconds since epoch; -1 until the first event.
  std::atomic<std::int64_t> last_processed_ms_{-1};
};

std::string ToJson(const ProcessorStatsSnapshot& stats);

} // namespace wellwatch::pipeline

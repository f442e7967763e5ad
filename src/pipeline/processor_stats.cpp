#include "pipeline/processor_stats.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace wellwatch::pipeline {

void ProcessorStats::RecordEventProcessed() {
  events_processed_.fetch_add(1, std::memory_order_relaxed);
  const std::int64_t now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::system_clock::now().time_since_epoch())
                                  .count();
  // Keep last_processed monotonic when workers race.
  std::int64_t current = last_processed_ms_.load(std::memory_order_relaxed);
  while (current < now_ms &&
         !last_processed_ms_.compare_exchange_weak(current, now_ms, std::memory_order_relaxed)) {
  }
}

ProcessorStatsSnapshot ProcessorStats::Snapshot() const {
  ProcessorStatsSnapshot snapshot;
  snapshot.events_processed = events_processed_.load(std::memory_order_relaxed);
  snapshot.events_rejected = events_rejected_.load(std::memory_order_relaxed);
  snapshot.alerts_generated = alerts_generated_.load(std::memory_order_relaxed);
  snapshot.alerts_suppressed = alerts_suppressed_.load(std::memory_order_relaxed);
  snapshot.processing_errors = processing_errors_.load(std::memory_order_relaxed);
  snapshot.sink_deliveries = sink_deliveries_.load(std::memory_order_relaxed);
  const std::int64_t last_ms = last_processed_ms_.load(std::memory_order_relaxed);
  if (last_ms >= 0) {
    snapshot.last_processed =
        std::chrono::system_clock::time_point(std::chrono::milliseconds(last_ms));
  }
  return snapshot;
}

std::string ToJson(const ProcessorStatsSnapshot& stats) {
  std::ostringstream out;
  out << "{\"events_processed\":" << stats.events_processed
      << ",\"events_rejected\":" << stats.events_rejected
      << ",\"alerts_generated\":" << stats.alerts_generated
      << ",\"alerts_suppressed\":" << stats.alerts_suppressed
      << ",\"processing_errors\":" << stats.processing_errors
      << ",\"sink_deliveries\":" << stats.sink_deliveries << ",\"last_processed\":"
      << (stats.last_processed.has_value()
              ? core::QuoteJson(core::FormatUtcTimestamp(*stats.last_processed))
              : std::string("null"))
      << "}";
  return out.str();
}

} // namespace wellwatch::pipeline

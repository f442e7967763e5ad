#pragma once

#include "history/ring_buffer.hpp"
#include "telemetry/telemetry_event.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wellwatch::history {

// Bounded, arrival-ordered event window for one device.
//
// Locking model:
// - `data_mu_` guards the ring buffer. Every read copies out under the lock, so
//   readers always see a consistent snapshot while a writer appends.
// - the writer lock (`AcquireWriterLock`) is held by the pipeline for the whole
//   append + detect + dispatch sequence of one event. It serializes pipeline
//   executions for the device without blocking readers.
class DeviceHistory {
public:
  DeviceHistory(std::string device_id, std::size_t capacity);

  DeviceHistory(const DeviceHistory&) = delete;
  DeviceHistory& operator=(const DeviceHistory&) = delete;

  const std::string& device_id() const {
    return device_id_;
  }

  std::size_t capacity() const {
    return capacity_;
  }

  // Appends in O(1); evicts the oldest event when at capacity.
  void Append(const telemetry::TelemetryEvent& event);

  // Last `count` events in chronological (arrival) order.
  std::vector<telemetry::TelemetryEvent> Recent(std::size_t count) const;

  // Events with timestamp >= newest_timestamp - seconds. "Now" is the newest
  // event held for this device.
  std::vector<telemetry::TelemetryEvent> Window(double seconds) const;

  std::vector<telemetry::TelemetryEvent> Snapshot() const;

  std::optional<telemetry::TelemetryEvent> Latest() const;

  std::size_t Size() const;

  struct Counters {
    std::uint64_t appended = 0;
    std::uint64_t evicted = 0;
  };

  Counters GetCounters() const;

  [[nodiscard]] std::unique_lock<std::mutex> AcquireWriterLock();

private:
  const std::string device_id_;
  const std::size_t capacity_;

  mutable std::mutex data_mu_;
  RingBuffer<telemetry::TelemetryEvent> events_;
  std::uint64_t appended_ = 0;
  std::uint64_t evicted_ = 0;

  std::mutex writer_mu_;
};

} // namespace wellwatch::history

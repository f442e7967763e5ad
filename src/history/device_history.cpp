#include "history/device_history.hpp"

namespace wellwatch::history {

DeviceHistory::DeviceHistory(std::string device_id, const std::size_t capacity)
    : device_id_(std::move(device_id)), capacity_(capacity == 0U ? 1U : capacity),
      events_(capacity_) {}

void DeviceHistory::Append(const telemetry::TelemetryEvent& event) {
  std::lock_guard<std::mutex> lock(data_mu_);
  if (events_.Push(event)) {
    ++evicted_;
  }
  ++appended_;
}

std::vector<telemetry::TelemetryEvent> DeviceHistory::Recent(const std::size_t count) const {
  std::vector<telemetry::TelemetryEvent> out;
  std::lock_guard<std::mutex> lock(data_mu_);
  events_.CopyNewest(count, out);
  return out;
}

std::vector<telemetry::TelemetryEvent> DeviceHistory::Window(const double seconds) const {
  std::vector<telemetry::TelemetryEvent> out;
  std::lock_guard<std::mutex> lock(data_mu_);
  if (events_.Empty()) {
    return out;
  }

  const double cutoff = events_.Back().timestamp - seconds;
  for (std::size_t i = 0; i < events_.Size(); ++i) {
    const auto& event = events_.At(i);
    if (event.timestamp >= cutoff) {
      out.push_back(event);
    }
  }
  return out;
}

std::vector<telemetry::TelemetryEvent> DeviceHistory::Snapshot() const {
  std::vector<telemetry::TelemetryEvent> out;
  std::lock_guard<std::mutex> lock(data_mu_);
  events_.CopyNewest(events_.Size(), out);
  return out;
}

std::optional<telemetry::TelemetryEvent> DeviceHistory::Latest() const {
  std::lock_guard<std::mutex> lock(data_mu_);
  if (events_.Empty()) {
    return std::nullopt;
  }
  return events_.Back();
}

std::size_t DeviceHistory::Size() const {
  std::lock_guard<std::mutex> lock(data_mu_);
  return events_.Size();
}

DeviceHistory::Counters DeviceHistory::GetCounters() const {
  std::lock_guard<std::mutex> lock(data_mu_);
  return Counters{
      .appended = appended_,
      .evicted = evicted_,
  };
}

std::unique_lock<std::mutex> DeviceHistory::AcquireWriterLock() {
  return std::unique_lock<std::mutex>(writer_mu_);
}

} // namespace wellwatch::history

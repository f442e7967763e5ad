#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace wellwatch::alerting {

// Shared (device_id, alert_type) suppression state.
//
// - `Admit` returns true and records `timestamp` when no alert for the key was
//   admitted within the last `window_seconds` and the key is not silenced.
//   Suppressed calls do not move the window.
// - `Silence` blocks the key until `until_timestamp`; already admitted alerts
//   are unaffected.
// - entries whose window and silence both lie behind the device's newest
//   timestamp are evicted, so the cache stays bounded by the active keys.
//   Device clocks are compared only with themselves.
class DedupCache {
public:
  explicit DedupCache(double window_seconds);

  DedupCache(const DedupCache&) = delete;
  DedupCache& operator=(const DedupCache&) = delete;

  bool Admit(const std::string& device_id, const std::string& alert_type, double timestamp);

  void Silence(const std::string& device_id, const std::string& alert_type,
               double until_timestamp);

  std::size_t Size() const;

  double window_seconds() const {
    return window_seconds_;
  }

private:
  using Key = std::pair<std::string, std::string>;

  struct Entry {
    bool has_admitted = false;
    double last_admitted = 0.0;
    double silenced_until = 0.0;
  };

  void EvictExpiredLocked();

  const double window_seconds_;

  mutable std::mutex mu_;
  std::map<Key, Entry> entries_;
  std::map<std::string, double> device_newest_;
  std::uint64_t admits_since_eviction_ = 0;
};

} // namespace wellwatch::alerting

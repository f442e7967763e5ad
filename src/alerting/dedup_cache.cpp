#include "alerting/dedup_cache.hpp"

#include <algorithm>

namespace wellwatch::alerting {
namespace {

constexpr std::uint64_t kEvictionInterval = 256;

} // namespace

DedupCache::DedupCache(double window_seconds) : window_seconds_(std::max(0.0, window_seconds)) {}

bool DedupCache::Admit(const std::string& device_id, const std::string& alert_type,
                       double timestamp) {
  std::lock_guard<std::mutex> lock(mu_);
  auto [newest, inserted] = device_newest_.try_emplace(device_id, timestamp);
  if (!inserted) {
    newest->second = std::max(newest->second, timestamp);
  }
  if (++admits_since_eviction_ >= kEvictionInterval) {
    EvictExpiredLocked();
  }

  Entry& entry = entries_[Key(device_id, alert_type)];
  if (timestamp < entry.silenced_until) {
    return false;
  }
  if (entry.has_admitted && timestamp - entry.last_admitted < window_seconds_) {
    return false;
  }
  entry.has_admitted = true;
  entry.last_admitted = timestamp;
  return true;
}

void DedupCache::Silence(const std::string& device_id, const std::string& alert_type,
                         double until_timestamp) {
  std::lock_guard<std::mutex> lock(mu_);
  Entry& entry = entries_[Key(device_id, alert_type)];
  entry.silenced_until = std::max(entry.silenced_until, until_timestamp);
}

std::size_t DedupCache::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

void DedupCache::EvictExpiredLocked() {
  admits_since_eviction_ = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    const Entry& entry = it->second;
    const auto newest_it = device_newest_.find(it->first.first);
    if (newest_it == device_newest_.end()) {
      ++it;
      continue;
    }
    const double newest = newest_it->second;
    const bool window_open = entry.has_admitted && newest - entry.last_admitted < window_seconds_;
    const bool silenced = newest < entry.silenced_until;
    if (!window_open && !silenced) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace wellwatch::alerting

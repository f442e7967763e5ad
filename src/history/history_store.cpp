#include "history/history_store.hpp"

namespace wellwatch::history {

HistoryStore::HistoryStore(const std::size_t capacity_per_device)
    : capacity_per_device_(capacity_per_device) {}

std::shared_ptr<DeviceHistory> HistoryStore::GetOrCreate(const std::string& device_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) {
    it = devices_
             .emplace(device_id, std::make_shared<DeviceHistory>(device_id, capacity_per_device_))
             .first;
  }
  return it->second;
}

std::shared_ptr<DeviceHistory> HistoryStore::Find(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = devices_.find(device_id);
  return it == devices_.end() ? nullptr : it->second;
}

std::vector<std::string> HistoryStore::DeviceIds() const {
  std::vector<std::string> ids;
  std::lock_guard<std::mutex> lock(mu_);
  ids.reserve(devices_.size());
  for (const auto& [device_id, history] : devices_) {
    ids.push_back(device_id);
  }
  return ids;
}

std::size_t HistoryStore::DeviceCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return devices_.size();
}

} // namespace wellwatch::history

#pragma once

#include "history/device_history.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace wellwatch::history {

// Owns one DeviceHistory per device id. Histories are created on first ingest
// and live for the lifetime of the store.
class HistoryStore {
public:
  explicit HistoryStore(std::size_t capacity_per_device);

  HistoryStore(const HistoryStore&) = delete;
  HistoryStore& operator=(const HistoryStore&) = delete;

  std::shared_ptr<DeviceHistory> GetOrCreate(const std::string& device_id);

  // nullptr when the device has never been seen.
  std::shared_ptr<DeviceHistory> Find(const std::string& device_id) const;

  // Sorted device ids.
  std::vector<std::string> DeviceIds() const;

  std::size_t DeviceCount() const;

  std::size_t capacity_per_device() const {
    return capacity_per_device_;
  }

private:
  const std::size_t capacity_per_device_;
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<DeviceHistory>> devices_;
};

} // namespace wellwatch::history

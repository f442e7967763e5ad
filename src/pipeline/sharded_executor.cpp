#include "pipeline/sharded_executor.hpp"

#include <algorithm>
#include <utility>

namespace wellwatch::pipeline {

ShardedExecutor::ShardedExecutor(std::size_t workers, std::size_t queue_capacity)
    : queue_capacity_(std::max<std::size_t>(queue_capacity, 1U)) {
  const std::size_t count = std::max<std::size_t>(workers, 1U);
  shards_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
  for (auto& shard : shards_) {
    Shard* raw = shard.get();
    raw->thread = std::thread([this, raw] { RunShard(*raw); });
  }
}

ShardedExecutor::~ShardedExecutor() {
  Drain();
}

std::size_t ShardedExecutor::ShardFor(const std::string& shard_key) const {
  return std::hash<std::string>{}(shard_key) % shards_.size();
}

bool ShardedExecutor::Submit(const std::string& shard_key, Task task) {
  Shard& shard = *shards_[ShardFor(shard_key)];
  {
    std::unique_lock<std::mutex> lock(shard.mu);
    shard.cv.wait(lock, [&] { return shard.stopping || shard.queue.size() < queue_capacity_; });
    if (shard.stopping) {
      return false;
    }
    shard.queue.push_back(std::move(task));
  }
  shard.cv.notify_all();
  return true;
}

void ShardedExecutor::Drain() {
  std::lock_guard<std::mutex> drain_lock(drain_mu_);
  if (drained_) {
    return;
  }
  drained_ = true;

  for (auto& shard : shards_) {
    {
      std::lock_guard<std::mutex> lock(shard->mu);
      shard->stopping = true;
    }
    shard->cv.notify_all();
  }
  for (auto& shard : shards_) {
    if (shard->thread.joinable()) {
      shard->thread.join();
    }
  }
}

void ShardedExecutor::RunShard(Shard& shard) {
  for (;;) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(shard.mu);
      shard.cv.wait(lock, [&] { return shard.stopping || !shard.queue.empty(); });
      if (shard.queue.empty()) {
        return;
      }
      task = std::move(shard.queue.front());
      shard.queue.pop_front();
    }
    // Wake a producer blocked on a full queue.
    shard.cv.notify_all();
    task();
  }
}

} // namespace wellwatch::pipeline

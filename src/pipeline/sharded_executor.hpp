#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace wellwatch::pipeline {

// Fixed pool of workers, each with its own bounded FIFO. Tasks with the same
// shard key always land on the same worker, so they run one at a time and in
// submission order.
//
// - `Submit` blocks while the target queue is full (backpressure) and returns
//   false once `Drain` has started.
// - `Drain` stops accepting, lets every queued task finish and joins the
//   workers. It is idempotent.
class ShardedExecutor {
public:
  using Task = std::function<void()>;

  ShardedExecutor(std::size_t workers, std::size_t queue_capacity);
  ~ShardedExecutor();

  ShardedExecutor(const ShardedExecutor&) = delete;
  ShardedExecutor& operator=(const ShardedExecutor&) = delete;

  bool Submit(const std::string& shard_key, Task task);

  void Drain();

  std::size_t WorkerCount() const {
    return shards_.size();
  }

  std::size_t ShardFor(const std::string& shard_key) const;

private:
  struct Shard {
    std::mutex mu;
    std::condition_variable cv;
    std::deque<Task> queue;
    bool stopping = false;
    std::thread thread;
  };

  void RunShard(Shard& shard);

  const std::size_t queue_capacity_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::mutex drain_mu_;
  bool drained_ = false;
};

} // namespace wellwatch::pipeline

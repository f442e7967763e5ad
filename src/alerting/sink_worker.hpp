#pragma once

#include "alerting/alert_sink.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace wellwatch::alerting {

struct DeliveryOutcome {
  std::string sink;
  std::string alert_id;
  bool delivered = false;
  std::string error;
  std::chrono::milliseconds elapsed{0};
};

using DeliveryObserver = std::function<void(const DeliveryOutcome&)>;

// Owns one sink, a bounded FIFO of pending alerts, the thread that drains it
// and a watchdog for the Send in flight. Enqueue never blocks; a full queue
// rejects the alert.
//
// Timeouts:
// - each Send gets a deadline of `send_timeout`. When it passes, the watchdog
//   reports the delivery as failed; whatever the Send returns later is
//   ignored.
//
// Shutdown:
// - `Drain` stops accepting, waits until the queue is empty and no Send is in
//   flight, then joins both threads.
// - if the deadline passes first, queued alerts and an unreported in-flight
//   alert are discarded and the worker is abandoned: its threads are detached
//   and keep only their own state alive. No observer call starts after Drain
//   returns.
class SinkWorker {
public:
  SinkWorker(std::shared_ptr<IAlertSink> sink, std::size_t queue_capacity,
             std::chrono::milliseconds send_timeout, DeliveryObserver observer);
  ~SinkWorker();

  SinkWorker(const SinkWorker&) = delete;
  SinkWorker& operator=(const SinkWorker&) = delete;

  // False when the queue is full or the worker is draining.
  bool Enqueue(const Alert& alert);

  // Returns the number of alerts discarded because the deadline passed,
  // counting an in-flight Send that was not already reported.
  std::size_t Drain(std::chrono::milliseconds timeout);

  std::string SinkName() const {
    return sink_name_;
  }

private:
  struct State;

  static void Run(std::shared_ptr<State> state);
  static void Watch(std::shared_ptr<State> state);

  std::string sink_name_;
  std::shared_ptr<State> state_;
  std::thread thread_;
  std::thread watchdog_;
};

} // namespace wellwatch::alerting

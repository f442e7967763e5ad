#include "alerting/sink_worker.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <utility>

namespace wellwatch::alerting {

struct SinkWorker::State {
  std::shared_ptr<IAlertSink> sink;
  std::string sink_name;
  std::size_t capacity = 0;
  std::chrono::milliseconds timeout{0};
  DeliveryObserver observer;

  std::mutex mu;
  std::condition_variable cv;
  std::deque<Alert> queue;
  bool busy = false;
  bool stopping = false;
  bool finished = false;
  bool abandoned = false;

  // In-flight Send. `send_seq` tells consecutive sends apart for the watchdog.
  std::uint64_t send_seq = 0;
  std::string in_flight_id;
  std::chrono::steady_clock::time_point started;
  std::chrono::steady_clock::time_point deadline;
  bool timed_out = false;
};

SinkWorker::SinkWorker(std::shared_ptr<IAlertSink> sink, std::size_t queue_capacity,
                       std::chrono::milliseconds send_timeout, DeliveryObserver observer)
    : sink_name_(sink->Name()), state_(std::make_shared<State>()) {
  state_->sink_name = sink_name_;
  state_->sink = std::move(sink);
  state_->capacity = queue_capacity;
  state_->timeout = send_timeout;
  state_->observer = std::move(observer);
  thread_ = std::thread(&SinkWorker::Run, state_);
  watchdog_ = std::thread(&SinkWorker::Watch, state_);
}

SinkWorker::~SinkWorker() {
  if (thread_.joinable()) {
    Drain(state_->timeout);
  }
}

bool SinkWorker::Enqueue(const Alert& alert) {
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (state_->stopping || state_->queue.size() >= state_->capacity) {
      return false;
    }
    state_->queue.push_back(alert);
  }
  state_->cv.notify_all();
  return true;
}

std::size_t SinkWorker::Drain(std::chrono::milliseconds timeout) {
  if (!thread_.joinable()) {
    return 0;
  }

  std::size_t discarded = 0;
  bool finished = false;
  {
    std::unique_lock<std::mutex> lock(state_->mu);
    state_->stopping = true;
    state_->cv.notify_all();
    finished = state_->cv.wait_for(lock, timeout, [this] {
      return state_->queue.empty() && !state_->busy;
    });
    if (!finished) {
      discarded = state_->queue.size();
      if (state_->busy && !state_->timed_out) {
        ++discarded;
      }
      state_->queue.clear();
      state_->abandoned = true;
      state_->cv.notify_all();
    }
  }

  if (finished) {
    thread_.join();
    watchdog_.join();
  } else {
    thread_.detach();
    watchdog_.detach();
  }
  return discarded;
}

void SinkWorker::Run(std::shared_ptr<State> state) {
  for (;;) {
    Alert alert;
    {
      std::unique_lock<std::mutex> lock(state->mu);
      state->cv.wait(lock, [&state] { return state->stopping || !state->queue.empty(); });
      if (state->queue.empty() || state->abandoned) {
        state->finished = true;
        state->cv.notify_all();
        return;
      }
      alert = std::move(state->queue.front());
      state->queue.pop_front();
      state->busy = true;
      ++state->send_seq;
      state->in_flight_id = alert.id;
      state->started = std::chrono::steady_clock::now();
      state->deadline = state->started + state->timeout;
      state->timed_out = false;
    }
    state->cv.notify_all();

    DeliveryOutcome outcome;
    outcome.sink = state->sink_name;
    outcome.alert_id = alert.id;
    const auto started = std::chrono::steady_clock::now();
    try {
      outcome.delivered = state->sink->Send(alert, state->timeout, outcome.error);
    } catch (const std::exception& ex) {
      outcome.delivered = false;
      outcome.error = std::string("sink threw: ") + ex.what();
    }
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (outcome.delivered && outcome.elapsed > state->timeout) {
      outcome.delivered = false;
      outcome.error = "send exceeded timeout of " + std::to_string(state->timeout.count()) + " ms";
    }
    if (!outcome.delivered && outcome.error.empty()) {
      outcome.error = "sink reported failure";
    }

    std::lock_guard<std::mutex> lock(state->mu);
    // A timed-out send was already reported by the watchdog.
    if (!state->abandoned && !state->timed_out && state->observer) {
      state->observer(outcome);
    }
    state->busy = false;
    state->timed_out = false;
    state->cv.notify_all();
    if (state->abandoned) {
      state->finished = true;
      return;
    }
  }
}

void SinkWorker::Watch(std::shared_ptr<State> state) {
  std::unique_lock<std::mutex> lock(state->mu);
  for (;;) {
    if (state->finished || state->abandoned) {
      return;
    }
    if (!state->busy || state->timed_out) {
      state->cv.wait(lock);
      continue;
    }

    const std::uint64_t seq = state->send_seq;
    const auto deadline = state->deadline;
    const bool settled = state->cv.wait_until(lock, deadline, [&state, seq] {
      return state->finished || state->abandoned || !state->busy || state->send_seq != seq;
    });
    if (settled) {
      continue;
    }

    state->timed_out = true;
    DeliveryOutcome outcome;
    outcome.sink = state->sink_name;
    outcome.alert_id = state->in_flight_id;
    outcome.delivered = false;
    outcome.error = "send exceeded timeout of " + std::to_string(state->timeout.count()) + " ms";
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - state->started);
    if (state->observer) {
      state->observer(outcome);
    }
  }
}

} // namespace wellwatch::alerting

#pragma once

#include "alerting/alert.hpp"

#include <chrono>
#include <string>

namespace wellwatch::alerting {

// Outbound alert channel (websocket broadcast, email, SMS, file, log).
//
// Contract:
// - `Send` delivers one alert and returns false with `error` on failure.
// - `timeout` is the delivery budget; implementations should give up once it
//   is spent. A call that overruns it is counted as failed regardless of its
//   return value.
// - each sink is driven by exactly one worker thread, so `Send` is never
//   called concurrently on the same instance.
class IAlertSink {
public:
  virtual ~IAlertSink() = default;

  virtual std::string Name() const = 0;

  virtual Channel GetChannel() const = 0;

  virtual bool Send(const Alert& alert, std::chrono::milliseconds timeout,
                    std::string& error) = 0;
};

} // namespace wellwatch::alerting

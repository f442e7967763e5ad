#pragma once

#include "alerting/alert_sink.hpp"
#include "core/logging/logger.hpp"

#include <string>

namespace wellwatch::alerting {

// Writes one structured WARN record per alert through the shared logger.
class LogAlertSink final : public IAlertSink {
public:
  explicit LogAlertSink(core::logging::Logger& logger, std::string name = "log");

  std::string Name() const override {
    return name_;
  }

  Channel GetChannel() const override {
    return Channel::kLog;
  }

  bool Send(const Alert& alert, std::chrono::milliseconds timeout, std::string& error) override;

private:
  core::logging::Logger& logger_;
  std::string name_;
};

} // namespace wellwatch::alerting

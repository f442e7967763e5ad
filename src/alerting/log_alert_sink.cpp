#include "alerting/log_alert_sink.hpp"

#include "core/json_utils.hpp"

#include <utility>

namespace wellwatch::alerting {

LogAlertSink::LogAlertSink(core::logging::Logger& logger, std::string name)
    : logger_(logger), name_(std::move(name)) {}

bool LogAlertSink::Send(const Alert& alert, std::chrono::milliseconds /*timeout*/,
                        std::string& error) {
  error.clear();
  const std::string timestamp = core::FormatJsonNumber(alert.timestamp, 15);
  logger_.Warn("ALERT", {{"alert_id", alert.id},
                         {"device_id", alert.device_id},
                         {"alert_type", alert.alert_type},
                         {"severity", detection::ToString(alert.severity)},
                         {"event_ts", timestamp},
                         {"message", alert.message}});
  return true;
}

} // namespace wellwatch::alerting

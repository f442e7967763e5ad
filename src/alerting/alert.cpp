#include "alerting/alert.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <cmath>
#include <cstdint>
#include <sstream>

namespace wellwatch::alerting {

const char* ToString(Channel channel) {
  switch (channel) {
  case Channel::kBroadcast:
    return "broadcast";
  case Channel::kEmail:
    return "email";
  case Channel::kSms:
    return "sms";
  case Channel::kFile:
    return "file";
  case Channel::kLog:
    return "log";
  }
  return "unknown";
}

std::string MakeDedupKey(const std::string& device_id, const std::string& alert_type,
                         double timestamp, double dedup_window_seconds) {
  std::int64_t bucket = 0;
  if (dedup_window_seconds > 0.0) {
    bucket = static_cast<std::int64_t>(std::floor(timestamp / dedup_window_seconds));
  } else {
    bucket = static_cast<std::int64_t>(std::llround(timestamp * 1000.0));
  }
  return device_id + "|" + alert_type + "|" + std::to_string(bucket);
}

std::string ToJson(const Alert& alert) {
  std::ostringstream out;
  out << "{\"id\":" << core::QuoteJson(alert.id)
      << ",\"device_id\":" << core::QuoteJson(alert.device_id)
      << ",\"alert_type\":" << core::QuoteJson(alert.alert_type)
      << ",\"severity\":" << core::QuoteJson(detection::ToString(alert.severity))
      << ",\"timestamp\":" << core::FormatJsonNumber(alert.timestamp, 15)
      << ",\"timestamp_utc\":" << core::QuoteJson(core::FormatEpochSeconds(alert.timestamp))
      << ",\"message\":" << core::QuoteJson(alert.message)
      << ",\"source\":" << core::QuoteJson(alert.source)
      << ",\"dedup_key\":" << core::QuoteJson(alert.dedup_key) << ",\"payload\":{";
  bool first = true;
  for (const auto& [key, value] : alert.payload) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << core::QuoteJson(key) << ":" << core::QuoteJson(value);
  }
  out << "}}";
  return out.str();
}

} // namespace wellwatch::alerting

#pragma once

#include "detection/verdict.hpp"

#include <map>
#include <string>

namespace wellwatch::alerting {

using detection::Severity;

// Delivery channels a sink can serve.
enum class Channel {
  kBroadcast,
  kEmail,
  kSms,
  kFile,
  kLog,
};

const char* ToString(Channel channel);

// Immutable record of one dispatched alert.
//
// - `timestamp` is the triggering event's timestamp (data time).
// - `dedup_key` is `<device_id>|<alert_type>|<bucket>` where bucket is
//   floor(timestamp / dedup_window_seconds).
// - `source` names the verdict method that produced the finding.
struct Alert {
  std::string id;
  std::string device_id;
  std::string alert_type;
  Severity severity = Severity::kMedium;
  double timestamp = 0.0;
  std::string message;
  std::string source;
  std::map<std::string, std::string> payload;
  std::string dedup_key;

  bool operator==(const Alert& other) const = default;
};

std::string MakeDedupKey(const std::string& device_id, const std::string& alert_type,
                         double timestamp, double dedup_window_seconds);

std::string ToJson(const Alert& alert);

} // namespace wellwatch::alerting

#include "detection/verdict.hpp"

#include "core/json_utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace wellwatch::detection {

const char* ToString(Severity severity) {
  switch (severity) {
  case Severity::kLow:
    return "LOW";
  case Severity::kMedium:
    return "MEDIUM";
  case Severity::kHigh:
    return "HIGH";
  case Severity::kCritical:
    return "CRITICAL";
  }
  return "MEDIUM";
}

const char* ToString(DetectionMethod method) {
  switch (method) {
  case DetectionMethod::kStatistical:
    return "statistical";
  case DetectionMethod::kRuleBased:
    return "rule_based";
  case DetectionMethod::kExternalModel:
    return "external_model";
  case DetectionMethod::kEnsemble:
    return "ensemble";
  case DetectionMethod::kTrend:
    return "trend";
  case DetectionMethod::kInsufficientData:
    return "insufficient_data";
  }
  return "unknown";
}

double ClampScore(double value) {
  if (!std::isfinite(value)) {
    return 0.0;
  }
  return std::clamp(value, 0.0, 1.0);
}

std::string ToJson(const AnomalyVerdict& verdict) {
  std::ostringstream out;
  out << "{\"is_anomaly\":" << (verdict.is_anomaly ? "true" : "false")
      << ",\"score\":" << core::FormatJsonNumber(verdict.score)
      << ",\"method\":" << core::QuoteJson(ToString(verdict.method))
      << ",\"degraded\":" << (verdict.degraded ? "true" : "false") << ",\"reasons\":[";
  for (std::size_t i = 0; i < verdict.reasons.size(); ++i) {
    if (i > 0U) {
      out << ",";
    }
    out << core::QuoteJson(verdict.reasons[i]);
  }
  out << "],\"metrics\":{";
  bool first = true;
  for (const auto& [key, value] : verdict.metrics) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << core::QuoteJson(key) << ":" << core::FormatJsonNumber(value);
  }
  out << "},\"findings\":[";
  for (std::size_t i = 0; i < verdict.findings.size(); ++i) {
    const Finding& finding = verdict.findings[i];
    if (i > 0U) {
      out << ",";
    }
    out << "{\"alert_type\":" << core::QuoteJson(finding.alert_type)
        << ",\"severity\":" << core::QuoteJson(ToString(finding.severity))
        << ",\"message\":" << core::QuoteJson(finding.message) << "}";
  }
  out << "]}";
  return out.str();
}

} // namespace wellwatch::detection

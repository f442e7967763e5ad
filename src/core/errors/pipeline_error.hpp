#pragma once

#include <string>
#include <utility>

namespace wellwatch::core::errors {

// Failure categories surfaced by the ingestion pipeline. None of them is fatal:
// each one degrades to "no verdict / no delivery" plus a counter increment.
enum class ErrorKind {
  kNone,
  // Malformed input rejected at the ingestion boundary.
  kInvalidEvent,
  // Device history below the minimum window; informational.
  kInsufficientData,
  // One detector in the chain failed or threw.
  kProcessorExecution,
  // An alert sink failed, timed out or had its queue overflow.
  kSinkDelivery,
  // Configuration rejected at load time.
  kConfig,
  // Event offered after the drain signal.
  kShuttingDown,
};

inline const char* ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "none";
  case ErrorKind::kInvalidEvent:
    return "invalid_event";
  case ErrorKind::kInsufficientData:
    return "insufficient_data";
  case ErrorKind::kProcessorExecution:
    return "processor_execution";
  case ErrorKind::kSinkDelivery:
    return "sink_delivery";
  case ErrorKind::kConfig:
    return "config";
  case ErrorKind::kShuttingDown:
    return "shutting_down";
  }
  return "unknown";
}

struct PipelineError {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;

  void Clear() {
    kind = ErrorKind::kNone;
    message.clear();
  }

  bool Set(ErrorKind new_kind, std::string new_message) {
    kind = new_kind;
    message = std::move(new_message);
    return false;
  }
};

} // namespace wellwatch::core::errors

#pragma once

#include "detection/verdict.hpp"
#include "telemetry/telemetry_event.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace wellwatch::detection {

// One step of the per-event detector chain.
//
// Contract:
// - `history` holds the device's readings that precede `event`, oldest first
//   (the current event is not part of it).
// - return true and leave `verdict` empty when the detector has nothing to
//   say for this event; return true with a verdict otherwise.
// - return false with `error` set on failure. The chain isolates the failure,
//   so implementations must not leave shared state half-updated.
// - must be deterministic for identical inputs and safe to call from several
//   pipeline workers at once (different devices).
class IDetector {
public:
  virtual ~IDetector() = default;

  virtual std::string Name() const = 0;

  // Method reported for this detector's verdicts (and for its failures).
  virtual DetectionMethod Method() const = 0;

  virtual bool Evaluate(const telemetry::TelemetryEvent& event,
                        const std::vector<telemetry::TelemetryEvent>& history,
                        std::optional<AnomalyVerdict>& verdict, std::string& error) const = 0;
};

// Verdict returned by history-based signals while the device has fewer than
// `min_window` readings.
AnomalyVerdict MakeInsufficientDataVerdict(std::size_t history_points, std::size_t min_window);

} // namespace wellwatch::detection

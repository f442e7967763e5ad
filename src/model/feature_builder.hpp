#pragma once

#include "model/anomaly_scorer.hpp"
#include "telemetry/telemetry_event.hpp"

#include <cstddef>
#include <vector>

namespace wellwatch::model {

// Derives the feature vector the offline pipeline trained on.
//
// Rolling statistics cover the `window_size` most recent readings including
// the current one (sample std). Calendar features use the event's UTC time.
// Features that need a previous reading are 0 for a device's first event.
class FeatureBuilder {
public:
  explicit FeatureBuilder(std::size_t window_size);

  // `history` holds the device's readings preceding `event`, oldest first.
  FeatureVector Build(const telemetry::TelemetryEvent& event,
                      const std::vector<telemetry::TelemetryEvent>& history) const;

  std::size_t window_size() const {
    return window_size_;
  }

private:
  std::size_t window_size_ = 0;
};

} // namespace wellwatch::model

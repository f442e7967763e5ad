#pragma once

#include "detection/detector.hpp"

#include <cstddef>

namespace wellwatch::detection {

// Rolling z-score signal. Mean and population std come from the last
// `window_size` readings before the event; the signal fires when any metric's
// |z| exceeds `z_threshold`.
class StatisticalDetector final : public IDetector {
public:
  StatisticalDetector(std::size_t window_size, std::size_t min_window, double z_threshold);

  std::string Name() const override {
    return "statistical";
  }

  DetectionMethod Method() const override {
    return DetectionMethod::kStatistical;
  }

  bool Evaluate(const telemetry::TelemetryEvent& event,
                const std::vector<telemetry::TelemetryEvent>& history,
                std::optional<AnomalyVerdict>& verdict, std::string& error) const override;

private:
  std::size_t window_size_ = 0;
  std::size_t min_window_ = 0;
  double z_threshold_ = 0.0;
};

} // namespace wellwatch::detection

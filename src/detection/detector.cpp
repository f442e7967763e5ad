#include "detection/detector.hpp"

namespace wellwatch::detection {

AnomalyVerdict MakeInsufficientDataVerdict(std::size_t history_points, std::size_t min_window) {
  AnomalyVerdict verdict;
  verdict.method = DetectionMethod::kInsufficientData;
  verdict.reasons.push_back("history has " + std::to_string(history_points) + " of " +
                            std::to_string(min_window) + " required readings");
  verdict.metrics["history_points"] = static_cast<double>(history_points);
  return verdict;
}

} // namespace wellwatch::detection

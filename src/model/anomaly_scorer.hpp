#pragma once

#include <map>
#include <string>

namespace wellwatch::model {

// Named model inputs. Ordered so scoring and logging are reproducible.
using FeatureVector = std::map<std::string, double>;

// Consumption contract for an offline-trained anomaly model.
//
// Contract:
// - `probability` is written only on success and lies within [0, 1].
// - returns false with `error` set when the model cannot score the input.
// - implementations are called from pipeline workers concurrently and must be
//   safe for concurrent `Score` calls.
class IAnomalyScorer {
public:
  virtual ~IAnomalyScorer() = default;

  virtual std::string Name() const = 0;

  virtual bool Score(const FeatureVector& features, double& probability,
                     std::string& error) const = 0;
};

} // namespace wellwatch::model

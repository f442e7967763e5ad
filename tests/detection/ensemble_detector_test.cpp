#include "detection/ensemble_detector.hpp"
#include "detection/rule_detector.hpp"
#include "detection/statistical_detector.hpp"
#include "detection/trend_detector.hpp"

#include "../common/telemetry_fixtures.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using Catch::Approx;
using wellwatch::config::PipelineConfig;
using wellwatch::detection::AnomalyVerdict;
using wellwatch::detection::DetectionMethod;
using wellwatch::detection::DetectorFailure;
using wellwatch::detection::EnsembleDetector;
using wellwatch::detection::IDetector;
using wellwatch::detection::Severity;
using wellwatch::detection::VoteSettings;
using wellwatch::telemetry::TelemetryEvent;
using wellwatch::tests::common::AlternatingSeries;
using wellwatch::tests::common::MakeEvent;

namespace {

class ThrowingDetector final : public IDetector {
public:
  std::string Name() const override {
    return "throwing";
  }
  DetectionMethod Method() const override {
    return DetectionMethod::kExternalModel;
  }
  bool Evaluate(const TelemetryEvent& /*event*/, const std::vector<TelemetryEvent>& /*history*/,
                std::optional<AnomalyVerdict>& /*verdict*/,
                std::string& /*error*/) const override {
    throw std::runtime_error("model backend offline");
  }
};

class SilentFailureDetector final : public IDetector {
public:
  std::string Name() const override {
    return "silent";
  }
  DetectionMethod Method() const override {
    return DetectionMethod::kStatistical;
  }
  bool Evaluate(const TelemetryEvent& /*event*/, const std::vector<TelemetryEvent>& /*history*/,
                std::optional<AnomalyVerdict>& /*verdict*/,
                std::string& /*error*/) const override {
    return false;
  }
};

AnomalyVerdict Signal(DetectionMethod method, bool is_anomaly) {
  AnomalyVerdict verdict;
  verdict.method = method;
  verdict.is_anomaly = is_anomaly;
  return verdict;
}

std::vector<std::unique_ptr<IDetector>> StatisticalAndRules(const PipelineConfig& config) {
  std::vector<std::unique_ptr<IDetector>> chain;
  chain.push_back(std::make_unique<wellwatch::detection::StatisticalDetector>(
      config.window_size, config.min_window, config.z_score_threshold));
  chain.push_back(std::make_unique<wellwatch::detection::RuleDetector>(config.rules));
  return chain;
}

} // namespace

TEST_CASE("Ensemble flags a spike the statistical signal carries", "[detection][ensemble]") {
  const PipelineConfig config;
  const EnsembleDetector ensemble(wellwatch::detection::BuildDefaultChain(config, nullptr),
                                  wellwatch::detection::VoteSettingsFromConfig(config));
  const auto history = AlternatingSeries("well-1", 20, 0.0, 80.0, 2.0, 200.0, 5.0);

  const auto report = ensemble.Evaluate(MakeEvent("well-1", 20.0, 95.0, 200.0), history);
  REQUIRE(report.failures.empty());
  const AnomalyVerdict* verdict = report.Ensemble();
  REQUIRE(verdict != nullptr);
  REQUIRE(verdict->method == DetectionMethod::kEnsemble);
  REQUIRE(verdict->is_anomaly);
  REQUIRE_FALSE(verdict->degraded);
  // Statistical (0.5) fired, rules (0.3) did not, no model configured.
  REQUIRE(verdict->metrics.at("vote_fraction") == Approx(0.625));
  REQUIRE(verdict->findings.size() == 1U);
  REQUIRE(verdict->findings[0].alert_type == "ANOMALY_DETECTED");
  REQUIRE(verdict->findings[0].severity == Severity::kHigh);
  REQUIRE(verdict->findings[0].details.at("methods") == "statistical");
}

TEST_CASE("Ensemble never flags an anomaly below the minimum window", "[detection][ensemble]") {
  const PipelineConfig config;
  const EnsembleDetector ensemble(wellwatch::detection::BuildDefaultChain(config, nullptr),
                                  wellwatch::detection::VoteSettingsFromConfig(config));
  const auto history = AlternatingSeries("well-1", 5, 0.0, 80.0, 2.0, 200.0, 5.0);

  const auto report = ensemble.Evaluate(MakeEvent("well-1", 5.0, 160.0, 200.0), history);
  const AnomalyVerdict* verdict = report.Ensemble();
  REQUIRE(verdict->method == DetectionMethod::kInsufficientData);
  REQUIRE_FALSE(verdict->is_anomaly);

  // The rule breach is still reported on its own.
  bool saw_extreme = false;
  for (const auto& signal : report.verdicts) {
    for (const auto& finding : signal.findings) {
      saw_extreme = saw_extreme || finding.alert_type == "TEMPERATURE_EXTREME";
    }
  }
  REQUIRE(saw_extreme);
}

TEST_CASE("Vote counts a fraction equal to the threshold as an anomaly", "[detection][vote]") {
  VoteSettings settings;
  settings.weights.statistical = 0.5;
  settings.weights.rule_based = 0.5;
  settings.vote_threshold = 0.5;

  const auto verdict = wellwatch::detection::Vote(
      {Signal(DetectionMethod::kStatistical, true), Signal(DetectionMethod::kRuleBased, false)},
      {}, 20, settings);
  REQUIRE(verdict.metrics.at("vote_fraction") == Approx(0.5));
  REQUIRE(verdict.is_anomaly);
  REQUIRE(verdict.findings[0].severity == Severity::kMedium);
}

TEST_CASE("Vote requires at least one firing signal", "[detection][vote]") {
  VoteSettings settings;
  settings.vote_threshold = 0.0;

  const auto verdict = wellwatch::detection::Vote(
      {Signal(DetectionMethod::kStatistical, false), Signal(DetectionMethod::kRuleBased, false)},
      {}, 20, settings);
  REQUIRE_FALSE(verdict.is_anomaly);
  REQUIRE(verdict.findings.empty());
}

TEST_CASE("Vote normalizes over available signals only", "[detection][vote]") {
  const VoteSettings settings;
  const auto verdict = wellwatch::detection::Vote(
      {Signal(DetectionMethod::kRuleBased, true), Signal(DetectionMethod::kExternalModel, false),
       Signal(DetectionMethod::kTrend, true)},
      {}, 20, settings);
  // rules 0.3 of (0.3 + 0.2); trend verdicts do not vote.
  REQUIRE(verdict.metrics.at("vote_fraction") == Approx(0.6));
  REQUIRE(verdict.is_anomaly);
}

TEST_CASE("Vote without any available signal is degraded, not anomalous", "[detection][vote]") {
  const VoteSettings settings;
  const auto verdict = wellwatch::detection::Vote({}, {}, 20, settings);
  REQUIRE_FALSE(verdict.is_anomaly);
  REQUIRE(verdict.degraded);
}

TEST_CASE("Ensemble isolates a throwing detector", "[detection][ensemble][failure]") {
  const PipelineConfig config;
  auto chain = StatisticalAndRules(config);
  chain.push_back(std::make_unique<ThrowingDetector>());
  const EnsembleDetector ensemble(std::move(chain),
                                  wellwatch::detection::VoteSettingsFromConfig(config));
  const auto history = AlternatingSeries("well-1", 20, 0.0, 80.0, 2.0, 200.0, 5.0);

  const auto report = ensemble.Evaluate(MakeEvent("well-1", 20.0, 95.0, 200.0), history);
  REQUIRE(report.failures.size() == 1U);
  const DetectorFailure& failure = report.failures[0];
  REQUIRE(failure.detector == "throwing");
  REQUIRE(failure.method == DetectionMethod::kExternalModel);
  REQUIRE(failure.message.find("model backend offline") != std::string::npos);

  // statistical, rules, degraded placeholder, ensemble.
  REQUIRE(report.verdicts.size() == 4U);
  REQUIRE(report.verdicts[2].degraded);
  const AnomalyVerdict* verdict = report.Ensemble();
  REQUIRE(verdict->degraded);
  REQUIRE(verdict->is_anomaly);
  REQUIRE(verdict->metrics.at("vote_fraction") == Approx(0.625));
}

TEST_CASE("Ensemble names a failure without a message", "[detection][ensemble][failure]") {
  const PipelineConfig config;
  std::vector<std::unique_ptr<IDetector>> chain;
  chain.push_back(std::make_unique<SilentFailureDetector>());
  chain.push_back(std::make_unique<wellwatch::detection::RuleDetector>(config.rules));
  const EnsembleDetector ensemble(std::move(chain),
                                  wellwatch::detection::VoteSettingsFromConfig(config));

  const auto report = ensemble.Evaluate(
      MakeEvent("well-1", 20.0, 80.0, 200.0),
      AlternatingSeries("well-1", 20, 0.0, 80.0, 2.0, 200.0, 5.0));
  REQUIRE(report.failures.size() == 1U);
  REQUIRE(report.failures[0].message == "detector failed without a message");
  REQUIRE(report.Ensemble()->degraded);
  REQUIRE_FALSE(report.Ensemble()->is_anomaly);
  REQUIRE(ensemble.DetectorNames() == std::vector<std::string>{"silent", "rule_based"});
}

TEST_CASE("Default chain includes the model detector only with a scorer",
          "[detection][ensemble]") {
  const PipelineConfig config;
  const EnsembleDetector ensemble(wellwatch::detection::BuildDefaultChain(config, nullptr),
                                  wellwatch::detection::VoteSettingsFromConfig(config));
  REQUIRE(ensemble.DetectorNames() ==
          std::vector<std::string>{"statistical", "rule_based", "trend"});
  REQUIRE(wellwatch::detection::RequiredHistory(config) == 29U);
}

TEST_CASE("TrendDetector raises a finding for a steep ramp", "[detection][trend]") {
  const wellwatch::detection::TrendDetector detector{wellwatch::config::TrendConfig{}};
  std::vector<TelemetryEvent> history;
  for (int i = 0; i < 25; ++i) {
    history.push_back(MakeEvent("well-1", static_cast<double>(i), 70.0 + i, 200.0));
  }

  std::optional<AnomalyVerdict> verdict;
  std::string error;
  REQUIRE(detector.Evaluate(MakeEvent("well-1", 25.0, 95.0, 200.0), history, verdict, error));
  REQUIRE(verdict.has_value());
  REQUIRE(verdict->method == DetectionMethod::kTrend);
  REQUIRE(verdict->findings.size() == 1U);
  REQUIRE(verdict->findings[0].alert_type == "TEMPERATURE_TREND");
  REQUIRE(verdict->findings[0].severity == Severity::kMedium);
  REQUIRE(verdict->findings[0].details.at("direction") == "INCREASING");
  REQUIRE(verdict->findings[0].details.at("trend_value") == "1.0000");
  REQUIRE(verdict->score == 1.0);
}

TEST_CASE("TrendDetector waits for enough readings", "[detection][trend]") {
  const wellwatch::detection::TrendDetector detector{wellwatch::config::TrendConfig{}};
  const auto history = AlternatingSeries("well-1", 18, 0.0, 80.0, 0.0, 200.0, 0.0);

  std::optional<AnomalyVerdict> verdict;
  std::string error;
  REQUIRE(detector.Evaluate(MakeEvent("well-1", 18.0, 80.0, 200.0), history, verdict, error));
  REQUIRE_FALSE(verdict.has_value());
}

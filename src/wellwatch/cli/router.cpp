#include "wellwatch/cli/router.hpp"

#include "alerting/jsonl_alert_sink.hpp"
#include "alerting/log_alert_sink.hpp"
#include "config/pipeline_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/errors/pipeline_error.hpp"
#include "core/json_utils.hpp"
#include "model/linear_model_scorer.hpp"
#include "pipeline/stream_analytics.hpp"
#include "pipeline/stream_processor.hpp"
#include "telemetry/csv_reader.hpp"
#include "trend/trend_analyzer.hpp"

#include <charconv>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace wellwatch::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitInputUnreadable =
    core::errors::ToInt(core::errors::ExitCode::kInputUnreadable);
constexpr int kExitAlertsRaised = core::errors::ToInt(core::errors::ExitCode::kAlertsRaised);

constexpr std::string_view kVersion = "0.1.0";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  wellwatch replay <telemetry.csv> [--config <config.json>] [--model <model.json>] "
         "[--alerts-out <dir>] [--log-alerts] [--workers <n>] "
         "[--log-level <debug|info|warn|error>] [--fail-on-alert]\n"
      << "  wellwatch analyze <telemetry.csv> --device <id> "
         "[--metric <temperature|pressure>] [--config <config.json>]\n"
      << "  wellwatch validate-config <config.json>\n"
      << "  wellwatch version\n";
}

struct AnalyzeOptions {
  fs::path input_path;
  std::optional<fs::path> config_path;
  std::string device_id;
  telemetry::Metric metric = telemetry::Metric::kTemperature;
};

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[++i];
  return true;
}

bool ParseCount(std::string_view raw, std::size_t& value) {
  std::size_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (ec != std::errc() || ptr != raw.data() + raw.size()) {
    return false;
  }
  value = parsed;
  return true;
}

// Parse `replay` args:
// - one telemetry CSV path
// - optional flags listed in PrintUsage
// Unknown flags and extra positional args are usage errors.
bool ParseReplayOptions(const std::vector<std::string_view>& args, ReplayOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--fail-on-alert") {
      options.fail_on_alert = true;
      continue;
    }
    if (token == "--log-alerts") {
      options.log_alerts = true;
      continue;
    }
    if (token == "--config") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.config_path = fs::path(value);
      continue;
    }
    if (token == "--model") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.model_path = fs::path(value);
      continue;
    }
    if (token == "--alerts-out") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.alerts_dir = fs::path(value);
      continue;
    }
    if (token == "--workers") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      std::size_t workers = 0;
      if (!ParseCount(value, workers)) {
        error = "invalid --workers '" + std::string(value) + "' (expected a non-negative integer)";
        return false;
      }
      options.workers = workers;
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.input_path.empty()) {
      error = "replay accepts exactly 1 telemetry path";
      return false;
    }
    options.input_path = fs::path(token);
  }

  if (options.input_path.empty()) {
    error = "replay requires exactly 1 argument: <telemetry.csv>";
    return false;
  }
  return true;
}

bool ParseAnalyzeOptions(const std::vector<std::string_view>& args, AnalyzeOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--device") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.device_id = std::string(value);
      continue;
    }
    if (token == "--metric") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (!telemetry::ParseMetric(std::string(value), options.metric)) {
        error = "invalid --metric '" + std::string(value) + "' (expected temperature|pressure)";
        return false;
      }
      continue;
    }
    if (token == "--config") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.config_path = fs::path(value);
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.input_path.empty()) {
      error = "analyze accepts exactly 1 telemetry path";
      return false;
    }
    options.input_path = fs::path(token);
  }

  if (options.input_path.empty()) {
    error = "analyze requires a telemetry path";
    return false;
  }
  if (options.device_id.empty()) {
    error = "analyze requires --device <id>";
    return false;
  }
  return true;
}

void PrintConfigIssues(const fs::path& path, const std::vector<config::ConfigIssue>& issues) {
  std::cerr << "invalid config: " << path.string() << '\n';
  for (const auto& issue : issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

// Returns an exit code; kExitSuccess means `config` is usable.
int LoadConfigOrDefaults(const std::optional<fs::path>& path, config::PipelineConfig& config) {
  config = config::PipelineConfig{};
  if (!path.has_value()) {
    return kExitSuccess;
  }

  std::vector<config::ConfigIssue> issues;
  std::string error;
  if (!config::LoadPipelineConfigFile(*path, config, issues, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (!issues.empty()) {
    PrintConfigIssues(*path, issues);
    return kExitConfigInvalid;
  }
  return kExitSuccess;
}

std::string MakeInstanceId(std::string_view prefix) {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  return std::string(prefix) + "-" + std::to_string(millis);
}

// Reads the CSV and logs skipped rows. Returns an exit code.
int ReadInput(const fs::path& path, core::logging::Logger& logger,
              std::vector<telemetry::TelemetryEvent>& events,
              std::vector<telemetry::CsvRowIssue>& issues) {
  std::string error;
  if (!telemetry::ReadTelemetryCsvFile(path, events, issues, error)) {
    logger.Error("failed to read telemetry input", {{"path", path.string()}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitInputUnreadable;
  }
  for (const auto& issue : issues) {
    logger.Warn("telemetry row skipped", {{"line", std::to_string(issue.line_number)},
                                          {"error", issue.message}});
  }
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "wellwatch " << kVersion << '\n';
  return kExitSuccess;
}

int CommandValidateConfig(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate-config requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  const fs::path path(args.front());
  config::PipelineConfig config;
  const int code = LoadConfigOrDefaults(path, config);
  if (code != kExitSuccess) {
    return code;
  }
  std::cout << "valid: " << path.string() << '\n';
  std::cout << config::ToJson(config) << '\n';
  return kExitSuccess;
}

int CommandReplay(const std::vector<std::string_view>& args) {
  ReplayOptions options;
  std::string error;
  if (!ParseReplayOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetInstanceId(MakeInstanceId("replay"));

  config::PipelineConfig config;
  if (const int code = LoadConfigOrDefaults(options.config_path, config); code != kExitSuccess) {
    logger.Error("pipeline config rejected",
                 {{"path", options.config_path->string()},
                  {"error_kind", core::errors::ToString(core::errors::ErrorKind::kConfig)}});
    return code;
  }
  if (options.workers.has_value()) {
    config.workers.count = *options.workers;
  }
  logger.Info("replay requested", {{"input", options.input_path.string()},
                                   {"workers", std::to_string(config.workers.count)}});

  std::shared_ptr<model::LinearModelScorer> scorer;
  if (options.model_path.has_value()) {
    scorer = std::make_shared<model::LinearModelScorer>();
    if (!scorer->LoadFromFile(*options.model_path, error)) {
      logger.Error("failed to load anomaly model",
                   {{"error", error},
                    {"error_kind", core::errors::ToString(core::errors::ErrorKind::kConfig)}});
      std::cerr << "error: " << error << '\n';
      return kExitConfigInvalid;
    }
    logger.Info("anomaly model loaded",
                {{"model", scorer->Name()},
                 {"coefficients", std::to_string(scorer->coefficients().size())}});
  }

  std::vector<telemetry::TelemetryEvent> events;
  std::vector<telemetry::CsvRowIssue> row_issues;
  if (const int code = ReadInput(options.input_path, logger, events, row_issues);
      code != kExitSuccess) {
    return code;
  }

  pipeline::StreamProcessor processor(config, logger, scorer);
  if (options.alerts_dir.has_value()) {
    if (!processor.AddSink(std::make_shared<alerting::JsonlAlertSink>(*options.alerts_dir),
                           error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
  }
  if (options.log_alerts) {
    if (!processor.AddSink(std::make_shared<alerting::LogAlertSink>(logger), error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
  }

  std::size_t rejected = 0;
  for (const auto& event : events) {
    pipeline::IngestResult result;
    core::errors::PipelineError ingest_error;
    if (!processor.Ingest(event, result, ingest_error)) {
      ++rejected;
    }
  }
  processor.Drain();

  const pipeline::StreamAnalytics analytics(processor);
  const pipeline::SystemOverview overview = analytics.GetSystemOverview();

  std::cout << "{\"input\":" << core::QuoteJson(options.input_path.string())
            << ",\"rows_read\":" << events.size() << ",\"rows_skipped\":" << row_issues.size()
            << ",\"events_rejected\":" << rejected;
  if (options.alerts_dir.has_value()) {
    std::cout << ",\"alerts_jsonl\":"
              << core::QuoteJson((*options.alerts_dir / "alerts.jsonl").string());
  }
  std::cout << ",\"overview\":" << pipeline::ToJson(overview) << "}\n";

  logger.Info("replay finished",
              {{"events_processed", std::to_string(overview.stats.events_processed)},
               {"alerts_generated", std::to_string(overview.stats.alerts_generated)}});

  if (options.fail_on_alert && overview.stats.alerts_generated > 0U) {
    return kExitAlertsRaised;
  }
  return kExitSuccess;
}

int CommandAnalyze(const std::vector<std::string_view>& args) {
  AnalyzeOptions options;
  std::string error;
  if (!ParseAnalyzeOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  config::PipelineConfig config;
  if (const int code = LoadConfigOrDefaults(options.config_path, config); code != kExitSuccess) {
    return code;
  }
  config.workers.count = 0;

  core::logging::Logger logger(core::logging::LogLevel::kWarn);
  logger.SetInstanceId(MakeInstanceId("analyze"));

  std::vector<telemetry::TelemetryEvent> events;
  std::vector<telemetry::CsvRowIssue> row_issues;
  if (const int code = ReadInput(options.input_path, logger, events, row_issues);
      code != kExitSuccess) {
    return code;
  }

  pipeline::StreamProcessor processor(config, logger);
  for (const auto& event : events) {
    if (event.device_id != options.device_id) {
      continue;
    }
    pipeline::IngestResult result;
    core::errors::PipelineError ingest_error;
    if (!processor.Ingest(event, result, ingest_error)) {
      logger.Warn("event rejected", {{"error", ingest_error.message}});
    }
  }
  processor.Drain();

  const pipeline::StreamAnalytics analytics(processor);
  std::cout << "{\"analytics\":"
            << pipeline::ToJson(analytics.GetDeviceAnalytics(options.device_id))
            << ",\"health\":" << health::ToJson(processor.GetDeviceHealth(options.device_id))
            << ",\"trend\":"
            << trend::ToJson(processor.AnalyzeTrend(options.device_id, options.metric)) << "}\n";
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "validate-config") {
    return CommandValidateConfig(args);
  }
  if (command == "replay") {
    return CommandReplay(args);
  }
  if (command == "analyze") {
    return CommandAnalyze(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace wellwatch::cli

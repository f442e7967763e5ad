#pragma once

namespace wellwatch::core::errors {

// Stable process-exit contract for the `wellwatch` CLI.
//
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
// - 10 configuration file failed validation
// - 20 telemetry input could not be read
// - 30 alerts were dispatched and `--fail-on-alert` was requested
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kInputUnreadable = 20,
  kAlertsRaised = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace wellwatch::core::errors

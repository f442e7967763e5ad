#pragma once

#include "core/logging/logger.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace wellwatch::cli {

// Options of `wellwatch replay`.
struct ReplayOptions {
  std::filesystem::path input_path;
  std::optional<std::filesystem::path> config_path;
  std::optional<std::filesystem::path> model_path;
  std::optional<std::filesystem::path> alerts_dir;
  std::optional<std::size_t> workers;
  bool log_alerts = false;
  bool fail_on_alert = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Routes `wellwatch` subcommands and returns process exit codes with a stable
// contract for scripts and CI (see core/errors/exit_codes.hpp).
int Dispatch(int argc, char** argv);

} // namespace wellwatch::cli

#include "alerting/jsonl_alert_sink.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace wellwatch::alerting {

JsonlAlertSink::JsonlAlertSink(fs::path output_dir, std::string name)
    : output_dir_(std::move(output_dir)), name_(std::move(name)) {}

bool JsonlAlertSink::Send(const Alert& alert, std::chrono::milliseconds /*timeout*/,
                          std::string& error) {
  if (output_dir_.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  std::error_code ec;
  fs::create_directories(output_dir_, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir_.string() + "': " + ec.message();
    return false;
  }

  const fs::path written_path = OutputPath();
  std::ofstream out_file(written_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open alert log '" + written_path.string() + "' for append";
    return false;
  }

  out_file << ToJson(alert) << '\n';
  out_file.flush();
  if (!out_file) {
    error = "failed while writing alert log '" + written_path.string() + "'";
    return false;
  }
  return true;
}

} // namespace wellwatch::alerting

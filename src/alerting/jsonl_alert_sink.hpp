#pragma once

#include "alerting/alert_sink.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace wellwatch::alerting {

// Appends one JSON-serialized alert per line to `<output_dir>/alerts.jsonl`.
//
// Contract:
// - creates `output_dir` on first use.
// - opens the file in append mode for every call, so external rotation is
//   picked up without a restart.
// - writes exactly one line per delivered alert.
class JsonlAlertSink final : public IAlertSink {
public:
  explicit JsonlAlertSink(std::filesystem::path output_dir, std::string name = "jsonl");

  std::string Name() const override {
    return name_;
  }

  Channel GetChannel() const override {
    return Channel::kFile;
  }

  bool Send(const Alert& alert, std::chrono::milliseconds timeout, std::string& error) override;

  std::filesystem::path OutputPath() const {
    return output_dir_ / "alerts.jsonl";
  }

private:
  std::filesystem::path output_dir_;
  std::string name_;
  std::mutex mu_;
};

} // namespace wellwatch::alerting

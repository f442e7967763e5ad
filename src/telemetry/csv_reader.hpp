#pragma once

#include "telemetry/telemetry_event.hpp"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace wellwatch::telemetry {

// A row that could not be turned into an event. Replay skips these rows and
// reports them instead of aborting the whole file.
struct CsvRowIssue {
  std::size_t line_number = 0;
  std::string message;
};

// Reads telemetry rows in the warehouse export layout.
//
// Accepted layouts:
// - with header: any column order containing `device_id`, `ts`,
//   `temperature`, `pressure` and optionally `status` (other columns such as
//   `id` are ignored).
// - without header: `device_id,ts,temperature,pressure[,status]`.
//
// Contract:
// - returns false only when the stream is unreadable or the header is missing
//   a required column.
// - numeric cells are parsed but not range-checked; `nan` survives parsing so
//   ingestion validation can reject it.
bool ReadTelemetryCsv(std::istream& input, std::vector<TelemetryEvent>& events,
                      std::vector<CsvRowIssue>& issues, std::string& error);

bool ReadTelemetryCsvFile(const std::filesystem::path& path, std::vector<TelemetryEvent>& events,
                          std::vector<CsvRowIssue>& issues, std::string& error);

} // namespace wellwatch::telemetry

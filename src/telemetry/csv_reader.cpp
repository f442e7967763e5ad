#include "telemetry/csv_reader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string_view>

namespace wellwatch::telemetry {

namespace {

struct ColumnLayout {
  std::size_t device_id = 0;
  std::size_t ts = 1;
  std::size_t temperature = 2;
  std::size_t pressure = 3;
  std::optional<std::size_t> status = 4;
};

void TrimTrailingCarriageReturn(std::string& line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

std::string Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t");
  return std::string(text.substr(first, last - first + 1));
}

// Export files never quote cells, so a plain comma split is enough.
std::vector<std::string> SplitCsvLine(const std::string& line) {
  std::vector<std::string> columns;
  std::string current;
  for (const char ch : line) {
    if (ch == ',') {
      columns.push_back(Trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  columns.push_back(Trim(current));
  return columns;
}

bool ParseDouble(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* parse_end = nullptr;
  const double parsed = std::strtod(text.c_str(), &parse_end);
  if (parse_end == nullptr || *parse_end != '\0') {
    return false;
  }
  value = parsed;
  return true;
}

bool LooksLikeHeader(const std::vector<std::string>& columns) {
  for (const auto& column : columns) {
    if (column == "device_id") {
      return true;
    }
  }
  return false;
}

bool ResolveHeader(const std::vector<std::string>& columns, ColumnLayout& layout,
                   std::string& error) {
  std::optional<std::size_t> device_id;
  std::optional<std::size_t> ts;
  std::optional<std::size_t> temperature;
  std::optional<std::size_t> pressure;
  std::optional<std::size_t> status;

  for (std::size_t i = 0; i < columns.size(); ++i) {
    const std::string& name = columns[i];
    if (name == "device_id") {
      device_id = i;
    } else if (name == "ts" || name == "timestamp") {
      ts = i;
    } else if (name == "temperature") {
      temperature = i;
    } else if (name == "pressure") {
      pressure = i;
    } else if (name == "status") {
      status = i;
    }
  }

  if (!device_id || !ts || !temperature || !pressure) {
    error = "telemetry csv header must contain device_id, ts, temperature and pressure";
    return false;
  }

  layout.device_id = *device_id;
  layout.ts = *ts;
  layout.temperature = *temperature;
  layout.pressure = *pressure;
  layout.status = status;
  return true;
}

std::size_t RequiredColumnCount(const ColumnLayout& layout) {
  std::size_t max_index = layout.device_id;
  for (const std::size_t index : {layout.ts, layout.temperature, layout.pressure}) {
    max_index = std::max(max_index, index);
  }
  return max_index + 1U;
}

bool ParseRow(const std::vector<std::string>& columns, const ColumnLayout& layout,
              TelemetryEvent& event, std::string& message) {
  if (columns.size() < RequiredColumnCount(layout)) {
    message = "expected at least " + std::to_string(RequiredColumnCount(layout)) +
              " columns, got " + std::to_string(columns.size());
    return false;
  }

  event = TelemetryEvent{};
  event.device_id = columns[layout.device_id];
  if (!ParseDouble(columns[layout.ts], event.timestamp)) {
    message = "invalid ts value '" + columns[layout.ts] + "'";
    return false;
  }
  if (!ParseDouble(columns[layout.temperature], event.temperature)) {
    message = "invalid temperature value '" + columns[layout.temperature] + "'";
    return false;
  }
  if (!ParseDouble(columns[layout.pressure], event.pressure)) {
    message = "invalid pressure value '" + columns[layout.pressure] + "'";
    return false;
  }
  if (layout.status.has_value() && *layout.status < columns.size() &&
      !columns[*layout.status].empty()) {
    event.status = columns[*layout.status];
  }
  return true;
}

} // namespace

bool ReadTelemetryCsv(std::istream& input, std::vector<TelemetryEvent>& events,
                      std::vector<CsvRowIssue>& issues, std::string& error) {
  events.clear();
  issues.clear();
  if (!input) {
    error = "telemetry input stream is not readable";
    return false;
  }

  ColumnLayout layout;
  bool first_row = true;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    TrimTrailingCarriageReturn(line);
    if (Trim(line).empty()) {
      continue;
    }

    const std::vector<std::string> columns = SplitCsvLine(line);
    if (first_row) {
      first_row = false;
      if (LooksLikeHeader(columns)) {
        if (!ResolveHeader(columns, layout, error)) {
          return false;
        }
        continue;
      }
    }

    TelemetryEvent event;
    std::string message;
    if (!ParseRow(columns, layout, event, message)) {
      issues.push_back({.line_number = line_number, .message = std::move(message)});
      continue;
    }
    events.push_back(std::move(event));
  }

  if (input.bad()) {
    error = "failed while reading telemetry input";
    return false;
  }
  error.clear();
  return true;
}

bool ReadTelemetryCsvFile(const std::filesystem::path& path, std::vector<TelemetryEvent>& events,
                          std::vector<CsvRowIssue>& issues, std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "failed to open telemetry csv: " + path.string();
    return false;
  }
  if (!ReadTelemetryCsv(input, events, issues, error)) {
    error += " (" + path.string() + ")";
    return false;
  }
  return true;
}

} // namespace wellwatch::telemetry

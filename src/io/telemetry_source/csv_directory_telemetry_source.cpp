#include "csv_directory_telemetry_source.hpp"
#include "analysis/header_index.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

CsvDirectoryTelemetrySource::CsvDirectoryTelemetrySource(std::string directory)
    : directory_(std::move(directory)) {}

std::string
CsvDirectoryTelemetrySource::stream_path(const std::string &activity_file,
                                         Subsystem subsystem) const {
  std::filesystem::path base =
      std::filesystem::path(activity_file).filename();
  std::string name =
      base.string() + "." + subsystem_key(subsystem) + ".csv";
  return (std::filesystem::path(directory_) / name).string();
}

std::optional<std::vector<std::string>>
CsvDirectoryTelemetrySource::decode(const std::string &activity_file,
                                    Subsystem subsystem,
                                    const analysis::Window & /*window*/) {
  const std::string path = stream_path(activity_file, subsystem);
  std::ifstream in(path);
  if (!in.is_open()) {
    LOG(LogLevel::DEBUG, LogComponent::IO_SOURCE,
        "No exported stream at " << path);
    return std::nullopt;
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      continue;
    lines.push_back(std::move(line));
  }

  if (lines.empty() || !analysis::HeaderIndex::is_header_line(lines.front())) {
    LOG(LogLevel::WARN, LogComponent::IO_SOURCE,
        "Exported stream " << path << " has no header line, ignoring it");
    return std::nullopt;
  }
  return lines;
}

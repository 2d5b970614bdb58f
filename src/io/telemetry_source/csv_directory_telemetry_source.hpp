#ifndef CSV_DIRECTORY_TELEMETRY_SOURCE_HPP
#define CSV_DIRECTORY_TELEMETRY_SOURCE_HPP

#include "base_telemetry_source.hpp"

#include <string>
#include <vector>

// Reads streams exported earlier with `sadf -d`, one file per report type:
// <directory>/<activity file basename>.<subsystem key>.csv
class CsvDirectoryTelemetrySource : public ITelemetrySource {
public:
  explicit CsvDirectoryTelemetrySource(std::string directory);

  std::optional<std::vector<std::string>>
  decode(const std::string &activity_file, Subsystem subsystem,
         const analysis::Window &window) override;

  std::string stream_path(const std::string &activity_file,
                          Subsystem subsystem) const;

private:
  std::string directory_;
};

#endif // CSV_DIRECTORY_TELEMETRY_SOURCE_HPP

#ifndef BASE_TELEMETRY_SOURCE_HPP
#define BASE_TELEMETRY_SOURCE_HPP

#include "analysis/window_filter.hpp"
#include "core/sample.hpp"

#include <optional>
#include <string>
#include <vector>

class ITelemetrySource {
public:
  virtual ~ITelemetrySource() = default;

  // Decoded, semicolon-separated stream for one (file, report type) pair,
  // header first. std::nullopt means the report is absent for that file;
  // a header with no rows is present but empty.
  // The window is a hint; callers still apply WindowFilter to the result.
  virtual std::optional<std::vector<std::string>>
  decode(const std::string &activity_file, Subsystem subsystem,
         const analysis::Window &window) = 0;
};

#endif // BASE_TELEMETRY_SOURCE_HPP

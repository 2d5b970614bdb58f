#ifndef SADF_TELEMETRY_SOURCE_HPP
#define SADF_TELEMETRY_SOURCE_HPP

#include "base_telemetry_source.hpp"
#include "core/config.hpp"
#include "utils/process_runner.hpp"

#include <memory>
#include <string>
#include <vector>

// Decodes sysstat activity files with `sadf -d`. The runner is injectable so
// the command line and exit handling can be exercised without sysstat.
class SadfTelemetrySource : public ITelemetrySource {
public:
  explicit SadfTelemetrySource(
      const Config::DecoderConfig &config,
      std::shared_ptr<const ProcessRunner> runner =
          std::make_shared<ProcessRunner>());

  std::optional<std::vector<std::string>>
  decode(const std::string &activity_file, Subsystem subsystem,
         const analysis::Window &window) override;

  std::vector<std::string> build_argv(const std::string &activity_file,
                                      Subsystem subsystem,
                                      const analysis::Window &window) const;

private:
  std::string sadf_path_;
  uint32_t timeout_seconds_;
  std::shared_ptr<const ProcessRunner> runner_;
};

#endif // SADF_TELEMETRY_SOURCE_HPP

#include "sadf_telemetry_source.hpp"
#include "analysis/header_index.hpp"
#include "core/logger.hpp"

#include <string>
#include <utility>
#include <vector>

SadfTelemetrySource::SadfTelemetrySource(
    const Config::DecoderConfig &config,
    std::shared_ptr<const ProcessRunner> runner)
    : sadf_path_(config.sadf_path), timeout_seconds_(config.timeout_seconds),
      runner_(std::move(runner)) {}

std::vector<std::string>
SadfTelemetrySource::build_argv(const std::string &activity_file,
                                Subsystem subsystem,
                                const analysis::Window &window) const {
  std::vector<std::string> argv = {sadf_path_, "-d"};
  // sadf cannot express a range across midnight; WindowFilter handles it
  if (!window.is_full_day() && !window.wraps_midnight()) {
    argv.insert(argv.end(), {"-s", window.start(), "-e", window.end()});
  }
  argv.push_back(activity_file);
  argv.push_back("--");
  for (auto &opt : sadf_report_options(subsystem))
    argv.push_back(std::move(opt));
  return argv;
}

std::optional<std::vector<std::string>>
SadfTelemetrySource::decode(const std::string &activity_file,
                            Subsystem subsystem,
                            const analysis::Window &window) {
  auto argv = build_argv(activity_file, subsystem, window);
  ProcessResult result = runner_->run(argv, timeout_seconds_);

  if (result.timed_out) {
    LOG(LogLevel::WARN, LogComponent::IO_DECODER,
        "sadf timed out after " << timeout_seconds_ << "s for "
                                << activity_file << " ("
                                << subsystem_to_string(subsystem) << ")");
    return std::nullopt;
  }
  if (!result.ok()) {
    LOG(LogLevel::DEBUG, LogComponent::IO_DECODER,
        "sadf exited with " << result.exit_code << " for " << activity_file
                            << " (" << subsystem_to_string(subsystem) << ")");
    return std::nullopt;
  }
  if (result.lines.empty() ||
      !analysis::HeaderIndex::is_header_line(result.lines.front())) {
    LOG(LogLevel::DEBUG, LogComponent::IO_DECODER,
        "sadf produced no header for " << activity_file << " ("
                                       << subsystem_to_string(subsystem)
                                       << ")");
    return std::nullopt;
  }

  LOG(LogLevel::TRACE, LogComponent::IO_DECODER,
      "Decoded " << result.lines.size() << " lines from " << activity_file
                 << " (" << subsystem_to_string(subsystem) << ")");
  return std::move(result.lines);
}

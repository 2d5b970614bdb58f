#include "summary_writer.hpp"
#include "core/candidate.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <fstream>
#include <string>

namespace SummaryWriter {

std::string format_summary(const TopList &summary, size_t max_lines,
                           const std::string &generated_at) {
  std::string text = "# sar summary: " + generated_at + "\n";
  size_t written = 0;
  for (const auto &candidate : summary.entries()) {
    if (written++ == max_lines)
      break;
    text += candidate_to_record(candidate);
    text += '\n';
  }
  return text;
}

bool write_summary_file(const std::string &path, const TopList &summary,
                        size_t max_lines) {
  if (!Utils::create_directory_for_file(path)) {
    LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
        "Cannot create directory for summary file " << path);
    return false;
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
        "Cannot open summary file " << path);
    return false;
  }
  out << format_summary(summary, max_lines, Utils::current_iso8601_time());
  if (!out.good()) {
    LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
        "Failed writing summary file " << path);
    return false;
  }
  return true;
}

} // namespace SummaryWriter

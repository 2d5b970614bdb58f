#ifndef REPORT_RENDERER_HPP
#define REPORT_RENDERER_HPP

#include "analysis/file_report.hpp"
#include "analysis/window_filter.hpp"
#include "core/config.hpp"
#include "detection/top_list.hpp"
#include "utils/process_runner.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

// Writes the human-readable audit report. Every method appends one block.
class ReportRenderer {
public:
  ReportRenderer(std::ostream &out, const Config::AppConfig &cfg);

  void render_header(const analysis::Window &window);
  void render_no_files();
  void render_file_list(const std::vector<std::string> &files);
  void render_file(const FileReport &report);
  void render_top_blocks(const Ranker &ranker);
  void render_inventory(const ProcessRunner &runner);
  void render_done();

  static const char *top_block_title(Subsystem subsystem);
  static std::string format_value(const std::optional<double> &value,
                                  int precision);

private:
  std::ostream &out_;
  size_t top_n_;

  void render_cpu(const CpuSection &cpu);
  void render_memory(const MemorySection &memory);
  void render_disk(const DiskSection &disk);
  void render_network(const NetworkSection &network);
  void render_warnings(const std::vector<std::string> &warnings);
  void render_top_entries(const TopList &list);
  void render_rule();
};

#endif // REPORT_RENDERER_HPP

#include "report_renderer.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <iomanip>
#include <string>
#include <vector>

namespace {
constexpr uint32_t INVENTORY_TIMEOUT_SECONDS = 10;
constexpr size_t DISK_TABLE_ROWS = 5;
} // namespace

ReportRenderer::ReportRenderer(std::ostream &out,
                               const Config::AppConfig &cfg)
    : out_(out), top_n_(cfg.top_n) {}

std::string ReportRenderer::format_value(const std::optional<double> &value,
                                         int precision) {
  if (!value)
    return "n/a";
  return Utils::format_fixed(*value, precision);
}

const char *ReportRenderer::top_block_title(Subsystem subsystem) {
  switch (subsystem) {
  case Subsystem::CPU:
    return "CPU";
  case Subsystem::MEMORY:
    return "Memory/Swap";
  case Subsystem::DISK:
    return "Disks: spikes";
  case Subsystem::NET_DEVICE:
    return "Network: load";
  case Subsystem::NET_ERROR:
    return "Network: errors/drops";
  case Subsystem::SOCKET:
    return "SOCK";
  case Subsystem::TCP:
    return "TCP";
  case Subsystem::IP:
    return "IP";
  default:
    return subsystem_to_string(subsystem);
  }
}

void ReportRenderer::render_rule() {
  out_ << std::string(80, '-') << "\n\n";
}

void ReportRenderer::render_header(const analysis::Window &window) {
  out_ << "Window: " << window.start() << "-" << window.end();
  if (window.is_full_day())
    out_ << " (full day)";
  out_ << "\n";
  render_rule();
}

void ReportRenderer::render_no_files() { out_ << "No sa[NN] files found.\n"; }

void ReportRenderer::render_file_list(const std::vector<std::string> &files) {
  out_ << "Files to analyze (newest by mtime):\n";
  for (const auto &f : files)
    out_ << " - " << f << "\n";
  out_ << "\n";
}

void ReportRenderer::render_warnings(const std::vector<std::string> &warnings) {
  for (const auto &w : warnings)
    out_ << "  [!] " << w << "\n";
}

void ReportRenderer::render_cpu(const CpuSection &cpu) {
  out_ << "-- CPU\n";
  if (!cpu.has_data) {
    out_ << "  (no data sar -u in window)\n\n";
    return;
  }
  out_ << "  avg busy(usr+sys)=" << format_value(cpu.avg_busy, 1)
       << "%  iowait=" << format_value(cpu.avg_iowait, 1)
       << "%  steal=" << format_value(cpu.avg_steal, 1)
       << "%  idle=" << format_value(cpu.avg_idle, 1) << "%\n";
  out_ << "  avg runq-sz=" << format_value(cpu.avg_runq, 2)
       << "  load(1/5/15)=" << format_value(cpu.avg_ldavg_1, 2) << "/"
       << format_value(cpu.avg_ldavg_5, 2) << "/"
       << format_value(cpu.avg_ldavg_15, 2)
       << "  cswch/s=" << format_value(cpu.avg_cswch, 0) << "\n";
  out_ << "  p95/p99 busy=" << format_value(cpu.p95_busy, 1) << "/"
       << format_value(cpu.p99_busy, 1)
       << "%  p95/p99 iowait=" << format_value(cpu.p95_iowait, 1) << "/"
       << format_value(cpu.p99_iowait, 1) << "%\n";
  render_warnings(cpu.warnings);
  out_ << "\n";
}

void ReportRenderer::render_memory(const MemorySection &memory) {
  out_ << "-- Memory/swap\n";
  if (!memory.has_data) {
    out_ << "  (no data sar -r in window)\n\n";
    return;
  }
  out_ << "  avg %memused=" << format_value(memory.avg_memused, 1)
       << "%  kbavail=" << format_value(memory.avg_kbavail, 0) << "\n";
  out_ << "  p95/p99 %memused=" << format_value(memory.p95_memused, 1) << "/"
       << format_value(memory.p99_memused, 1)
       << "%  (kbavail p5/p1=" << format_value(memory.p5_kbavail, 0) << "/"
       << format_value(memory.p1_kbavail, 0) << ")\n";
  if (memory.avg_swpused)
    out_ << "  avg %swpused=" << format_value(memory.avg_swpused, 1) << "%\n";
  render_warnings(memory.warnings);
  out_ << "\n";
}

void ReportRenderer::render_disk(const DiskSection &disk) {
  out_ << "-- Disks\n";
  if (!disk.has_data) {
    out_ << "  (no data sar -d in window)\n\n";
    return;
  }
  out_ << "  Average latency/utilization (top " << DISK_TABLE_ROWS
       << " by await):\n";
  size_t shown = 0;
  for (const auto &dev : disk.devices) {
    if (shown++ == DISK_TABLE_ROWS)
      break;
    out_ << "    " << std::left << std::setw(20) << dev.device << std::right
         << " avg await=" << format_value(dev.avg_await, 1)
         << "ms  %util=" << format_value(dev.avg_util, 1)
         << "  aqu=" << format_value(dev.avg_aqu, 2) << "\n";
  }
  render_warnings(disk.warnings);
  out_ << "\n";
}

void ReportRenderer::render_network(const NetworkSection &network) {
  out_ << "-- Network\n";
  if (!network.has_data) {
    out_ << "  (no data sar -n DEV in window)\n\n";
    return;
  }
  out_ << "  Per-interface averages:\n";
  for (const auto &nic : network.interfaces) {
    out_ << "   - " << std::left << std::setw(12) << nic.iface << std::right
         << " rx=" << format_value(nic.avg_rx, 1)
         << "kB/s  tx=" << format_value(nic.avg_tx, 1) << "kB/s  %ifutil";
    if (nic.link_speed_unknown)
      out_ << "=n/a";
    else if (nic.ifutil_estimated)
      out_ << "~" << format_value(nic.avg_ifutil, 1) << " (estimated)";
    else
      out_ << "=" << format_value(nic.avg_ifutil, 1);
    out_ << "\n";
    out_ << "     p95/p99 load(rx+tx)=" << format_value(nic.p95_load, 1) << "/"
         << format_value(nic.p99_load, 1) << " kB/s\n";
  }
  render_warnings(network.warnings);
  out_ << "\n";
}

void ReportRenderer::render_file(const FileReport &report) {
  out_ << "=== File: " << report.path << " ===\n";
  render_cpu(report.cpu);
  render_memory(report.memory);
  render_disk(report.disk);
  render_network(report.network);
  render_rule();
}

void ReportRenderer::render_top_entries(const TopList &list) {
  if (list.empty()) {
    out_ << "  (empty)\n\n";
    return;
  }
  size_t shown = 0;
  for (const auto &c : list.entries()) {
    if (shown++ == top_n_)
      break;
    out_ << "  " << c.timestamp << "  " << c.description << "\n";
  }
  out_ << "\n";
}

void ReportRenderer::render_top_blocks(const Ranker &ranker) {
  for (Subsystem subsystem : ranked_subsystems()) {
    out_ << top_block_title(subsystem) << " (TOP-" << top_n_ << ")\n";
    render_top_entries(ranker.list_for(subsystem));
  }
  out_ << "Merged TOP-" << top_n_ << " across subsystems\n";
  render_top_entries(ranker.global());
}

void ReportRenderer::render_inventory(const ProcessRunner &runner) {
  struct InventoryCommand {
    const char *title;
    std::vector<std::string> argv;
  };
  const std::vector<InventoryCommand> commands = {
      {"Block devices/volumes (lsblk):",
       {"lsblk", "-o", "NAME,KNAME,TYPE,SIZE,FSTYPE,MOUNTPOINTS"}},
      {"LVM logical volumes (lvs):", {"lvs"}},
  };

  for (const auto &cmd : commands) {
    if (!ProcessRunner::command_exists(cmd.argv.front()))
      continue;
    ProcessResult result = runner.run(cmd.argv, INVENTORY_TIMEOUT_SECONDS);
    if (!result.ok()) {
      LOG(LogLevel::WARN, LogComponent::REPORT,
          cmd.argv.front() << " failed with exit code " << result.exit_code);
      continue;
    }
    out_ << cmd.title << "\n";
    for (const auto &line : result.lines)
      out_ << line << "\n";
    out_ << "\n";
  }
}

void ReportRenderer::render_done() { out_ << "Done.\n"; }

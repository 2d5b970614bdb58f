#ifndef FILE_REPORT_HPP
#define FILE_REPORT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Window summaries of one activity file, ready for rendering. Statistics
// without data are std::nullopt and render as "n/a".

struct CpuSection {
  bool has_data = false;

  std::optional<double> avg_busy;
  std::optional<double> avg_iowait;
  std::optional<double> avg_steal;
  std::optional<double> avg_idle;
  std::optional<double> p95_busy;
  std::optional<double> p99_busy;
  std::optional<double> p95_iowait;
  std::optional<double> p99_iowait;

  std::optional<double> avg_runq;
  std::optional<double> avg_ldavg_1;
  std::optional<double> avg_ldavg_5;
  std::optional<double> avg_ldavg_15;
  std::optional<double> avg_cswch;

  std::vector<std::string> warnings;
};

struct MemorySection {
  bool has_data = false;

  std::optional<double> avg_memused;
  std::optional<double> avg_kbavail;
  std::optional<double> p95_memused;
  std::optional<double> p99_memused;
  std::optional<double> p5_kbavail;
  std::optional<double> p1_kbavail;
  std::optional<double> avg_swpused;
  bool page_cache_pressure = false;

  std::vector<std::string> warnings;
};

struct DiskDeviceSummary {
  std::string device;
  size_t samples = 0;
  std::optional<double> avg_await;
  std::optional<double> avg_util;
  std::optional<double> avg_aqu;
};

struct DiskSection {
  bool has_data = false;
  // Highest average await first
  std::vector<DiskDeviceSummary> devices;
  std::vector<std::string> warnings;
};

struct InterfaceSummary {
  std::string iface;
  std::optional<double> avg_rx;
  std::optional<double> avg_tx;
  // Measured, or estimated from the link speed; unset when unknown
  std::optional<double> avg_ifutil;
  bool ifutil_estimated = false;
  bool link_speed_unknown = false;
  std::optional<double> p95_load;
  std::optional<double> p99_load;
};

struct NetworkSection {
  bool has_data = false;
  std::vector<InterfaceSummary> interfaces;
  std::vector<std::string> warnings;
};

struct FileReport {
  std::string path;
  CpuSection cpu;
  MemorySection memory;
  DiskSection disk;
  NetworkSection network;
  size_t candidates = 0;
};

#endif // FILE_REPORT_HPP

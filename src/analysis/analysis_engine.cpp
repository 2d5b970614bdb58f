#include "analysis_engine.hpp"
#include "core/logger.hpp"
#include "detection/rules/scoring.hpp"
#include "metric_extractor.hpp"
#include "metric_series.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

using analysis::MetricSeries;
namespace Col = analysis::Columns;

namespace {

analysis::Window window_from_config(const Config::AppConfig &cfg) {
  auto window = analysis::Window::parse(cfg.window_start, cfg.window_end);
  if (!window)
    throw std::invalid_argument("Invalid analysis window " + cfg.window_start +
                                "-" + cfg.window_end);
  return *window;
}

void add_if_present(MetricSeries &series, const Sample &sample,
                    const char *column) {
  if (auto v = sample.get(column))
    series.add(*v);
}

// Groups samples by resource, keeping first-seen order
std::vector<std::pair<std::string, std::vector<const Sample *>>>
group_by_resource(const std::vector<Sample> &samples) {
  std::vector<std::pair<std::string, std::vector<const Sample *>>> groups;
  std::map<std::string, size_t> index;
  for (const auto &sample : samples) {
    auto it = index.find(sample.resource_key);
    if (it == index.end()) {
      index.emplace(sample.resource_key, groups.size());
      groups.push_back({sample.resource_key, {&sample}});
    } else {
      groups[it->second].second.push_back(&sample);
    }
  }
  return groups;
}

} // namespace

AnalysisEngine::AnalysisEngine(const Config::AppConfig &cfg,
                               ITelemetrySource &source, Ranker &ranker)
    : app_config(cfg), source_(source), ranker_(ranker),
      window_(window_from_config(cfg)), scorer_(cfg) {}

uint32_t AnalysisEngine::resolve_vcpu_count() const {
  if (app_config.thresholds.vcpu_count > 0)
    return app_config.thresholds.vcpu_count;
  long online = sysconf(_SC_NPROCESSORS_ONLN);
  if (online < 1) {
    LOG(LogLevel::WARN, LogComponent::ANALYSIS_STATS,
        "Could not determine online CPUs, assuming 1");
    return 1;
  }
  return static_cast<uint32_t>(online);
}

std::optional<std::vector<Sample>>
AnalysisEngine::load_samples(const std::string &path, Subsystem subsystem) {
  auto decoded = source_.decode(path, subsystem, window_);
  if (!decoded) {
    ++run_metrics_.streams_absent;
    return std::nullopt;
  }
  ++run_metrics_.streams_decoded;

  analysis::WindowFilter filter(window_);
  analysis::MetricExtractor extractor(subsystem,
                                      app_config.network.include_loopback);
  auto samples = extractor.extract(filter.filter(*decoded));
  run_metrics_.samples_extracted += samples.size();
  return samples;
}

size_t AnalysisEngine::score_and_rank(const std::vector<Sample> &samples) {
  size_t produced = 0;
  for (const auto &sample : samples) {
    if (auto candidate = scorer_.score(sample)) {
      ranker_.offer(*candidate);
      ++produced;
    }
  }
  run_metrics_.candidates_offered += produced;
  return produced;
}

CpuSection AnalysisEngine::build_cpu_section(const std::string &path,
                                             size_t &candidates) {
  CpuSection section;
  auto samples = load_samples(path, Subsystem::CPU);
  if (!samples || samples->empty())
    return section;
  section.has_data = true;

  MetricSeries busy, iowait, steal, idle;
  for (const auto &sample : *samples) {
    if (!sample.resource_key.empty() &&
        !analysis::is_cpu_aggregate(sample.resource_key))
      continue;
    if (sample.has(Col::CPU_USER) || sample.has(Col::CPU_SYSTEM))
      busy.add(sample.get(Col::CPU_USER).value_or(0.0) +
               sample.get(Col::CPU_SYSTEM).value_or(0.0));
    add_if_present(iowait, sample, Col::CPU_IOWAIT);
    add_if_present(steal, sample, Col::CPU_STEAL);
    add_if_present(idle, sample, Col::CPU_IDLE);
  }
  candidates += score_and_rank(*samples);

  section.avg_busy = busy.mean();
  section.avg_iowait = iowait.mean();
  section.avg_steal = steal.mean();
  section.avg_idle = idle.mean();
  section.p95_busy = busy.percentile(0.95);
  section.p99_busy = busy.percentile(0.99);
  section.p95_iowait = iowait.percentile(0.95);
  section.p99_iowait = iowait.percentile(0.99);

  const auto &th = app_config.thresholds;
  if (section.p99_iowait && *section.p99_iowait > th.cpu_iowait_warn) {
    section.warnings.push_back(
        "iowait p99=" + Utils::format_fixed(*section.p99_iowait, 1) + "% (>" +
        Utils::format_fixed(th.cpu_iowait_warn, 0) + "%)");
  }

  if (auto load = load_samples(path, Subsystem::LOAD); load && !load->empty()) {
    MetricSeries runq, l1, l5, l15;
    for (const auto &sample : *load) {
      add_if_present(runq, sample, Col::RUNQ_SZ);
      add_if_present(l1, sample, Col::LDAVG_1);
      add_if_present(l5, sample, Col::LDAVG_5);
      add_if_present(l15, sample, Col::LDAVG_15);
    }
    section.avg_runq = runq.mean();
    section.avg_ldavg_1 = l1.mean();
    section.avg_ldavg_5 = l5.mean();
    section.avg_ldavg_15 = l15.mean();

    if (section.avg_runq) {
      const uint32_t vcpus = resolve_vcpu_count();
      auto candidate = scorer_.score_run_queue(*section.avg_runq, vcpus,
                                               load->back().timestamp);
      if (candidate) {
        const double limit = vcpus * th.runq_factor;
        section.warnings.push_back(
            "runq-sz avg=" + Utils::format_fixed(*section.avg_runq, 2) +
            " (> " + Utils::format_fixed(limit, 2) + ")");
        ranker_.offer(*candidate);
        ++run_metrics_.candidates_offered;
        ++candidates;
      }
    }
  }

  if (auto cswch = load_samples(path, Subsystem::CONTEXT_SWITCH)) {
    MetricSeries series;
    for (const auto &sample : *cswch)
      add_if_present(series, sample, Col::CSWCH);
    section.avg_cswch = series.mean();
  }

  LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_STATS,
      path << " CPU: " << busy.size() << " aggregate samples");
  return section;
}

MemorySection AnalysisEngine::build_memory_section(const std::string &path,
                                                   size_t &candidates) {
  MemorySection section;
  auto samples = load_samples(path, Subsystem::MEMORY);
  if (!samples || samples->empty())
    return section;
  section.has_data = true;

  MetricSeries memused, kbavail;
  for (const auto &sample : *samples) {
    add_if_present(memused, sample, Col::MEM_USED_PCT);
    add_if_present(kbavail, sample, Col::MEM_KBAVAIL);
  }
  candidates += score_and_rank(*samples);

  section.avg_memused = memused.mean();
  section.avg_kbavail = kbavail.mean();
  section.p95_memused = memused.percentile(0.95);
  section.p99_memused = memused.percentile(0.99);
  section.p5_kbavail = kbavail.percentile(0.05);
  section.p1_kbavail = kbavail.percentile(0.01);

  if (auto swap = load_samples(path, Subsystem::SWAP)) {
    MetricSeries swpused;
    for (const auto &sample : *swap)
      add_if_present(swpused, sample, Col::SWAP_USED_PCT);
    section.avg_swpused = swpused.mean();
  }

  if (auto paging = load_samples(path, Subsystem::PAGING)) {
    section.page_cache_pressure =
        std::any_of(paging->begin(), paging->end(), [](const Sample &s) {
          return s.get(Col::PGSCAN).value_or(0.0) > 0.0 &&
                 s.get(Col::PGSTEAL).value_or(0.0) > 0.0;
        });
    if (section.page_cache_pressure)
      section.warnings.push_back(
          "page cache pressure: pgscan>0 and pgsteal>0 in window");
  }
  return section;
}

DiskSection AnalysisEngine::build_disk_section(const std::string &path,
                                               size_t &candidates) {
  DiskSection section;
  auto samples = load_samples(path, Subsystem::DISK);
  if (!samples || samples->empty())
    return section;
  section.has_data = true;

  for (const auto &[device, rows] : group_by_resource(*samples)) {
    MetricSeries await, util, aqu;
    for (const Sample *sample : rows) {
      add_if_present(await, *sample, Col::DISK_AWAIT);
      add_if_present(util, *sample, Col::DISK_UTIL);
      add_if_present(aqu, *sample, Col::DISK_AQU_SZ);
    }
    DiskDeviceSummary summary;
    summary.device = device;
    summary.samples = rows.size();
    summary.avg_await = await.mean();
    summary.avg_util = util.mean();
    summary.avg_aqu = aqu.mean();
    section.devices.push_back(std::move(summary));
  }
  candidates += score_and_rank(*samples);

  std::stable_sort(section.devices.begin(), section.devices.end(),
                   [](const DiskDeviceSummary &a, const DiskDeviceSummary &b) {
                     return a.avg_await.value_or(-1.0) >
                            b.avg_await.value_or(-1.0);
                   });

  const auto &th = app_config.thresholds;
  for (const auto &dev : section.devices) {
    if (dev.avg_await && *dev.avg_await > th.disk_await_warn)
      section.warnings.push_back(
          dev.device + " avg await=" + Utils::format_fixed(*dev.avg_await, 1) +
          "ms (>" + Utils::format_fixed(th.disk_await_warn, 0) + "ms)");
    if (dev.avg_util && *dev.avg_util > th.disk_util_warn)
      section.warnings.push_back(
          dev.device + " avg %util=" + Utils::format_fixed(*dev.avg_util, 1) +
          " (>" + Utils::format_fixed(th.disk_util_warn, 0) + "%)");
  }
  return section;
}

NetworkSection AnalysisEngine::build_network_section(const std::string &path,
                                                     size_t &candidates) {
  NetworkSection section;
  auto samples = load_samples(path, Subsystem::NET_DEVICE);
  if (!samples || samples->empty())
    return section;
  section.has_data = true;

  for (const auto &[iface, rows] : group_by_resource(*samples)) {
    MetricSeries rx, tx, ifutil, load;
    for (const Sample *sample : rows) {
      add_if_present(rx, *sample, Col::NET_RXKB);
      add_if_present(tx, *sample, Col::NET_TXKB);
      add_if_present(ifutil, *sample, Col::NET_IFUTIL);
      load.add(sample->get(Col::NET_RXKB).value_or(0.0) +
               sample->get(Col::NET_TXKB).value_or(0.0));
    }

    InterfaceSummary summary;
    summary.iface = iface;
    summary.avg_rx = rx.mean();
    summary.avg_tx = tx.mean();
    summary.p95_load = load.percentile(0.95);
    summary.p99_load = load.percentile(0.99);

    auto speed = scorer_.link_speed_mbps(iface);
    if (ifutil.any_above(0.0)) {
      summary.avg_ifutil = ifutil.mean();
    } else if (speed) {
      MetricSeries estimated;
      for (const Sample *sample : rows)
        estimated.add(Scoring::estimate_ifutil_pct(
            sample->get(Col::NET_RXKB).value_or(0.0),
            sample->get(Col::NET_TXKB).value_or(0.0), *speed));
      summary.avg_ifutil = estimated.mean();
      summary.ifutil_estimated = true;
    } else {
      summary.link_speed_unknown = true;
      section.warnings.push_back(
          "unknown link speed for interface " + iface +
          ": %ifutil=0.00, set IF_SPEED_Mbps_" + iface +
          "=... or IF_SPEED_Mbps=\"" + iface + "=...\"");
      LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_STATS,
          "No link speed for " << iface << ", excluded from load ranking");
    }
    section.interfaces.push_back(std::move(summary));
  }
  candidates += score_and_rank(*samples);
  return section;
}

// Streams that feed ranking only; each is scored whether or not any other
// report is present in the file
size_t
AnalysisEngine::collect_unsectioned_candidates(const std::string &path) {
  size_t produced = 0;
  for (Subsystem subsystem : {Subsystem::NET_ERROR, Subsystem::SOCKET,
                              Subsystem::TCP, Subsystem::IP})
    if (auto samples = load_samples(path, subsystem))
      produced += score_and_rank(*samples);
  return produced;
}

FileReport AnalysisEngine::analyze_file(const std::string &path) {
  FileReport report;
  report.path = path;

  report.cpu = build_cpu_section(path, report.candidates);
  report.memory = build_memory_section(path, report.candidates);
  report.disk = build_disk_section(path, report.candidates);
  report.network = build_network_section(path, report.candidates);
  report.candidates += collect_unsectioned_candidates(path);

  ++run_metrics_.files_analyzed;
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Analyzed " << path << ": " << report.candidates << " candidate(s)");
  return report;
}

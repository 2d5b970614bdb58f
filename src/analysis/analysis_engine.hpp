#ifndef ANALYSIS_ENGINE_HPP
#define ANALYSIS_ENGINE_HPP

#include "core/config.hpp"
#include "core/sample.hpp"
#include "detection/anomaly_scorer.hpp"
#include "detection/top_list.hpp"
#include "file_report.hpp"
#include "io/telemetry_source/base_telemetry_source.hpp"
#include "window_filter.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct EngineRunMetrics {
  size_t files_analyzed = 0;
  size_t streams_decoded = 0;
  size_t streams_absent = 0;
  size_t samples_extracted = 0;
  size_t candidates_offered = 0;
};

// Runs every report type of an activity file through
// source -> window filter -> extractor -> statistics/scorer -> ranker.
class AnalysisEngine {
public:
  AnalysisEngine(const Config::AppConfig &cfg, ITelemetrySource &source,
                 Ranker &ranker);

  FileReport analyze_file(const std::string &path);

  const analysis::Window &window() const { return window_; }
  const AnomalyScorer &scorer() const { return scorer_; }
  const EngineRunMetrics &run_metrics() const { return run_metrics_; }

  // Configured vCPU count, or the online CPUs of this host
  uint32_t resolve_vcpu_count() const;

private:
  Config::AppConfig app_config;
  ITelemetrySource &source_;
  Ranker &ranker_;
  analysis::Window window_;
  AnomalyScorer scorer_;
  EngineRunMetrics run_metrics_;

  // std::nullopt when the report is absent for this file
  std::optional<std::vector<Sample>> load_samples(const std::string &path,
                                                  Subsystem subsystem);
  size_t score_and_rank(const std::vector<Sample> &samples);

  CpuSection build_cpu_section(const std::string &path, size_t &candidates);
  MemorySection build_memory_section(const std::string &path,
                                     size_t &candidates);
  DiskSection build_disk_section(const std::string &path, size_t &candidates);
  NetworkSection build_network_section(const std::string &path,
                                       size_t &candidates);
  size_t collect_unsectioned_candidates(const std::string &path);
};

#endif // ANALYSIS_ENGINE_HPP

#include "analysis/analysis_engine.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "detection/top_list.hpp"
#include "io/activity_files.hpp"
#include "io/run_workspace.hpp"
#include "io/summary_writer.hpp"
#include "io/telemetry_source/base_telemetry_source.hpp"
#include "io/telemetry_source/csv_directory_telemetry_source.hpp"
#include "io/telemetry_source/sadf_telemetry_source.hpp"
#include "report/report_renderer.hpp"
#include "utils/json_formatter.hpp"
#include "utils/process_runner.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

extern char **environ;

namespace {

constexpr int EXIT_CONFIG_ERROR = 2;

Config::EnvironmentMap read_environment() {
  Config::EnvironmentMap env;
  for (char **entry = environ; entry && *entry; ++entry) {
    std::string kv(*entry);
    auto eq = kv.find('=');
    if (eq == std::string::npos)
      continue;
    env.emplace(kv.substr(0, eq), kv.substr(eq + 1));
  }
  return env;
}

std::unique_ptr<ITelemetrySource>
make_telemetry_source(const Config::AppConfig &cfg,
                      std::shared_ptr<const ProcessRunner> runner) {
  if (!cfg.decoder.csv_directory.empty()) {
    LOG(LogLevel::INFO, LogComponent::IO_SOURCE,
        "Reading exported streams from " << cfg.decoder.csv_directory);
    return std::make_unique<CsvDirectoryTelemetrySource>(
        cfg.decoder.csv_directory);
  }
  if (!ProcessRunner::command_exists(cfg.decoder.sadf_path))
    LOG(LogLevel::WARN, LogComponent::IO_DECODER,
        "Decoder '" << cfg.decoder.sadf_path
                    << "' not found, every report will be absent");
  return std::make_unique<SadfTelemetrySource>(cfg.decoder, std::move(runner));
}

void export_run_metrics(const Config::AppConfig &cfg,
                        const AnalysisEngine &engine, const Ranker &ranker,
                        double duration_seconds) {
  auto &registry = MetricsRegistry::instance();
  const auto &m = engine.run_metrics();

  registry
      .create_gauge("sar_auditor_files_analyzed",
                    "Activity files analyzed in the last run")
      .Set(static_cast<double>(m.files_analyzed));
  auto &streams = registry.create_gauge_family(
      "sar_auditor_streams", "Decoded report streams by outcome");
  streams.Add({{"outcome", "decoded"}})
      .Set(static_cast<double>(m.streams_decoded));
  streams.Add({{"outcome", "absent"}})
      .Set(static_cast<double>(m.streams_absent));
  registry
      .create_gauge("sar_auditor_samples_extracted",
                    "Samples extracted inside the analysis window")
      .Set(static_cast<double>(m.samples_extracted));
  registry
      .create_gauge("sar_auditor_candidates",
                    "Scored observations offered to the ranker")
      .Set(static_cast<double>(ranker.offered()));

  auto &hits = registry.create_counter_family(
      "sar_auditor_rule_hits_total", "Threshold rule hits by rule");
  for (const auto &[rule, count] : engine.scorer().rule_hit_counts())
    hits.Add({{"rule", rule}}).Increment(static_cast<double>(count));

  registry
      .create_gauge("sar_auditor_run_duration_seconds",
                    "Wall time of the last run")
      .Set(duration_seconds);
  registry
      .create_gauge("sar_auditor_last_run_timestamp_seconds",
                    "Unix time the last run finished")
      .SetToCurrentTime();

  if (!registry.write_textfile(cfg.output.metrics_textfile_path))
    LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
        "Run metrics were not exported");
}

void write_outputs(const Config::AppConfig &cfg, const Ranker &ranker,
                   const ProcessRunner &runner) {
  const std::filesystem::path audit_dir(cfg.audit_dir);

  const std::string summary_path =
      (audit_dir / cfg.output.summary_file_name).string();
  if (SummaryWriter::write_summary_file(summary_path, ranker.summary(),
                                        cfg.output.summary_max_lines))
    LOG(LogLevel::INFO, LogComponent::IO_OUTPUT,
        "Summary written to " << summary_path);

  if (!cfg.output.json_output_path.empty()) {
    if (Utils::create_directory_for_file(cfg.output.json_output_path)) {
      std::ofstream out(cfg.output.json_output_path, std::ios::trunc);
      out << JsonFormatter::format_ranking_to_json(ranker, cfg.top_n) << "\n";
      if (!out.good())
        LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
            "Failed writing JSON ranking to " << cfg.output.json_output_path);
    } else {
      LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
          "Cannot create directory for " << cfg.output.json_output_path);
    }
  }

  RunWorkspace workspace(cfg.output.clean_workspace);
  if (!workspace.valid())
    return;
  if (!workspace.write_ranking(ranker, cfg.top_n))
    LOG(LogLevel::WARN, LogComponent::IO_OUTPUT,
        "Run workspace is incomplete: " << workspace.path());
  if (cfg.output.archive_enabled &&
      !workspace.archive_to((audit_dir / cfg.output.archive_name).string(),
                            runner))
    LOG(LogLevel::WARN, LogComponent::IO_OUTPUT,
        "No archive was produced for this run");
}

} // namespace

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  if (argc > 2) {
    std::cerr << "Usage: " << argv[0] << " [config.ini]\n";
    return EXIT_CONFIG_ERROR;
  }

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  const std::string config_file_to_load = argc > 1 ? argv[1] : "";
  if (!config_manager.load_configuration(config_file_to_load,
                                         read_environment())) {
    std::cerr << "Configuration error:\n";
    for (const auto &error : config_manager.get_errors())
      std::cerr << "  - " << error << "\n";
    return EXIT_CONFIG_ERROR;
  }
  auto current_config = config_manager.get_config();
  const auto &cfg = *current_config;

  // --- Initialize Logging ---
  LogManager::instance().configure(cfg.logging);
  LOG(LogLevel::INFO, LogComponent::CORE, "sar auditor starting up");

  const auto run_started = std::chrono::steady_clock::now();
  auto runner = std::make_shared<const ProcessRunner>();
  auto source = make_telemetry_source(cfg, runner);
  Ranker ranker(cfg.top_n, cfg.output.summary_max_lines);

  try {
    AnalysisEngine engine(cfg, *source, ranker);
    ReportRenderer renderer(std::cout, cfg);
    renderer.render_header(engine.window());

    auto files = ActivityFiles::find_activity_files(cfg.activity_dirs,
                                                    cfg.max_files);
    if (files.empty()) {
      renderer.render_no_files();
      LOG(LogLevel::INFO, LogComponent::CORE, "No activity files, done");
      return 0;
    }
    if (cfg.debug)
      renderer.render_file_list(files);

    for (const auto &file : files)
      renderer.render_file(engine.analyze_file(file));

    renderer.render_top_blocks(ranker);
    if (cfg.output.inventory_enabled)
      renderer.render_inventory(*runner);
    renderer.render_done();
    std::cout.flush();

    write_outputs(cfg, ranker, *runner);

    if (!cfg.output.metrics_textfile_path.empty()) {
      std::chrono::duration<double> elapsed =
          std::chrono::steady_clock::now() - run_started;
      export_run_metrics(cfg, engine, ranker, elapsed.count());
    }
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Run aborted: " << e.what());
    return 1;
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "sar auditor finished, " << ranker.offered() << " candidate(s) ranked");
  return 0;
}

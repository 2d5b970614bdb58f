#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *WINDOW_START = "window_start";
constexpr const char *WINDOW_END = "window_end";
constexpr const char *MAX_FILES = "max_files";
constexpr const char *TOP_N = "top_n";
constexpr const char *DEBUG = "debug";
constexpr const char *ACTIVITY_DIRS = "activity_dirs";
constexpr const char *AUDIT_DIR = "audit_dir";
constexpr const char *CLEAN_WORKSPACE = "clean_workspace";

// Threshold Settings
constexpr const char *TH_CPU_BUSY_PCT = "cpu_busy_pct";
constexpr const char *TH_CPU_IOWAIT_WARN = "cpu_iowait_warn";
constexpr const char *TH_CPU_STEAL_WARN = "cpu_steal_warn";
constexpr const char *TH_RUNQ_FACTOR = "runq_factor";
constexpr const char *TH_VCPU_COUNT = "vcpu_count";
constexpr const char *TH_MEM_USED_WARN = "mem_used_warn";
constexpr const char *TH_MEM_AVAIL_MIN_KB = "mem_avail_min_kb";
constexpr const char *TH_DISK_AWAIT_WARN = "disk_await_warn";
constexpr const char *TH_DISK_AWAIT_SPIKE = "disk_await_spike";
constexpr const char *TH_DISK_UTIL_WARN = "disk_util_warn";
constexpr const char *TH_DISK_UTIL_SPIKE = "disk_util_spike";
constexpr const char *TH_DISK_AQU_SPIKE = "disk_aqu_spike";
constexpr const char *TH_IFUTIL_WARN = "ifutil_warn";
constexpr const char *TH_NET_ERR_MIN = "net_err_min";

// Network Settings
constexpr const char *NET_INCLUDE_LOOPBACK = "include_loopback";
constexpr const char *NET_IF_SPEED_MBPS = "if_speed_mbps";
constexpr const char *NET_SPEED_PREFIX = "speed.";

// Decoder Settings
constexpr const char *DEC_SADF_PATH = "sadf_path";
constexpr const char *DEC_TIMEOUT_SECONDS = "timeout_seconds";
constexpr const char *DEC_CSV_DIRECTORY = "csv_directory";

// Output Settings
constexpr const char *OUT_SUMMARY_FILE_NAME = "summary_file_name";
constexpr const char *OUT_SUMMARY_MAX_LINES = "summary_max_lines";
constexpr const char *OUT_ARCHIVE_ENABLED = "archive_enabled";
constexpr const char *OUT_ARCHIVE_NAME = "archive_name";
constexpr const char *OUT_JSON_OUTPUT_PATH = "json_output_path";
constexpr const char *OUT_METRICS_TEXTFILE_PATH = "metrics_textfile_path";
constexpr const char *OUT_INVENTORY_ENABLED = "inventory_enabled";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

// Environment variable names understood on top of the INI file
namespace Env {
constexpr const char *START = "START";
constexpr const char *END = "END";
constexpr const char *MAX_FILES = "MAX_FILES";
constexpr const char *TOPN = "TOPN";
constexpr const char *DEBUG = "DEBUG";
constexpr const char *INCLUDE_LO = "INCLUDE_LO";
constexpr const char *SA_DIRS = "SA_DIRS";
constexpr const char *AUDIT_DIR = "AUDIT_DIR";
constexpr const char *CLEAN_TMP = "CLEAN_TMP";
constexpr const char *HOME = "HOME";
constexpr const char *IF_SPEED_MBPS = "IF_SPEED_Mbps";
constexpr const char *IF_SPEED_MBPS_PREFIX = "IF_SPEED_Mbps_";
constexpr const char *SADF_PATH = "SADF_PATH";
constexpr const char *DECODER_TIMEOUT = "DECODER_TIMEOUT";
constexpr const char *VCPU_COUNT = "VCPU_COUNT";
} // namespace Env

using EnvironmentMap = std::map<std::string, std::string>;

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct ThresholdConfig {
  double cpu_busy_pct = 75.0;
  double cpu_iowait_warn = 5.0;
  double cpu_steal_warn = 1.0;
  double runq_factor = 1.0;
  uint32_t vcpu_count = 0; // 0 = online CPUs of this host

  double mem_used_warn = 80.0;
  double mem_avail_min_kb = 1048576.0; // 1 GiB

  double disk_await_warn = 20.0; // ms
  double disk_await_spike = 50.0;
  double disk_util_warn = 70.0;
  double disk_util_spike = 90.0;
  double disk_aqu_spike = 5.0;

  double ifutil_warn = 70.0;
  double net_err_min = 0.0;
};

struct NetworkConfig {
  bool include_loopback = false;
  // Interface name -> link speed in Mbps
  std::map<std::string, double> link_speed_mbps;
};

struct DecoderConfig {
  std::string sadf_path = "sadf";
  uint32_t timeout_seconds = 60;
  // When set, decoded streams are read from <dir>/<file>.<report>.csv
  std::string csv_directory;
};

struct OutputConfig {
  std::string summary_file_name = "sar_summary.log";
  size_t summary_max_lines = 400;
  bool archive_enabled = true;
  std::string archive_name = "sar.tgz";
  bool clean_workspace = true;
  std::string json_output_path;
  std::string metrics_textfile_path;
  bool inventory_enabled = true;
};

struct AppConfig {
  std::string window_start = "08:00:00";
  std::string window_end = "19:00:00";
  size_t max_files = 4;
  size_t top_n = 20;
  bool debug = false;
  std::vector<std::string> activity_dirs = {"/var/log/sa", "/var/log/sysstat"};
  std::string audit_dir;

  ThresholdConfig thresholds;
  NetworkConfig network;
  DecoderConfig decoder;
  OutputConfig output;
  LoggingConfig logging;

  AppConfig() = default;
};

// "eth0=1000,ens18=1000" -> {eth0: 1000, ens18: 1000}
bool parse_link_speed_map(const std::string &text,
                          std::map<std::string, double> &speeds,
                          std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config,
                       std::vector<std::string> &errors);
void apply_environment_overrides(const EnvironmentMap &env, AppConfig &config,
                                 std::vector<std::string> &errors);

// Validation functions for configuration parameters
bool validate_threshold_config(const ThresholdConfig &config,
                               std::vector<std::string> &errors);
bool validate_network_config(const NetworkConfig &config,
                             std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

class ConfigManager {
public:
  ConfigManager() = default;
  // An empty filepath skips the INI file; defaults plus environment apply.
  bool load_configuration(const std::string &filepath,
                          const EnvironmentMap &env = {});
  std::shared_ptr<const AppConfig> get_config() const;
  const std::vector<std::string> &get_errors() const { return errors_; }

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  std::vector<std::string> errors_;
};

} // namespace Config

#endif // CONFIG_HPP

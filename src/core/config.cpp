#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.source", LogComponent::IO_SOURCE},
    {"io.decoder", LogComponent::IO_DECODER},
    {"io.output", LogComponent::IO_OUTPUT},
    {"analysis.window", LogComponent::ANALYSIS_WINDOW},
    {"analysis.extract", LogComponent::ANALYSIS_EXTRACT},
    {"analysis.stats", LogComponent::ANALYSIS_STATS},
    {"rules.scoring", LogComponent::RULES_SCORING},
    {"rules.ranking", LogComponent::RULES_RANKING},
    {"report", LogComponent::REPORT}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

namespace {

// Parses `value` into `target`, recording a message on failure so that a
// bad threshold is reported at startup instead of silently defaulting.
template <typename T>
void assign_number(const std::string &key, const std::string &value, T &target,
                   std::vector<std::string> &errors) {
  std::string trimmed = Utils::trim_copy(value);
  auto parsed = trimmed.empty() ? std::nullopt
                                : Utils::string_to_number<T>(trimmed);
  if (parsed)
    target = *parsed;
  else
    errors.push_back("Invalid numeric value for '" + key + "': '" + value +
                     "'");
}

std::vector<std::string> parse_dir_list(const std::string &value) {
  std::vector<std::string> dirs;
  for (const auto &item : Utils::split_string(value, ',')) {
    std::string dir = Utils::trim_copy(item);
    if (!dir.empty())
      dirs.push_back(dir);
  }
  return dirs;
}

void set_default_log_levels(LoggingConfig &logging) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

} // namespace

bool parse_link_speed_map(const std::string &text,
                          std::map<std::string, double> &speeds,
                          std::vector<std::string> &errors) {
  bool valid = true;
  for (const auto &entry_raw : Utils::split_string(text, ',')) {
    std::string entry = Utils::trim_copy(entry_raw);
    if (entry.empty())
      continue;

    size_t eq = entry.find('=');
    if (eq == std::string::npos) {
      errors.push_back("Link speed entry '" + entry +
                       "' must look like iface=Mbps");
      valid = false;
      continue;
    }
    std::string iface = Utils::trim_copy(entry.substr(0, eq));
    std::string speed_str = Utils::trim_copy(entry.substr(eq + 1));
    auto speed = Utils::string_to_number<double>(speed_str);
    if (iface.empty() || speed_str.empty() || !speed) {
      errors.push_back("Link speed entry '" + entry +
                       "' must look like iface=Mbps");
      valid = false;
      continue;
    }
    // First mention of an interface wins, later duplicates are ignored
    speeds.emplace(iface, *speed);
  }
  return valid;
}

bool validate_threshold_config(const ThresholdConfig &config,
                               std::vector<std::string> &errors) {
  bool valid = true;

  auto check_percent = [&](double value, const char *name) {
    if (value < 0.0 || value > 100.0) {
      errors.push_back(std::string("Threshold ") + name +
                       " must be between 0 and 100");
      valid = false;
    }
  };
  auto check_non_negative = [&](double value, const char *name) {
    if (value < 0.0) {
      errors.push_back(std::string("Threshold ") + name +
                       " must not be negative");
      valid = false;
    }
  };

  check_percent(config.cpu_busy_pct, Keys::TH_CPU_BUSY_PCT);
  check_percent(config.cpu_iowait_warn, Keys::TH_CPU_IOWAIT_WARN);
  check_percent(config.cpu_steal_warn, Keys::TH_CPU_STEAL_WARN);
  check_percent(config.mem_used_warn, Keys::TH_MEM_USED_WARN);
  check_percent(config.disk_util_warn, Keys::TH_DISK_UTIL_WARN);
  check_percent(config.disk_util_spike, Keys::TH_DISK_UTIL_SPIKE);
  check_percent(config.ifutil_warn, Keys::TH_IFUTIL_WARN);

  check_non_negative(config.mem_avail_min_kb, Keys::TH_MEM_AVAIL_MIN_KB);
  check_non_negative(config.disk_await_warn, Keys::TH_DISK_AWAIT_WARN);
  check_non_negative(config.disk_await_spike, Keys::TH_DISK_AWAIT_SPIKE);
  check_non_negative(config.disk_aqu_spike, Keys::TH_DISK_AQU_SPIKE);
  check_non_negative(config.net_err_min, Keys::TH_NET_ERR_MIN);

  if (config.runq_factor <= 0.0) {
    errors.push_back("Threshold runq_factor must be greater than 0");
    valid = false;
  }

  return valid;
}

bool validate_network_config(const NetworkConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;
  for (const auto &[iface, speed] : config.link_speed_mbps) {
    if (speed <= 0.0) {
      errors.push_back("Link speed for interface " + iface +
                       " must be greater than 0 Mbps");
      valid = false;
    }
  }
  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!Utils::parse_time_of_day(config.window_start)) {
    errors.push_back("Window start '" + config.window_start +
                     "' must be HH:MM or HH:MM:SS");
    valid = false;
  }
  if (!Utils::parse_time_of_day(config.window_end)) {
    errors.push_back("Window end '" + config.window_end +
                     "' must be HH:MM or HH:MM:SS");
    valid = false;
  }

  if (config.max_files < 1) {
    errors.push_back("max_files must be at least 1");
    valid = false;
  }

  if (config.top_n < 1) {
    errors.push_back("top_n must be at least 1");
    valid = false;
  }

  if (config.activity_dirs.empty()) {
    errors.push_back("At least one activity directory is required");
    valid = false;
  }

  if (!validate_threshold_config(config.thresholds, errors))
    valid = false;

  if (!validate_network_config(config.network, errors))
    valid = false;

  if (config.decoder.timeout_seconds < 1 ||
      config.decoder.timeout_seconds > 3600) {
    errors.push_back("Decoder timeout must be between 1 and 3600 seconds");
    valid = false;
  }

  if (config.decoder.sadf_path.empty() && config.decoder.csv_directory.empty()) {
    errors.push_back("Either sadf_path or csv_directory must be set");
    valid = false;
  }

  if (config.output.summary_max_lines < 1) {
    errors.push_back("summary_max_lines must be at least 1");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config,
                       std::vector<std::string> &errors) {
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    errors.push_back("Could not open config file '" + filepath + "'");
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // Global (non-section) keys
    if (current_section.empty()) {
      if (key == Keys::WINDOW_START)
        config.window_start = value;
      else if (key == Keys::WINDOW_END)
        config.window_end = value;
      else if (key == Keys::MAX_FILES)
        assign_number(key, value, config.max_files, errors);
      else if (key == Keys::TOP_N)
        assign_number(key, value, config.top_n, errors);
      else if (key == Keys::DEBUG)
        config.debug = string_to_bool(value);
      else if (key == Keys::ACTIVITY_DIRS)
        config.activity_dirs = parse_dir_list(value);
      else if (key == Keys::AUDIT_DIR)
        config.audit_dir = value;
      else if (key == Keys::CLEAN_WORKSPACE)
        config.output.clean_workspace = string_to_bool(value);
      else
        std::cerr << "Warning (Config Line " << line_num
                  << "): Unknown setting '" << key << "'" << std::endl;

      // Threshold settings
    } else if (current_section == "Thresholds") {
      ThresholdConfig &th = config.thresholds;
      if (key == Keys::TH_CPU_BUSY_PCT)
        assign_number(key, value, th.cpu_busy_pct, errors);
      else if (key == Keys::TH_CPU_IOWAIT_WARN)
        assign_number(key, value, th.cpu_iowait_warn, errors);
      else if (key == Keys::TH_CPU_STEAL_WARN)
        assign_number(key, value, th.cpu_steal_warn, errors);
      else if (key == Keys::TH_RUNQ_FACTOR)
        assign_number(key, value, th.runq_factor, errors);
      else if (key == Keys::TH_VCPU_COUNT)
        assign_number(key, value, th.vcpu_count, errors);
      else if (key == Keys::TH_MEM_USED_WARN)
        assign_number(key, value, th.mem_used_warn, errors);
      else if (key == Keys::TH_MEM_AVAIL_MIN_KB)
        assign_number(key, value, th.mem_avail_min_kb, errors);
      else if (key == Keys::TH_DISK_AWAIT_WARN)
        assign_number(key, value, th.disk_await_warn, errors);
      else if (key == Keys::TH_DISK_AWAIT_SPIKE)
        assign_number(key, value, th.disk_await_spike, errors);
      else if (key == Keys::TH_DISK_UTIL_WARN)
        assign_number(key, value, th.disk_util_warn, errors);
      else if (key == Keys::TH_DISK_UTIL_SPIKE)
        assign_number(key, value, th.disk_util_spike, errors);
      else if (key == Keys::TH_DISK_AQU_SPIKE)
        assign_number(key, value, th.disk_aqu_spike, errors);
      else if (key == Keys::TH_IFUTIL_WARN)
        assign_number(key, value, th.ifutil_warn, errors);
      else if (key == Keys::TH_NET_ERR_MIN)
        assign_number(key, value, th.net_err_min, errors);

      // Network settings
    } else if (current_section == "Network") {
      if (key == Keys::NET_INCLUDE_LOOPBACK)
        config.network.include_loopback = string_to_bool(value);
      else if (key == Keys::NET_IF_SPEED_MBPS)
        parse_link_speed_map(value, config.network.link_speed_mbps, errors);
      else if (key.rfind(Keys::NET_SPEED_PREFIX, 0) == 0) {
        std::string iface = key.substr(std::string(Keys::NET_SPEED_PREFIX).size());
        double speed = 0.0;
        assign_number(key, value, speed, errors);
        if (!iface.empty())
          config.network.link_speed_mbps[iface] = speed;
      }

      // Decoder settings
    } else if (current_section == "Decoder") {
      if (key == Keys::DEC_SADF_PATH)
        config.decoder.sadf_path = value;
      else if (key == Keys::DEC_TIMEOUT_SECONDS)
        assign_number(key, value, config.decoder.timeout_seconds, errors);
      else if (key == Keys::DEC_CSV_DIRECTORY)
        config.decoder.csv_directory = value;

      // Output settings
    } else if (current_section == "Output") {
      if (key == Keys::OUT_SUMMARY_FILE_NAME)
        config.output.summary_file_name = value;
      else if (key == Keys::OUT_SUMMARY_MAX_LINES)
        assign_number(key, value, config.output.summary_max_lines, errors);
      else if (key == Keys::OUT_ARCHIVE_ENABLED)
        config.output.archive_enabled = string_to_bool(value);
      else if (key == Keys::OUT_ARCHIVE_NAME)
        config.output.archive_name = value;
      else if (key == Keys::OUT_JSON_OUTPUT_PATH)
        config.output.json_output_path = value;
      else if (key == Keys::OUT_METRICS_TEXTFILE_PATH)
        config.output.metrics_textfile_path = value;
      else if (key == Keys::OUT_INVENTORY_ENABLED)
        config.output.inventory_enabled = string_to_bool(value);

      // Logging settings
    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = level;
      } else {
        auto it = key_to_component_map.find(Utils::to_lower_copy(key));
        if (it != key_to_component_map.end())
          config.logging.log_levels[it->second] = string_to_log_level(value);
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown logging component '" << key << "'"
                    << std::endl;
      }
    }
  }

  return true;
}

void apply_environment_overrides(const EnvironmentMap &env, AppConfig &config,
                                 std::vector<std::string> &errors) {
  auto lookup = [&env](const char *name) -> const std::string * {
    auto it = env.find(name);
    return it == env.end() ? nullptr : &it->second;
  };

  if (auto v = lookup(Env::START))
    config.window_start = Utils::trim_copy(*v);
  if (auto v = lookup(Env::END))
    config.window_end = Utils::trim_copy(*v);
  if (auto v = lookup(Env::MAX_FILES))
    assign_number(Env::MAX_FILES, *v, config.max_files, errors);
  if (auto v = lookup(Env::TOPN))
    assign_number(Env::TOPN, *v, config.top_n, errors);
  if (auto v = lookup(Env::DEBUG))
    config.debug = string_to_bool(*v);
  if (auto v = lookup(Env::INCLUDE_LO))
    config.network.include_loopback = string_to_bool(*v);
  if (auto v = lookup(Env::SA_DIRS))
    config.activity_dirs = parse_dir_list(*v);
  if (auto v = lookup(Env::AUDIT_DIR))
    config.audit_dir = *v;
  if (auto v = lookup(Env::CLEAN_TMP))
    config.output.clean_workspace = string_to_bool(*v);
  if (auto v = lookup(Env::SADF_PATH))
    config.decoder.sadf_path = *v;
  if (auto v = lookup(Env::DECODER_TIMEOUT))
    assign_number(Env::DECODER_TIMEOUT, *v, config.decoder.timeout_seconds,
                  errors);
  if (auto v = lookup(Env::VCPU_COUNT))
    assign_number(Env::VCPU_COUNT, *v, config.thresholds.vcpu_count, errors);

  const std::pair<const char *, double *> threshold_vars[] = {
      {"CPU_BUSY_PCT", &config.thresholds.cpu_busy_pct},
      {"CPU_IOWAIT_WARN", &config.thresholds.cpu_iowait_warn},
      {"CPU_STEAL_WARN", &config.thresholds.cpu_steal_warn},
      {"RUNQ_FACTOR", &config.thresholds.runq_factor},
      {"MEM_USED_WARN", &config.thresholds.mem_used_warn},
      {"MEM_AVAIL_MIN_KB", &config.thresholds.mem_avail_min_kb},
      {"DISK_AWAIT_WARN", &config.thresholds.disk_await_warn},
      {"DISK_AWAIT_SPIKE", &config.thresholds.disk_await_spike},
      {"DISK_UTIL_WARN", &config.thresholds.disk_util_warn},
      {"DISK_UTIL_SPIKE", &config.thresholds.disk_util_spike},
      {"DISK_AQU_SPIKE", &config.thresholds.disk_aqu_spike},
      {"IFUTIL_WARN", &config.thresholds.ifutil_warn},
      {"NET_ERR_MIN", &config.thresholds.net_err_min}};
  for (const auto &[name, target] : threshold_vars)
    if (auto v = lookup(name))
      assign_number(name, *v, *target, errors);

  // Per-interface overrides (IF_SPEED_Mbps_eth0=1000) take precedence over
  // the list form, which in turn overrides the INI file.
  if (auto v = lookup(Env::IF_SPEED_MBPS)) {
    std::map<std::string, double> speeds;
    parse_link_speed_map(*v, speeds, errors);
    for (const auto &[iface, speed] : speeds)
      config.network.link_speed_mbps[iface] = speed;
  }
  const std::string prefix = Env::IF_SPEED_MBPS_PREFIX;
  for (const auto &[name, value] : env) {
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0)
      continue;
    double speed = 0.0;
    assign_number(name, value, speed, errors);
    config.network.link_speed_mbps[name.substr(prefix.size())] = speed;
  }

  if (config.audit_dir.empty()) {
    auto home = lookup(Env::HOME);
    config.audit_dir = (home && !home->empty()) ? *home + "/audit" : "audit";
  }

  if (config.debug)
    for (auto &pair : config.logging.log_levels)
      pair.second = std::min(pair.second, LogLevel::DEBUG);
}

bool ConfigManager::load_configuration(const std::string &filepath,
                                       const EnvironmentMap &env) {
  config_filepath_ = filepath;
  errors_.clear();
  auto new_config = std::make_shared<AppConfig>();
  set_default_log_levels(new_config->logging);

  if (!filepath.empty()) {
    LOG(LogLevel::INFO, LogComponent::CONFIG,
        "Loading configuration from " << filepath);
    if (!parse_config_into(filepath, *new_config, errors_))
      return false;
  }

  apply_environment_overrides(env, *new_config, errors_);

  // A link speed of 0 leaves the interface unconfigured
  auto &speeds = new_config->network.link_speed_mbps;
  for (auto it = speeds.begin(); it != speeds.end();)
    it = it->second == 0.0 ? speeds.erase(it) : std::next(it);

  // Validate the configuration
  if (!validate_app_config(*new_config, errors_) || !errors_.empty())
    return false;

  current_config_ = new_config;
  LOG(LogLevel::DEBUG, LogComponent::CONFIG,
      "Configuration validated: window " << current_config_->window_start
                                         << "-" << current_config_->window_end
                                         << ", max_files "
                                         << current_config_->max_files
                                         << ", top_n "
                                         << current_config_->top_n);
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  return current_config_;
}

} // namespace Config

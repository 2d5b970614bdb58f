#ifndef SAMPLE_HPP
#define SAMPLE_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

// One decoder report type per subsystem. Swap, Paging, Load and
// ContextSwitch only feed averages and warnings; they are never ranked.
enum class Subsystem {
  CPU,
  MEMORY,
  SWAP,
  PAGING,
  LOAD,
  CONTEXT_SWITCH,
  DISK,
  NET_DEVICE,
  NET_ERROR,
  SOCKET,
  TCP,
  IP
};

const char *subsystem_to_string(Subsystem subsystem);

// Short stable key, used in file names ("cpu", "netload", ...)
const char *subsystem_key(Subsystem subsystem);

// sadf report options after "--" for this subsystem
std::vector<std::string> sadf_report_options(Subsystem subsystem);

// Subsystems that own a Top-K list, in report order
const std::vector<Subsystem> &ranked_subsystems();

struct Sample {
  std::string timestamp; // "YYYY-MM-DD HH:MM:SS UTC"
  Subsystem subsystem = Subsystem::CPU;
  std::string resource_key; // CPU id, DEV, IFACE; empty for whole-system
  // Only columns present in the header; a missing key is "not available"
  std::map<std::string, double> fields;

  std::optional<double> get(const std::string &column) const {
    auto it = fields.find(column);
    if (it == fields.end())
      return std::nullopt;
    return it->second;
  }

  bool has(const std::string &column) const {
    return fields.find(column) != fields.end();
  }
};

#endif // SAMPLE_HPP

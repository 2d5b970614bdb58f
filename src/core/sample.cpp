#include "sample.hpp"

#include <string>
#include <vector>

const char *subsystem_to_string(Subsystem subsystem) {
  switch (subsystem) {
  case Subsystem::CPU:
    return "CPU";
  case Subsystem::MEMORY:
    return "Memory";
  case Subsystem::SWAP:
    return "Swap";
  case Subsystem::PAGING:
    return "Paging";
  case Subsystem::LOAD:
    return "Load";
  case Subsystem::CONTEXT_SWITCH:
    return "ContextSwitch";
  case Subsystem::DISK:
    return "Disk";
  case Subsystem::NET_DEVICE:
    return "NetDevice";
  case Subsystem::NET_ERROR:
    return "NetError";
  case Subsystem::SOCKET:
    return "Socket";
  case Subsystem::TCP:
    return "TCP";
  case Subsystem::IP:
    return "IP";
  }
  return "UNKNOWN_SUBSYSTEM";
}

const char *subsystem_key(Subsystem subsystem) {
  switch (subsystem) {
  case Subsystem::CPU:
    return "cpu";
  case Subsystem::MEMORY:
    return "mem";
  case Subsystem::SWAP:
    return "swap";
  case Subsystem::PAGING:
    return "paging";
  case Subsystem::LOAD:
    return "load";
  case Subsystem::CONTEXT_SWITCH:
    return "cswch";
  case Subsystem::DISK:
    return "disk";
  case Subsystem::NET_DEVICE:
    return "netload";
  case Subsystem::NET_ERROR:
    return "neterr";
  case Subsystem::SOCKET:
    return "sock";
  case Subsystem::TCP:
    return "tcp";
  case Subsystem::IP:
    return "ip";
  }
  return "unknown";
}

std::vector<std::string> sadf_report_options(Subsystem subsystem) {
  switch (subsystem) {
  case Subsystem::CPU:
    return {"-u"};
  case Subsystem::MEMORY:
    return {"-r"};
  case Subsystem::SWAP:
    return {"-S"};
  case Subsystem::PAGING:
    return {"-B"};
  case Subsystem::LOAD:
    return {"-q"};
  case Subsystem::CONTEXT_SWITCH:
    return {"-w"};
  case Subsystem::DISK:
    return {"-d"};
  case Subsystem::NET_DEVICE:
    return {"-n", "DEV"};
  case Subsystem::NET_ERROR:
    return {"-n", "EDEV"};
  case Subsystem::SOCKET:
    return {"-n", "SOCK"};
  case Subsystem::TCP:
    // retrans/s and the input error counter live in the ETCP table
    return {"-n", "TCP,ETCP"};
  case Subsystem::IP:
    return {"-n", "IP"};
  }
  return {};
}

const std::vector<Subsystem> &ranked_subsystems() {
  static const std::vector<Subsystem> order = {
      Subsystem::CPU,        Subsystem::MEMORY,    Subsystem::DISK,
      Subsystem::NET_DEVICE, Subsystem::NET_ERROR, Subsystem::SOCKET,
      Subsystem::TCP,        Subsystem::IP};
  return order;
}

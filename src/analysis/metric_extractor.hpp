#ifndef METRIC_EXTRACTOR_HPP
#define METRIC_EXTRACTOR_HPP

#include "core/sample.hpp"

#include <optional>
#include <string>
#include <vector>

namespace analysis {

namespace Columns {
constexpr const char *TIMESTAMP = "timestamp";

constexpr const char *CPU = "CPU";
constexpr const char *CPU_USER = "%user";
constexpr const char *CPU_SYSTEM = "%system";
constexpr const char *CPU_IOWAIT = "%iowait";
constexpr const char *CPU_STEAL = "%steal";
constexpr const char *CPU_IDLE = "%idle";

constexpr const char *MEM_USED_PCT = "%memused";
constexpr const char *MEM_KBAVAIL = "kbavail";
constexpr const char *SWAP_USED_PCT = "%swpused";
constexpr const char *PGSCAN = "pgscan/s";
constexpr const char *PGSTEAL = "pgsteal/s";
constexpr const char *PGSCAN_KSWAPD = "pgscank/s";
constexpr const char *PGSCAN_DIRECT = "pgscand/s";

constexpr const char *RUNQ_SZ = "runq-sz";
constexpr const char *LDAVG_1 = "ldavg-1";
constexpr const char *LDAVG_5 = "ldavg-5";
constexpr const char *LDAVG_15 = "ldavg-15";
constexpr const char *CSWCH = "cswch/s";

constexpr const char *DEV = "DEV";
constexpr const char *DISK_AWAIT = "await";
constexpr const char *DISK_UTIL = "%util";
constexpr const char *DISK_AQU_SZ = "aqu-sz";

constexpr const char *IFACE = "IFACE";
constexpr const char *NET_RXKB = "rxkB/s";
constexpr const char *NET_TXKB = "txkB/s";
constexpr const char *NET_IFUTIL = "%ifutil";
constexpr const char *NET_RXERR = "rxerr/s";
constexpr const char *NET_TXERR = "txerr/s";
constexpr const char *NET_RXDROP = "rxdrop/s";
constexpr const char *NET_TXDROP = "txdrop/s";

constexpr const char *SOCK_TOTAL = "totsck";
constexpr const char *SOCK_TCP = "tcpsck";
constexpr const char *SOCK_UDP = "udpsck";
constexpr const char *SOCK_TCP_TW = "tcp-tw";

constexpr const char *TCP_ACTIVE = "active/s";
constexpr const char *TCP_PASSIVE = "passive/s";
constexpr const char *TCP_RETRANS = "retrans/s";
constexpr const char *TCP_ESTAB = "estab";
constexpr const char *TCP_INERR = "inerr";

constexpr const char *IP_IREC = "irec/s";
constexpr const char *IP_IDEL = "idel/s";
constexpr const char *IP_IREJ = "irej/s";
} // namespace Columns

// Numeric columns understood for a subsystem, by canonical name
const std::vector<std::string> &declared_columns(Subsystem subsystem);

// Column naming the resource of a row (CPU, DEV, IFACE), if any
std::optional<std::string> resource_column(Subsystem subsystem);

// Older sysstat names accepted for a canonical column
std::vector<std::string> column_aliases(const std::string &canonical);

// "-1" (sadf) and "all" (sar) both denote the whole-system CPU row
bool is_cpu_aggregate(const std::string &cpu_id);

/**
 * Turns a windowed, header-first decoded stream into Samples.
 *
 * Every field is resolved by name against the most recent header row, so
 * column order and optional columns may differ between sysstat versions.
 * Rows sharing a timestamp and resource are merged, which joins tables
 * decoded together (TCP and ETCP). Empty or non-numeric values read as 0.
 */
class MetricExtractor {
public:
  MetricExtractor(Subsystem subsystem, bool include_loopback);

  std::vector<Sample> extract(const std::vector<std::string> &lines) const;

private:
  Subsystem subsystem_;
  bool include_loopback_;
};

} // namespace analysis

#endif // METRIC_EXTRACTOR_HPP

#ifndef SCORING_HPP
#define SCORING_HPP

namespace Scoring {

// Points per triggered rule, on one severity-per-point scale for all
// subsystems
namespace Weights {
constexpr int CPU_BUSY = 2;
constexpr int CPU_IOWAIT = 2;
constexpr int CPU_STEAL = 3;
constexpr int RUNQ_PRESSURE = 2;

constexpr int MEM_USED = 2;
constexpr int MEM_AVAIL_LOW = 3;

constexpr int DISK_AWAIT_SPIKE = 3;
constexpr int DISK_UTIL_SPIKE = 3;
constexpr int DISK_AQU_SPIKE = 2;

constexpr int NET_IFUTIL = 2;
constexpr int NET_ERRORS = 3;
constexpr int NET_DROPS = 2;

constexpr int SOCK_TIME_WAIT = 1;

constexpr int TCP_RETRANS = 4;
constexpr int TCP_INERR = 4;
constexpr int TCP_ACTIVITY = 1;

constexpr int IP_REJECTED = 3;
constexpr int IP_BUSY_DELIVERY = 1;
} // namespace Weights

// irec/s above which a delivering IP stack counts as busy
constexpr double IP_BUSY_IREC_PER_SEC = 1000.0;

// Link utilization from throughput when the kernel could not report it:
// 100 * (rx + tx) kB/s * 1024 * 8 / (speed Mbps * 1e6)
inline double estimate_ifutil_pct(double rx_kbps, double tx_kbps,
                                  double speed_mbps) {
  if (speed_mbps <= 0.0)
    return 0.0;
  return 100.0 * (rx_kbps + tx_kbps) * 1024.0 * 8.0 / (speed_mbps * 1e6);
}

} // namespace Scoring

#endif // SCORING_HPP

#include "anomaly_scorer.hpp"
#include "analysis/metric_extractor.hpp"
#include "core/logger.hpp"
#include "rules/scoring.hpp"
#include "utils/utils.hpp"

#include <sstream>
#include <string>

namespace Col = analysis::Columns;

namespace {

using Utils::format_fixed;

// Missing fields render as 0 but never trigger a rule
double value_or_zero(const Sample &sample, const char *column) {
  return sample.get(column).value_or(0.0);
}

std::string whole(const Sample &sample, const char *column) {
  return std::to_string(static_cast<int>(value_or_zero(sample, column)));
}

bool above(const Sample &sample, const char *column, double threshold) {
  auto v = sample.get(column);
  return v && *v > threshold;
}

bool at_least(const Sample &sample, const char *column, double threshold) {
  auto v = sample.get(column);
  return v && *v >= threshold;
}

} // namespace

AnomalyScorer::AnomalyScorer(const Config::AppConfig &cfg)
    : thresholds_(cfg.thresholds), network_(cfg.network) {}

int AnomalyScorer::apply(bool triggered, int weight, const char *rule_name) {
  if (!triggered)
    return 0;
  ++rule_hit_counts_[rule_name];
  return weight;
}

std::optional<Candidate> AnomalyScorer::score(const Sample &sample) {
  ++samples_scored_;
  std::optional<Candidate> result;
  switch (sample.subsystem) {
  case Subsystem::CPU:
    result = check_cpu_rules(sample);
    break;
  case Subsystem::MEMORY:
    result = check_memory_rules(sample);
    break;
  case Subsystem::DISK:
    result = check_disk_rules(sample);
    break;
  case Subsystem::NET_DEVICE:
    result = check_net_load_rules(sample);
    break;
  case Subsystem::NET_ERROR:
    result = check_net_error_rules(sample);
    break;
  case Subsystem::SOCKET:
    result = check_socket_rules(sample);
    break;
  case Subsystem::TCP:
    result = check_tcp_rules(sample);
    break;
  case Subsystem::IP:
    result = check_ip_rules(sample);
    break;
  default:
    // Swap, paging, load and context switches only feed section summaries
    break;
  }

  if (result)
    LOG(LogLevel::TRACE, LogComponent::RULES_SCORING,
        subsystem_to_string(sample.subsystem)
            << " candidate score=" << result->score << " at "
            << result->timestamp << ": " << result->description);
  return result;
}

std::optional<double>
AnomalyScorer::link_speed_mbps(const std::string &iface) const {
  auto it = network_.link_speed_mbps.find(iface);
  if (it == network_.link_speed_mbps.end() || it->second <= 0.0)
    return std::nullopt;
  return it->second;
}

std::optional<Candidate> AnomalyScorer::check_cpu_rules(const Sample &sample) {
  if (!sample.resource_key.empty() &&
      !analysis::is_cpu_aggregate(sample.resource_key))
    return std::nullopt;

  std::optional<double> busy;
  if (sample.has(Col::CPU_USER) || sample.has(Col::CPU_SYSTEM))
    busy = value_or_zero(sample, Col::CPU_USER) +
           value_or_zero(sample, Col::CPU_SYSTEM);

  int score = 0;
  score += apply(busy && *busy > thresholds_.cpu_busy_pct,
                 Scoring::Weights::CPU_BUSY, "cpu_busy");
  score += apply(above(sample, Col::CPU_IOWAIT, thresholds_.cpu_iowait_warn),
                 Scoring::Weights::CPU_IOWAIT, "cpu_iowait");
  score += apply(above(sample, Col::CPU_STEAL, thresholds_.cpu_steal_warn),
                 Scoring::Weights::CPU_STEAL, "cpu_steal");
  if (score == 0)
    return std::nullopt;

  std::ostringstream desc;
  desc << "busy=" << format_fixed(busy.value_or(0.0), 1) << "% iow="
       << format_fixed(value_or_zero(sample, Col::CPU_IOWAIT), 1) << "%";
  return Candidate(score, sample.timestamp, desc.str(), Subsystem::CPU);
}

std::optional<Candidate>
AnomalyScorer::score_run_queue(double mean_runq, uint32_t vcpu_count,
                               const std::string &timestamp) {
  const double limit = static_cast<double>(vcpu_count) *
                       thresholds_.runq_factor;
  int score = apply(mean_runq > limit, Scoring::Weights::RUNQ_PRESSURE,
                    "runq_pressure");
  if (score == 0)
    return std::nullopt;

  return Candidate(score, timestamp,
                   "runq avg=" + format_fixed(mean_runq, 2) + " (> " +
                       format_fixed(limit, 2) + ")",
                   Subsystem::CPU);
}

std::optional<Candidate>
AnomalyScorer::check_memory_rules(const Sample &sample) {
  const double used = value_or_zero(sample, Col::MEM_USED_PCT);
  const double avail = value_or_zero(sample, Col::MEM_KBAVAIL);
  // An all-zero row is a placeholder, not a measurement
  if (used == 0.0 && avail == 0.0)
    return std::nullopt;

  int score = 0;
  score += apply(above(sample, Col::MEM_USED_PCT, thresholds_.mem_used_warn),
                 Scoring::Weights::MEM_USED, "mem_used");
  auto kbavail = sample.get(Col::MEM_KBAVAIL);
  score += apply(kbavail && *kbavail < thresholds_.mem_avail_min_kb,
                 Scoring::Weights::MEM_AVAIL_LOW, "mem_avail_low");
  if (score == 0)
    return std::nullopt;

  return Candidate(score, sample.timestamp,
                   "%memused=" + format_fixed(used, 1) +
                       " kbavail=" + format_fixed(avail, 0),
                   Subsystem::MEMORY);
}

std::optional<Candidate> AnomalyScorer::check_disk_rules(const Sample &sample) {
  int score = 0;
  score += apply(at_least(sample, Col::DISK_AWAIT, thresholds_.disk_await_spike),
                 Scoring::Weights::DISK_AWAIT_SPIKE, "disk_await_spike");
  score += apply(at_least(sample, Col::DISK_UTIL, thresholds_.disk_util_spike),
                 Scoring::Weights::DISK_UTIL_SPIKE, "disk_util_spike");
  score += apply(at_least(sample, Col::DISK_AQU_SZ, thresholds_.disk_aqu_spike),
                 Scoring::Weights::DISK_AQU_SPIKE, "disk_aqu_spike");
  if (score == 0)
    return std::nullopt;

  std::ostringstream desc;
  desc << "DEV=" << sample.resource_key
       << " await=" << format_fixed(value_or_zero(sample, Col::DISK_AWAIT), 1)
       << "ms util=" << format_fixed(value_or_zero(sample, Col::DISK_UTIL), 0)
       << "% aqu=" << format_fixed(value_or_zero(sample, Col::DISK_AQU_SZ), 2);
  return Candidate(score, sample.timestamp, desc.str(), Subsystem::DISK);
}

std::optional<Candidate>
AnomalyScorer::check_net_load_rules(const Sample &sample) {
  // Without a known link speed the load cannot be judged
  auto speed = link_speed_mbps(sample.resource_key);
  if (!speed)
    return std::nullopt;

  const double rx = value_or_zero(sample, Col::NET_RXKB);
  const double tx = value_or_zero(sample, Col::NET_TXKB);
  double ifutil = value_or_zero(sample, Col::NET_IFUTIL);
  if (ifutil == 0.0)
    ifutil = Scoring::estimate_ifutil_pct(rx, tx, *speed);

  int score = apply(ifutil >= thresholds_.ifutil_warn,
                    Scoring::Weights::NET_IFUTIL, "net_ifutil");
  if (score == 0)
    return std::nullopt;

  std::ostringstream desc;
  desc << "IF=" << sample.resource_key << " load=" << format_fixed(rx + tx, 1)
       << "kB/s ifutil=" << format_fixed(ifutil, 1) << "%";
  return Candidate(score, sample.timestamp, desc.str(), Subsystem::NET_DEVICE);
}

std::optional<Candidate>
AnomalyScorer::check_net_error_rules(const Sample &sample) {
  const double min = thresholds_.net_err_min;
  int score = 0;
  score += apply(above(sample, Col::NET_RXERR, min) ||
                     above(sample, Col::NET_TXERR, min),
                 Scoring::Weights::NET_ERRORS, "net_errors");
  score += apply(above(sample, Col::NET_RXDROP, min) ||
                     above(sample, Col::NET_TXDROP, min),
                 Scoring::Weights::NET_DROPS, "net_drops");
  if (score == 0)
    return std::nullopt;

  std::ostringstream desc;
  desc << "IF=" << sample.resource_key
       << " rxerr=" << format_fixed(value_or_zero(sample, Col::NET_RXERR), 1)
       << " txerr=" << format_fixed(value_or_zero(sample, Col::NET_TXERR), 1)
       << " rxdrop=" << format_fixed(value_or_zero(sample, Col::NET_RXDROP), 1)
       << " txdrop=" << format_fixed(value_or_zero(sample, Col::NET_TXDROP), 1);
  return Candidate(score, sample.timestamp, desc.str(), Subsystem::NET_ERROR);
}

std::optional<Candidate>
AnomalyScorer::check_socket_rules(const Sample &sample) {
  int score = apply(above(sample, Col::SOCK_TCP_TW, 0.0),
                    Scoring::Weights::SOCK_TIME_WAIT, "sock_time_wait");
  if (score == 0)
    return std::nullopt;

  return Candidate(score, sample.timestamp,
                   "SOCK tots=" + whole(sample, Col::SOCK_TOTAL) +
                       " tcp=" + whole(sample, Col::SOCK_TCP) +
                       " udp=" + whole(sample, Col::SOCK_UDP) +
                       " tw=" + whole(sample, Col::SOCK_TCP_TW),
                   Subsystem::SOCKET);
}

std::optional<Candidate> AnomalyScorer::check_tcp_rules(const Sample &sample) {
  int score = 0;
  score += apply(above(sample, Col::TCP_RETRANS, 0.0),
                 Scoring::Weights::TCP_RETRANS, "tcp_retrans");
  score += apply(above(sample, Col::TCP_INERR, 0.0),
                 Scoring::Weights::TCP_INERR, "tcp_inerr");
  score += apply(above(sample, Col::TCP_ACTIVE, 0.0) ||
                     above(sample, Col::TCP_PASSIVE, 0.0),
                 Scoring::Weights::TCP_ACTIVITY, "tcp_activity");
  if (score == 0)
    return std::nullopt;

  std::ostringstream desc;
  desc << "TCP active/s="
       << format_fixed(value_or_zero(sample, Col::TCP_ACTIVE), 1)
       << " passive/s="
       << format_fixed(value_or_zero(sample, Col::TCP_PASSIVE), 1)
       << " retrans/s="
       << format_fixed(value_or_zero(sample, Col::TCP_RETRANS), 1)
       << " estab=" << whole(sample, Col::TCP_ESTAB)
       << " inerr=" << format_fixed(value_or_zero(sample, Col::TCP_INERR), 1);
  return Candidate(score, sample.timestamp, desc.str(), Subsystem::TCP);
}

std::optional<Candidate> AnomalyScorer::check_ip_rules(const Sample &sample) {
  int score = 0;
  score += apply(above(sample, Col::IP_IREJ, 0.0),
                 Scoring::Weights::IP_REJECTED, "ip_rejected");
  score += apply(above(sample, Col::IP_IREC, Scoring::IP_BUSY_IREC_PER_SEC) &&
                     above(sample, Col::IP_IDEL, 0.0),
                 Scoring::Weights::IP_BUSY_DELIVERY, "ip_busy_delivery");
  if (score == 0)
    return std::nullopt;

  std::ostringstream desc;
  desc << "IP irec/s=" << format_fixed(value_or_zero(sample, Col::IP_IREC), 1)
       << " idel/s=" << format_fixed(value_or_zero(sample, Col::IP_IDEL), 1)
       << " irej/s=" << format_fixed(value_or_zero(sample, Col::IP_IREJ), 1);
  return Candidate(score, sample.timestamp, desc.str(), Subsystem::IP);
}

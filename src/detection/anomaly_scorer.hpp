#ifndef ANOMALY_SCORER_HPP
#define ANOMALY_SCORER_HPP

#include "core/candidate.hpp"
#include "core/config.hpp"
#include "core/sample.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

// Applies the per-subsystem threshold rules to single Samples. A sample that
// triggers no rule yields std::nullopt and is never ranked.
class AnomalyScorer {
public:
  explicit AnomalyScorer(const Config::AppConfig &cfg);

  std::optional<Candidate> score(const Sample &sample);

  // Window-level scheduler pressure check, fed with the mean runq-sz
  std::optional<Candidate> score_run_queue(double mean_runq,
                                           uint32_t vcpu_count,
                                           const std::string &timestamp);

  // Configured link speed of an interface, if any
  std::optional<double> link_speed_mbps(const std::string &iface) const;

  const std::map<std::string, uint64_t> &rule_hit_counts() const {
    return rule_hit_counts_;
  }
  uint64_t samples_scored() const { return samples_scored_; }

private:
  Config::ThresholdConfig thresholds_;
  Config::NetworkConfig network_;

  std::map<std::string, uint64_t> rule_hit_counts_;
  uint64_t samples_scored_ = 0;

  std::optional<Candidate> check_cpu_rules(const Sample &sample);
  std::optional<Candidate> check_memory_rules(const Sample &sample);
  std::optional<Candidate> check_disk_rules(const Sample &sample);
  std::optional<Candidate> check_net_load_rules(const Sample &sample);
  std::optional<Candidate> check_net_error_rules(const Sample &sample);
  std::optional<Candidate> check_socket_rules(const Sample &sample);
  std::optional<Candidate> check_tcp_rules(const Sample &sample);
  std::optional<Candidate> check_ip_rules(const Sample &sample);

  int apply(bool triggered, int weight, const char *rule_name);
};

#endif // ANOMALY_SCORER_HPP

#include "core/config.hpp"
#include "detection/anomaly_scorer.hpp"
#include "detection/rules/scoring.hpp"
#include <gtest/gtest.h>

#include <map>
#include <string>

namespace {

Sample make_sample(Subsystem subsystem, std::map<std::string, double> fields,
                   const std::string &resource = "",
                   const std::string &ts = "2024-01-15 09:00:00 UTC") {
  Sample s;
  s.timestamp = ts;
  s.subsystem = subsystem;
  s.resource_key = resource;
  s.fields = std::move(fields);
  return s;
}

int score_of(AnomalyScorer &scorer, const Sample &sample) {
  auto candidate = scorer.score(sample);
  return candidate ? candidate->score : 0;
}

} // namespace

class AnomalyScorerTest : public ::testing::Test {
protected:
  Config::AppConfig config;
};

// --- CPU ---
TEST_F(AnomalyScorerTest, CpuBusyIsStrictlyAboveThreshold) {
  AnomalyScorer scorer(config);
  auto at = make_sample(Subsystem::CPU, {{"%user", 70.0}, {"%system", 5.0}},
                        "-1");
  EXPECT_EQ(score_of(scorer, at), 0);

  auto over = make_sample(Subsystem::CPU, {{"%user", 70.0}, {"%system", 5.1}},
                          "-1");
  auto candidate = scorer.score(over);
  ASSERT_TRUE(candidate.has_value());
  EXPECT_EQ(candidate->score, Scoring::Weights::CPU_BUSY);
  EXPECT_EQ(candidate->subsystem, Subsystem::CPU);
  EXPECT_EQ(candidate->description, "busy=75.1% iow=0.0%");
}

TEST_F(AnomalyScorerTest, CpuIowaitAndStealBoundaries) {
  AnomalyScorer scorer(config);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::CPU, {{"%iowait", 5.0}},
                                         "-1")),
            0);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::CPU, {{"%iowait", 5.5}},
                                         "-1")),
            2);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::CPU, {{"%steal", 1.0}},
                                         "all")),
            0);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::CPU, {{"%steal", 1.2}},
                                         "all")),
            3);
}

TEST_F(AnomalyScorerTest, CpuRulesAdd) {
  AnomalyScorer scorer(config);
  auto s = make_sample(Subsystem::CPU,
                       {{"%user", 80.0},
                        {"%system", 10.0},
                        {"%iowait", 8.0},
                        {"%steal", 2.0}},
                       "-1");
  EXPECT_EQ(score_of(scorer, s), 7);
}

TEST_F(AnomalyScorerTest, PerCoreRowsAreNotScored) {
  AnomalyScorer scorer(config);
  auto core = make_sample(Subsystem::CPU, {{"%user", 99.0}, {"%iowait", 50.0}},
                          "3");
  EXPECT_FALSE(scorer.score(core).has_value());
}

TEST_F(AnomalyScorerTest, MissingFieldsNeverTrigger) {
  AnomalyScorer scorer(config);
  EXPECT_FALSE(scorer.score(make_sample(Subsystem::CPU, {}, "-1")).has_value());
  EXPECT_FALSE(scorer.score(make_sample(Subsystem::TCP, {})).has_value());
  EXPECT_FALSE(
      scorer.score(make_sample(Subsystem::DISK, {}, "sda")).has_value());
}

TEST_F(AnomalyScorerTest, RunQueueAgainstVcpuCount) {
  config.thresholds.runq_factor = 1.5;
  AnomalyScorer scorer(config);
  EXPECT_FALSE(scorer.score_run_queue(6.0, 4, "ts").has_value());

  auto candidate = scorer.score_run_queue(6.5, 4, "2024-01-15 18:50:00 UTC");
  ASSERT_TRUE(candidate.has_value());
  EXPECT_EQ(candidate->score, Scoring::Weights::RUNQ_PRESSURE);
  EXPECT_EQ(candidate->timestamp, "2024-01-15 18:50:00 UTC");
  EXPECT_EQ(candidate->description, "runq avg=6.50 (> 6.00)");
}

// --- Memory ---
TEST_F(AnomalyScorerTest, MemoryBoundaries) {
  AnomalyScorer scorer(config);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::MEMORY,
                                         {{"%memused", 80.0},
                                          {"kbavail", 1048576.0}})),
            0);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::MEMORY,
                                         {{"%memused", 80.1},
                                          {"kbavail", 1048576.0}})),
            2);
  auto both = scorer.score(make_sample(
      Subsystem::MEMORY, {{"%memused", 95.0}, {"kbavail", 1048575.0}}));
  ASSERT_TRUE(both.has_value());
  EXPECT_EQ(both->score, 5);
  EXPECT_EQ(both->description, "%memused=95.0 kbavail=1048575");
}

TEST_F(AnomalyScorerTest, MemoryZeroRowIsSkipped) {
  AnomalyScorer scorer(config);
  EXPECT_FALSE(scorer
                   .score(make_sample(Subsystem::MEMORY,
                                      {{"%memused", 0.0}, {"kbavail", 0.0}}))
                   .has_value());
}

// --- Disk ---
TEST_F(AnomalyScorerTest, DiskSpikesTriggerAtThreshold) {
  AnomalyScorer scorer(config);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::DISK, {{"await", 49.9}},
                                         "sda")),
            0);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::DISK, {{"await", 50.0}},
                                         "sda")),
            3);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::DISK, {{"%util", 90.0}},
                                         "sda")),
            3);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::DISK, {{"aqu-sz", 5.0}},
                                         "sda")),
            2);

  auto all = scorer.score(make_sample(
      Subsystem::DISK, {{"await", 60.0}, {"%util", 95.0}, {"aqu-sz", 7.25}},
      "nvme0n1"));
  ASSERT_TRUE(all.has_value());
  EXPECT_EQ(all->score, 8);
  EXPECT_EQ(all->description, "DEV=nvme0n1 await=60.0ms util=95% aqu=7.25");
}

TEST_F(AnomalyScorerTest, LongDeviceNamesAreKeptWhole) {
  AnomalyScorer scorer(config);
  const std::string device =
      "dm-" + std::string(300, 'x') + "-mpath-volume-group-logical-volume";
  auto candidate = scorer.score(
      make_sample(Subsystem::DISK, {{"await", 75.5}, {"%util", 12.0}}, device));
  ASSERT_TRUE(candidate.has_value());
  EXPECT_EQ(candidate->description,
            "DEV=" + device + " await=75.5ms util=12% aqu=0.00");
}

// --- Network ---
TEST_F(AnomalyScorerTest, NetworkLoadNeedsKnownLinkSpeed) {
  AnomalyScorer unknown(config);
  auto busy = make_sample(Subsystem::NET_DEVICE,
                          {{"rxkB/s", 50000.0}, {"txkB/s", 50000.0},
                           {"%ifutil", 95.0}},
                          "eth0");
  EXPECT_FALSE(unknown.score(busy).has_value());

  config.network.link_speed_mbps["eth0"] = 1000.0;
  AnomalyScorer known(config);
  EXPECT_EQ(score_of(known, busy), 2);
}

TEST_F(AnomalyScorerTest, NetworkLoadThresholdIsInclusive) {
  config.network.link_speed_mbps["eth0"] = 1000.0;
  AnomalyScorer scorer(config);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::NET_DEVICE,
                                         {{"%ifutil", 70.0}}, "eth0")),
            2);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::NET_DEVICE,
                                         {{"%ifutil", 69.9}}, "eth0")),
            0);
}

TEST_F(AnomalyScorerTest, NetworkLoadEstimatedWhenCounterIsZero) {
  // 100 Mbps link, 10000 kB/s total = 81.92%
  config.network.link_speed_mbps["ens18"] = 100.0;
  AnomalyScorer scorer(config);
  auto candidate = scorer.score(make_sample(
      Subsystem::NET_DEVICE,
      {{"rxkB/s", 6000.0}, {"txkB/s", 4000.0}, {"%ifutil", 0.0}}, "ens18"));
  ASSERT_TRUE(candidate.has_value());
  EXPECT_EQ(candidate->score, 2);
  EXPECT_EQ(candidate->description, "IF=ens18 load=10000.0kB/s ifutil=81.9%");
  EXPECT_NEAR(Scoring::estimate_ifutil_pct(6000.0, 4000.0, 100.0), 81.92,
              1e-9);
}

TEST_F(AnomalyScorerTest, NetworkErrorsAndDrops) {
  AnomalyScorer scorer(config);
  EXPECT_FALSE(scorer
                   .score(make_sample(Subsystem::NET_ERROR,
                                      {{"rxerr/s", 0.0}, {"rxdrop/s", 0.0}},
                                      "eth0"))
                   .has_value());
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::NET_ERROR,
                                         {{"txerr/s", 0.1}}, "eth0")),
            3);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::NET_ERROR,
                                         {{"rxdrop/s", 0.5}}, "eth0")),
            2);

  auto both = scorer.score(make_sample(
      Subsystem::NET_ERROR, {{"rxerr/s", 5.0}, {"rxdrop/s", 3.0}}, "eth0"));
  ASSERT_TRUE(both.has_value());
  EXPECT_EQ(both->score, 5);
  EXPECT_EQ(both->description,
            "IF=eth0 rxerr=5.0 txerr=0.0 rxdrop=3.0 txdrop=0.0");

  config.thresholds.net_err_min = 1.0;
  AnomalyScorer tolerant(config);
  EXPECT_EQ(score_of(tolerant, make_sample(Subsystem::NET_ERROR,
                                           {{"rxerr/s", 1.0}}, "eth0")),
            0);
}

// --- Socket / TCP / IP ---
TEST_F(AnomalyScorerTest, SocketTimeWait) {
  AnomalyScorer scorer(config);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::SOCKET,
                                         {{"totsck", 300.0}, {"tcp-tw", 0.0}})),
            0);
  auto candidate = scorer.score(make_sample(
      Subsystem::SOCKET,
      {{"totsck", 300.0}, {"tcpsck", 20.0}, {"udpsck", 4.0}, {"tcp-tw", 12.0}}));
  ASSERT_TRUE(candidate.has_value());
  EXPECT_EQ(candidate->score, 1);
  EXPECT_EQ(candidate->description, "SOCK tots=300 tcp=20 udp=4 tw=12");
}

TEST_F(AnomalyScorerTest, TcpRules) {
  AnomalyScorer scorer(config);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::TCP, {{"active/s", 0.5}})),
            1);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::TCP, {{"retrans/s", 0.1}})),
            4);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::TCP,
                                         {{"retrans/s", 0.1},
                                          {"inerr", 0.2},
                                          {"passive/s", 3.0}})),
            9);

  auto candidate = scorer.score(make_sample(
      Subsystem::TCP, {{"retrans/s", 1.5}, {"estab", 42.0}, {"inerr", 0.0}}));
  ASSERT_TRUE(candidate.has_value());
  EXPECT_EQ(candidate->description,
            "TCP active/s=0.0 passive/s=0.0 retrans/s=1.5 estab=42 inerr=0.0");
}

TEST_F(AnomalyScorerTest, IpRules) {
  AnomalyScorer scorer(config);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::IP,
                                         {{"irec/s", 1000.0}, {"idel/s", 900.0}})),
            0);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::IP,
                                         {{"irec/s", 1000.5}, {"idel/s", 900.0}})),
            1);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::IP,
                                         {{"irec/s", 1000.5}, {"idel/s", 0.0}})),
            0);
  EXPECT_EQ(score_of(scorer, make_sample(Subsystem::IP, {{"irej/s", 0.01}})),
            3);

  auto candidate = scorer.score(make_sample(
      Subsystem::IP, {{"irec/s", 1500.0}, {"idel/s", 1400.0}, {"irej/s", 2.0}}));
  ASSERT_TRUE(candidate.has_value());
  EXPECT_EQ(candidate->score, 4);
  EXPECT_EQ(candidate->description,
            "IP irec/s=1500.0 idel/s=1400.0 irej/s=2.0");
}

TEST_F(AnomalyScorerTest, AuxiliarySubsystemsAreNeverScored) {
  AnomalyScorer scorer(config);
  EXPECT_FALSE(scorer.score(make_sample(Subsystem::SWAP, {{"%swpused", 99.0}}))
                   .has_value());
  EXPECT_FALSE(scorer.score(make_sample(Subsystem::LOAD, {{"runq-sz", 99.0}}))
                   .has_value());
}

TEST_F(AnomalyScorerTest, CountsRuleHits) {
  AnomalyScorer scorer(config);
  scorer.score(make_sample(Subsystem::TCP, {{"retrans/s", 1.0}}));
  scorer.score(make_sample(Subsystem::TCP, {{"retrans/s", 2.0}}));
  EXPECT_EQ(scorer.samples_scored(), 2u);
  ASSERT_EQ(scorer.rule_hit_counts().count("tcp_retrans"), 1u);
  EXPECT_EQ(scorer.rule_hit_counts().at("tcp_retrans"), 2u);
}

#include "analysis/header_index.hpp"
#include "analysis/metric_extractor.hpp"
#include <gtest/gtest.h>

#include <string>
#include <vector>

using analysis::HeaderIndex;
using analysis::MetricExtractor;

TEST(HeaderIndexTest, StripsCommentMarkerAndIndexesByName) {
  HeaderIndex header("# hostname;interval;timestamp;DEV;await;%util");
  EXPECT_EQ(header.find("hostname").value_or(99), 0u);
  EXPECT_EQ(header.find("timestamp").value_or(99), 2u);
  EXPECT_EQ(header.find("%util").value_or(99), 5u);
  EXPECT_FALSE(header.find("aqu-sz").has_value());
  EXPECT_TRUE(HeaderIndex::is_header_line("# a;b"));
  EXPECT_FALSE(HeaderIndex::is_header_line("host;600"));
}

TEST(HeaderIndexTest, RepeatedColumnKeepsFirstPosition) {
  HeaderIndex header("# hostname;await; await ;%util");
  EXPECT_EQ(header.find("await").value_or(99), 1u);
  EXPECT_EQ(header.find("%util").value_or(99), 3u);
  EXPECT_TRUE(header.contains("hostname"));
}

TEST(MetricExtractorTest, ResolvesColumnsByNameInAnyOrder) {
  MetricExtractor extractor(Subsystem::DISK, false);
  std::vector<std::string> lines = {
      "# hostname;interval;timestamp;DEV;%util;await;aqu-sz;tps",
      "host;600;2024-01-15 09:00:00 UTC;sda;45.00;12.50;0.80;30.00",
  };

  auto samples = extractor.extract(lines);
  ASSERT_EQ(samples.size(), 1u);
  const Sample &s = samples[0];
  EXPECT_EQ(s.subsystem, Subsystem::DISK);
  EXPECT_EQ(s.resource_key, "sda");
  EXPECT_EQ(s.timestamp, "2024-01-15 09:00:00 UTC");
  EXPECT_DOUBLE_EQ(*s.get("await"), 12.5);
  EXPECT_DOUBLE_EQ(*s.get("%util"), 45.0);
  EXPECT_DOUBLE_EQ(*s.get("aqu-sz"), 0.8);
  // Undeclared columns are ignored
  EXPECT_FALSE(s.has("tps"));
}

TEST(MetricExtractorTest, MissingColumnIsNotAvailableRatherThanZero) {
  MetricExtractor extractor(Subsystem::CPU, false);
  auto samples = extractor.extract({
      "# hostname;interval;timestamp;CPU;%user;%system;%idle",
      "host;600;2024-01-15 09:00:00 UTC;-1;10.00;5.00;85.00",
  });
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_TRUE(samples[0].has("%user"));
  EXPECT_FALSE(samples[0].has("%steal"));
  EXPECT_FALSE(samples[0].get("%iowait").has_value());
}

TEST(MetricExtractorTest, NonNumericAndEmptyValuesReadAsZero) {
  MetricExtractor extractor(Subsystem::MEMORY, false);
  auto samples = extractor.extract({
      "# hostname;interval;timestamp;kbmemfree;kbavail;%memused",
      "host;600;2024-01-15 09:00:00 UTC;100;oops;",
  });
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_DOUBLE_EQ(*samples[0].get("kbavail"), 0.0);
  EXPECT_DOUBLE_EQ(*samples[0].get("%memused"), 0.0);
}

TEST(MetricExtractorTest, ShortRowsDoNotAbort) {
  MetricExtractor extractor(Subsystem::MEMORY, false);
  auto samples = extractor.extract({
      "# hostname;interval;timestamp;%memused;kbavail",
      "host;600;2024-01-15 09:00:00 UTC;55.0",
  });
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_DOUBLE_EQ(*samples[0].get("%memused"), 55.0);
  EXPECT_DOUBLE_EQ(*samples[0].get("kbavail"), 0.0);
}

TEST(MetricExtractorTest, SkipsRestartRowsAndRebindsOnNewHeader) {
  MetricExtractor extractor(Subsystem::DISK, false);
  auto samples = extractor.extract({
      "# hostname;interval;timestamp;DEV;await;%util",
      "host;600;2024-01-15 09:00:00 UTC;sda;10.0;20.0",
      "host;-1;2024-01-15 09:05:00 UTC;LINUX-RESTART\t(4 CPU)",
      "# hostname;interval;timestamp;DEV;%util;avgqu-sz;await",
      "host;600;2024-01-15 09:10:00 UTC;sda;30.0;2.5;40.0",
  });
  ASSERT_EQ(samples.size(), 2u);
  EXPECT_DOUBLE_EQ(*samples[1].get("await"), 40.0);
  EXPECT_DOUBLE_EQ(*samples[1].get("%util"), 30.0);
  // avgqu-sz is the pre-12.x name of aqu-sz
  EXPECT_DOUBLE_EQ(*samples[1].get("aqu-sz"), 2.5);
  EXPECT_FALSE(samples[0].has("aqu-sz"));
}

TEST(MetricExtractorTest, LoopbackExcludedUnlessRequested) {
  std::vector<std::string> lines = {
      "# hostname;interval;timestamp;IFACE;rxkB/s;txkB/s;%ifutil",
      "host;600;2024-01-15 09:00:00 UTC;lo;5.0;5.0;0.00",
      "host;600;2024-01-15 09:00:00 UTC;eth0;100.0;25.0;0.00",
      "host;600;2024-01-15 09:00:00 UTC;IFACE;1;1;1",
  };

  auto without_lo = MetricExtractor(Subsystem::NET_DEVICE, false).extract(lines);
  ASSERT_EQ(without_lo.size(), 1u);
  EXPECT_EQ(without_lo[0].resource_key, "eth0");

  auto with_lo = MetricExtractor(Subsystem::NET_DEVICE, true).extract(lines);
  ASSERT_EQ(with_lo.size(), 2u);
  EXPECT_EQ(with_lo[0].resource_key, "lo");
}

TEST(MetricExtractorTest, KeepsPerCoreRowsWithTheirId) {
  MetricExtractor extractor(Subsystem::CPU, false);
  auto samples = extractor.extract({
      "# hostname;interval;timestamp;CPU;%user;%system",
      "host;600;2024-01-15 09:00:00 UTC;-1;10.0;5.0",
      "host;600;2024-01-15 09:00:00 UTC;0;20.0;5.0",
      "host;600;2024-01-15 09:00:00 UTC;1;0.0;5.0",
  });
  ASSERT_EQ(samples.size(), 3u);
  EXPECT_TRUE(analysis::is_cpu_aggregate(samples[0].resource_key));
  EXPECT_EQ(samples[1].resource_key, "0");
  EXPECT_FALSE(analysis::is_cpu_aggregate(samples[2].resource_key));
  EXPECT_TRUE(analysis::is_cpu_aggregate("all"));
}

TEST(MetricExtractorTest, MergesTcpAndEtcpTables) {
  MetricExtractor extractor(Subsystem::TCP, false);
  auto samples = extractor.extract({
      "# hostname;interval;timestamp;active/s;passive/s;iseg/s;oseg/s",
      "host;600;2024-01-15 09:00:00 UTC;1.50;0.50;100.0;90.0",
      "# hostname;interval;timestamp;atmptf/s;estres/s;retrans/s;isegerr/s;"
      "orsts/s",
      "host;600;2024-01-15 09:00:00 UTC;0.00;0.10;2.00;0.30;0.00",
  });
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_DOUBLE_EQ(*samples[0].get("active/s"), 1.5);
  EXPECT_DOUBLE_EQ(*samples[0].get("retrans/s"), 2.0);
  // isegerr/s is read as inerr
  EXPECT_DOUBLE_EQ(*samples[0].get("inerr"), 0.3);
}

TEST(MetricExtractorTest, SumsScanCountersWhenTotalMissing) {
  MetricExtractor extractor(Subsystem::PAGING, false);
  auto samples = extractor.extract({
      "# hostname;interval;timestamp;pgscank/s;pgscand/s;pgsteal/s",
      "host;600;2024-01-15 09:00:00 UTC;3.0;1.5;2.0",
  });
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_DOUBLE_EQ(*samples[0].get("pgscan/s"), 4.5);
  EXPECT_DOUBLE_EQ(*samples[0].get("pgsteal/s"), 2.0);
}

TEST(MetricExtractorTest, RowsBeforeAnyHeaderAreIgnored) {
  MetricExtractor extractor(Subsystem::IP, false);
  auto samples = extractor.extract({
      "host;600;2024-01-15 09:00:00 UTC;1;2;3",
  });
  EXPECT_TRUE(samples.empty());
}

#include "core/metrics_registry.hpp"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

TEST(MetricsRegistryTest, FamiliesAreCreatedOnce) {
  auto &registry = MetricsRegistry::instance();
  auto &a = registry.create_counter_family("sar_auditor_test_hits_total",
                                           "Test counter");
  auto &b = registry.create_counter_family("sar_auditor_test_hits_total",
                                           "Test counter");
  EXPECT_EQ(&a, &b);

  a.Add({{"rule", "tcp_retrans"}}).Increment(3);
  auto &gauge =
      registry.create_gauge("sar_auditor_test_files", "Test gauge");
  gauge.Set(4);

  const std::string text = registry.serialize();
  EXPECT_NE(text.find("sar_auditor_test_hits_total{rule=\"tcp_retrans\"} 3"),
            std::string::npos);
  EXPECT_NE(text.find("sar_auditor_test_files 4"), std::string::npos);
}

TEST(MetricsRegistryTest, WritesTextfileAtomically) {
  auto &registry = MetricsRegistry::instance();
  registry.create_gauge("sar_auditor_test_written", "Test gauge").Set(1);

  const auto dir =
      std::filesystem::temp_directory_path() / "sar_auditor_metrics_test";
  std::filesystem::remove_all(dir);
  const auto path = dir / "textfile" / "sar_auditor.prom";

  ASSERT_TRUE(registry.write_textfile(path.string()));
  EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  EXPECT_NE(ss.str().find("sar_auditor_test_written 1"), std::string::npos);
  std::filesystem::remove_all(dir);
}

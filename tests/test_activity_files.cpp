#include "io/activity_files.hpp"
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class ActivityFilesTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = fs::temp_directory_path() / "sar_auditor_activity_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    now = fs::file_time_type::clock::now();
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  // Creates a file whose mtime is `age` in the past
  std::string touch(const std::string &name, std::chrono::hours age) {
    fs::path p = dir / name;
    std::ofstream(p) << "x";
    fs::last_write_time(p, now - age);
    return p.string();
  }

  fs::path dir;
  fs::file_time_type now;
};

TEST(ActivityFileNameTest, MatchesSaFollowedByDigits) {
  EXPECT_TRUE(ActivityFiles::is_activity_file_name("sa15"));
  EXPECT_TRUE(ActivityFiles::is_activity_file_name("sa01"));
  EXPECT_TRUE(ActivityFiles::is_activity_file_name("sa20240115"));

  EXPECT_FALSE(ActivityFiles::is_activity_file_name("sa"));
  EXPECT_FALSE(ActivityFiles::is_activity_file_name("sar15"));
  EXPECT_FALSE(ActivityFiles::is_activity_file_name("sa15.gz"));
  EXPECT_FALSE(ActivityFiles::is_activity_file_name("xsa15"));
}

TEST_F(ActivityFilesTest, NewestFirstAndTruncated) {
  std::string oldest = touch("sa12", std::chrono::hours(72));
  std::string newest = touch("sa15", std::chrono::hours(1));
  std::string middle = touch("sa14", std::chrono::hours(24));
  touch("sar15", std::chrono::hours(0));
  touch("sa13.xz", std::chrono::hours(0));
  fs::create_directories(dir / "sa16");

  auto files = ActivityFiles::find_activity_files({dir.string()}, 4);
  ASSERT_EQ(files.size(), 3u);
  EXPECT_EQ(files[0], newest);
  EXPECT_EQ(files[1], middle);
  EXPECT_EQ(files[2], oldest);

  auto limited = ActivityFiles::find_activity_files({dir.string()}, 2);
  ASSERT_EQ(limited.size(), 2u);
  EXPECT_EQ(limited[1], middle);
}

TEST_F(ActivityFilesTest, MergesDirectoriesAndSkipsMissingOnes) {
  fs::path second = dir / "sysstat";
  fs::create_directories(second);
  std::string a = touch("sa10", std::chrono::hours(5));
  fs::path b = second / "sa11";
  std::ofstream(b) << "x";
  fs::last_write_time(b, now - std::chrono::hours(2));

  auto files = ActivityFiles::find_activity_files(
      {(dir / "missing").string(), dir.string(), second.string()}, 10);
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0], b.string());
  EXPECT_EQ(files[1], a);
}

TEST_F(ActivityFilesTest, NoFilesFound) {
  EXPECT_TRUE(ActivityFiles::find_activity_files({dir.string()}, 4).empty());
  EXPECT_TRUE(
      ActivityFiles::find_activity_files({"/nonexistent/sa/dir"}, 4).empty());
}

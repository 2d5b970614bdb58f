#include "core/config.hpp"
#include "io/telemetry_source/csv_directory_telemetry_source.hpp"
#include "io/telemetry_source/sadf_telemetry_source.hpp"
#include "utils/process_runner.hpp"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace {

// Records the command line and replays a canned result
class FakeProcessRunner : public ProcessRunner {
public:
  ProcessResult canned;
  mutable std::vector<std::string> last_argv;
  mutable uint32_t last_timeout = 0;

  ProcessResult run(const std::vector<std::string> &argv,
                    uint32_t timeout_seconds) const override {
    last_argv = argv;
    last_timeout = timeout_seconds;
    return canned;
  }
};

ProcessResult finished(int exit_code, std::vector<std::string> lines) {
  ProcessResult r;
  r.started = true;
  r.exit_code = exit_code;
  r.lines = std::move(lines);
  return r;
}

} // namespace

class SadfTelemetrySourceTest : public ::testing::Test {
protected:
  void SetUp() override {
    decoder.sadf_path = "/usr/bin/sadf";
    decoder.timeout_seconds = 45;
    runner = std::make_shared<FakeProcessRunner>();
  }

  Config::DecoderConfig decoder;
  std::shared_ptr<FakeProcessRunner> runner;
};

TEST_F(SadfTelemetrySourceTest, ArgvCarriesWindowBounds) {
  SadfTelemetrySource source(decoder, runner);
  auto window = *analysis::Window::parse("08:00", "19:00");
  std::vector<std::string> expected = {
      "/usr/bin/sadf", "-d", "-s", "08:00:00", "-e", "19:00:00",
      "/var/log/sa/sa15", "--", "-n", "DEV"};
  EXPECT_EQ(source.build_argv("/var/log/sa/sa15", Subsystem::NET_DEVICE,
                              window),
            expected);
}

TEST_F(SadfTelemetrySourceTest, FullDayAndWrappingWindowsOmitBounds) {
  SadfTelemetrySource source(decoder, runner);
  std::vector<std::string> expected = {"/usr/bin/sadf", "-d", "sa15", "--",
                                       "-u"};
  EXPECT_EQ(source.build_argv("sa15", Subsystem::CPU,
                              analysis::Window::full_day()),
            expected);
  EXPECT_EQ(source.build_argv("sa15", Subsystem::CPU,
                              *analysis::Window::parse("22:00", "06:00")),
            expected);
}

TEST_F(SadfTelemetrySourceTest, ReturnsDecodedLines) {
  runner->canned = finished(
      0, {"# hostname;interval;timestamp;CPU;%user",
          "web01;600;2024-01-15 09:00:00 UTC;-1;12.00"});
  SadfTelemetrySource source(decoder, runner);

  auto lines = source.decode("sa15", Subsystem::CPU,
                             analysis::Window::full_day());
  ASSERT_TRUE(lines.has_value());
  EXPECT_EQ(lines->size(), 2u);
  EXPECT_EQ(runner->last_timeout, 45u);
  EXPECT_EQ(runner->last_argv.back(), "-u");
}

TEST_F(SadfTelemetrySourceTest, HeaderOnlyOutputIsPresent) {
  runner->canned = finished(0, {"# hostname;interval;timestamp;DEV;await"});
  SadfTelemetrySource source(decoder, runner);
  auto lines = source.decode("sa15", Subsystem::DISK,
                             analysis::Window::full_day());
  ASSERT_TRUE(lines.has_value());
  EXPECT_EQ(lines->size(), 1u);
}

TEST_F(SadfTelemetrySourceTest, FailuresMeanAbsent) {
  SadfTelemetrySource source(decoder, runner);
  auto window = analysis::Window::full_day();

  runner->canned = finished(1, {"# hostname;interval;timestamp"});
  EXPECT_FALSE(source.decode("sa15", Subsystem::IP, window).has_value());

  runner->canned = finished(ProcessRunner::TIMEOUT_EXIT_CODE, {});
  runner->canned.timed_out = true;
  EXPECT_FALSE(source.decode("sa15", Subsystem::IP, window).has_value());

  runner->canned = finished(0, {"Requested activities not available in file"});
  EXPECT_FALSE(source.decode("sa15", Subsystem::IP, window).has_value());

  runner->canned = finished(0, {});
  EXPECT_FALSE(source.decode("sa15", Subsystem::IP, window).has_value());

  runner->canned = ProcessResult();
  EXPECT_FALSE(source.decode("sa15", Subsystem::IP, window).has_value());
}

class CsvDirectoryTelemetrySourceTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = std::filesystem::temp_directory_path() / "sar_auditor_csv_test";
    std::filesystem::create_directories(dir);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  void write_file(const std::string &name, const std::string &content) {
    std::ofstream out(dir / name);
    out << content;
  }

  std::filesystem::path dir;
};

TEST_F(CsvDirectoryTelemetrySourceTest, ReadsExportedStream) {
  write_file("sa15.disk.csv",
             "# hostname;interval;timestamp;DEV;await\r\n"
             "web01;600;2024-01-15 09:00:00 UTC;sda;1.00\r\n"
             "\n");
  CsvDirectoryTelemetrySource source(dir.string());

  EXPECT_EQ(source.stream_path("/var/log/sa/sa15", Subsystem::DISK),
            (dir / "sa15.disk.csv").string());

  auto lines = source.decode("/var/log/sa/sa15", Subsystem::DISK,
                             analysis::Window::full_day());
  ASSERT_TRUE(lines.has_value());
  ASSERT_EQ(lines->size(), 2u);
  EXPECT_EQ((*lines)[1], "web01;600;2024-01-15 09:00:00 UTC;sda;1.00");
}

TEST_F(CsvDirectoryTelemetrySourceTest, MissingOrHeaderlessStreamIsAbsent) {
  write_file("sa15.tcp.csv", "web01;600;2024-01-15 09:00:00 UTC;1.0\n");
  CsvDirectoryTelemetrySource source(dir.string());
  auto window = analysis::Window::full_day();
  EXPECT_FALSE(source.decode("sa15", Subsystem::CPU, window).has_value());
  EXPECT_FALSE(source.decode("sa15", Subsystem::TCP, window).has_value());
}

TEST(ProcessRunnerTest, QuotesArguments) {
  EXPECT_EQ(ProcessRunner::shell_quote("sa15"), "'sa15'");
  EXPECT_EQ(ProcessRunner::shell_quote("it's"), "'it'\\''s'");
  std::string cmd = ProcessRunner::build_command_line({"sadf", "-d"}, 0);
  EXPECT_EQ(cmd, "LC_ALL=C 'sadf' '-d' 2>/dev/null");
}

TEST(ProcessRunnerTest, RunsCommandsThroughShell) {
  ProcessRunner runner;
  ProcessResult ok = runner.run({"printf", "a\\nb\\n"});
  EXPECT_TRUE(ok.ok());
  ASSERT_EQ(ok.lines.size(), 2u);
  EXPECT_EQ(ok.lines[0], "a");

  ProcessResult failed = runner.run({"false"});
  EXPECT_TRUE(failed.started);
  EXPECT_FALSE(failed.ok());
  EXPECT_EQ(failed.exit_code, 1);

  EXPECT_FALSE(ProcessRunner::command_exists("definitely-not-a-command-xyz"));
}

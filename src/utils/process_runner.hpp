#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <cstdint>
#include <string>
#include <vector>

struct ProcessResult {
  bool started = false;
  bool timed_out = false;
  int exit_code = -1;
  std::vector<std::string> lines; // stdout, one entry per line, no newline

  bool ok() const { return started && !timed_out && exit_code == 0; }
};

// Runs external commands through /bin/sh with stdout captured. Commands are
// wrapped in timeout(1) when a limit is given, and run with LC_ALL=C so
// numbers always use a decimal point.
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  virtual ProcessResult run(const std::vector<std::string> &argv,
                            uint32_t timeout_seconds = 0) const;

  static std::string shell_quote(const std::string &arg);
  static std::string build_command_line(const std::vector<std::string> &argv,
                                        uint32_t timeout_seconds);
  static bool command_exists(const std::string &command);

  // Exit status timeout(1) reports when the limit was hit
  static constexpr int TIMEOUT_EXIT_CODE = 124;
};

#endif // PROCESS_RUNNER_HPP

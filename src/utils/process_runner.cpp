#include "process_runner.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

std::string ProcessRunner::shell_quote(const std::string &arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

std::string
ProcessRunner::build_command_line(const std::vector<std::string> &argv,
                                  uint32_t timeout_seconds) {
  std::string cmd = "LC_ALL=C ";
  if (timeout_seconds > 0 && command_exists("timeout"))
    cmd += "timeout " + std::to_string(timeout_seconds) + " ";
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      cmd += ' ';
    cmd += shell_quote(argv[i]);
  }
  cmd += " 2>/dev/null";
  return cmd;
}

bool ProcessRunner::command_exists(const std::string &command) {
  if (command.empty())
    return false;
  if (command.find('/') != std::string::npos)
    return ::access(command.c_str(), X_OK) == 0;

  const char *path = std::getenv("PATH");
  if (!path)
    return false;
  std::string p(path);
  size_t start = 0;
  while (start <= p.size()) {
    size_t end = p.find(':', start);
    std::string dir =
        p.substr(start, end == std::string::npos ? std::string::npos
                                                 : end - start);
    if (!dir.empty()) {
      std::string candidate = dir + "/" + command;
      if (::access(candidate.c_str(), X_OK) == 0)
        return true;
    }
    if (end == std::string::npos)
      break;
    start = end + 1;
  }
  return false;
}

ProcessResult ProcessRunner::run(const std::vector<std::string> &argv,
                                 uint32_t timeout_seconds) const {
  ProcessResult result;
  if (argv.empty())
    return result;

  std::string cmd = build_command_line(argv, timeout_seconds);
  LOG(LogLevel::DEBUG, LogComponent::IO_DECODER, "Running: " << cmd);

  FILE *fp = ::popen(cmd.c_str(), "r");
  if (!fp) {
    LOG(LogLevel::ERROR, LogComponent::IO_DECODER,
        "popen failed for '" << argv[0] << "': " << std::strerror(errno));
    return result;
  }
  result.started = true;

  std::string current;
  char buf[4096];
  while (std::fgets(buf, sizeof(buf), fp)) {
    current += buf;
    if (!current.empty() && current.back() == '\n') {
      current.pop_back();
      if (!current.empty() && current.back() == '\r')
        current.pop_back();
      result.lines.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty())
    result.lines.push_back(std::move(current));

  int status = ::pclose(fp);
  if (status == -1) {
    LOG(LogLevel::ERROR, LogComponent::IO_DECODER,
        "pclose failed for '" << argv[0] << "': " << std::strerror(errno));
    return result;
  }
  if (WIFEXITED(status))
    result.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    result.exit_code = 128 + WTERMSIG(status);

  result.timed_out = timeout_seconds > 0 &&
                     result.exit_code == TIMEOUT_EXIT_CODE;
  return result;
}

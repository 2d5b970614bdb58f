#include "run_workspace.hpp"
#include "core/candidate.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {
constexpr uint32_t ARCHIVE_TIMEOUT_SECONDS = 120;
} // namespace

RunWorkspace::RunWorkspace(bool clean_on_exit, const std::string &base_dir)
    : clean_on_exit_(clean_on_exit) {
  std::error_code ec;
  fs::path base = base_dir.empty() ? fs::temp_directory_path(ec)
                                   : fs::path(base_dir);
  if (ec)
    base = "/tmp";

  std::string templ = (base / "sar-an-XXXXXX").string();
  std::vector<char> buffer(templ.begin(), templ.end());
  buffer.push_back('\0');
  if (mkdtemp(buffer.data()) == nullptr) {
    LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
        "Cannot create run workspace under " << base << ": "
                                             << std::strerror(errno));
    return;
  }
  path_ = buffer.data();
  LOG(LogLevel::DEBUG, LogComponent::IO_OUTPUT,
      "Run workspace at " << path_);
}

RunWorkspace::~RunWorkspace() {
  if (!valid())
    return;
  if (!clean_on_exit_) {
    LOG(LogLevel::INFO, LogComponent::IO_OUTPUT,
        "Keeping run workspace " << path_);
    return;
  }
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec)
    LOG(LogLevel::WARN, LogComponent::IO_OUTPUT,
        "Could not remove run workspace " << path_ << ": " << ec.message());
}

bool RunWorkspace::write_text(const std::string &name,
                              const std::string &content) const {
  if (!valid())
    return false;
  const std::string file = (fs::path(path_) / name).string();
  std::ofstream out(file, std::ios::trunc);
  if (!out.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT, "Cannot open " << file);
    return false;
  }
  out << content;
  if (!out.good()) {
    LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT, "Failed writing " << file);
    return false;
  }
  return true;
}

bool RunWorkspace::write_records(const std::string &name,
                                 const TopList &list) const {
  std::string content;
  for (const auto &candidate : list.entries()) {
    content += candidate_to_record(candidate);
    content += '\n';
  }
  return write_text(name, content);
}

bool RunWorkspace::write_ranking(const Ranker &ranker, size_t top_n) const {
  bool ok = true;
  for (Subsystem subsystem : ranked_subsystems()) {
    std::string name = std::string("top_") + subsystem_key(subsystem) + ".txt";
    ok = write_records(name, ranker.list_for(subsystem)) && ok;
  }
  ok = write_records("top_all.txt", ranker.summary()) && ok;
  ok = write_text("ranking.json",
                  JsonFormatter::format_ranking_to_json(ranker, top_n) +
                      "\n") &&
       ok;
  return ok;
}

bool RunWorkspace::archive_to(const std::string &archive_path,
                              const ProcessRunner &runner) const {
  if (!valid())
    return false;
  if (!Utils::create_directory_for_file(archive_path)) {
    LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
        "Cannot create directory for archive " << archive_path);
    return false;
  }

  ProcessResult result = runner.run(
      {"tar", "-czf", archive_path, "-C", path_, "."}, ARCHIVE_TIMEOUT_SECONDS);
  if (!result.ok()) {
    LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
        "tar failed for " << archive_path << " (exit " << result.exit_code
                          << (result.timed_out ? ", timed out" : "") << ")");
    return false;
  }

  std::error_code ec;
  auto size = fs::file_size(archive_path, ec);
  if (ec || size == 0) {
    LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
        "Archive " << archive_path << " is missing or empty");
    return false;
  }
  LOG(LogLevel::INFO, LogComponent::IO_OUTPUT,
      "Archived run workspace to " << archive_path << " (" << size
                                   << " bytes)");
  return true;
}

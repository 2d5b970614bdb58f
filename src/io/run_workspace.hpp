#ifndef RUN_WORKSPACE_HPP
#define RUN_WORKSPACE_HPP

#include "detection/top_list.hpp"
#include "utils/process_runner.hpp"

#include <string>

/**
 * Private scratch directory of one run (sar-an-XXXXXX under the temp dir).
 * Holds the ranked candidate files handed to the archiver and is removed
 * on destruction unless cleanup was disabled.
 */
class RunWorkspace {
public:
  explicit RunWorkspace(bool clean_on_exit, const std::string &base_dir = "");
  ~RunWorkspace();

  RunWorkspace(const RunWorkspace &) = delete;
  RunWorkspace &operator=(const RunWorkspace &) = delete;

  bool valid() const { return !path_.empty(); }
  const std::string &path() const { return path_; }

  bool write_text(const std::string &name, const std::string &content) const;

  // One "score;timestamp;description" line per entry
  bool write_records(const std::string &name, const TopList &list) const;

  // top_<subsystem>.txt per ranked subsystem, top_all.txt and ranking.json
  bool write_ranking(const Ranker &ranker, size_t top_n) const;

  // tar -czf <archive_path> -C <workspace> .
  bool archive_to(const std::string &archive_path,
                  const ProcessRunner &runner) const;

private:
  std::string path_;
  bool clean_on_exit_;
};

#endif // RUN_WORKSPACE_HPP

#ifndef ACTIVITY_FILES_HPP
#define ACTIVITY_FILES_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace ActivityFiles {

// "sa" followed by one or more digits: sa15, sa20240115
bool is_activity_file_name(const std::string &name);

/**
 * Lists sysstat activity files found directly inside the given directories,
 * newest modification time first, truncated to max_files. Missing
 * directories and entries that cannot be stat'ed are skipped.
 */
std::vector<std::string> find_activity_files(
    const std::vector<std::string> &directories, size_t max_files);

} // namespace ActivityFiles

#endif // ACTIVITY_FILES_HPP

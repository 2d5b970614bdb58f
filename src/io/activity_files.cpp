#include "activity_files.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace ActivityFiles {

bool is_activity_file_name(const std::string &name) {
  if (name.size() < 3 || name.compare(0, 2, "sa") != 0)
    return false;
  return std::all_of(name.begin() + 2, name.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

std::vector<std::string>
find_activity_files(const std::vector<std::string> &directories,
                    size_t max_files) {
  struct Found {
    fs::file_time_type mtime;
    std::string path;
  };
  std::vector<Found> found;

  for (const auto &dir : directories) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
      LOG(LogLevel::DEBUG, LogComponent::IO_SOURCE,
          "Skipping activity directory " << dir << ": " << ec.message());
      continue;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
      if (ec)
        break;
      const fs::directory_entry &entry = *it;
      const std::string name = entry.path().filename().string();
      if (!is_activity_file_name(name))
        continue;

      std::error_code entry_ec;
      if (!entry.is_regular_file(entry_ec) || entry_ec)
        continue;
      auto mtime = entry.last_write_time(entry_ec);
      if (entry_ec) {
        LOG(LogLevel::DEBUG, LogComponent::IO_SOURCE,
            "Cannot stat " << entry.path() << ": " << entry_ec.message());
        continue;
      }
      found.push_back({mtime, entry.path().string()});
    }
  }

  std::stable_sort(found.begin(), found.end(),
                   [](const Found &a, const Found &b) {
                     if (a.mtime != b.mtime)
                       return a.mtime > b.mtime;
                     return a.path < b.path;
                   });
  if (found.size() > max_files)
    found.resize(max_files);

  std::vector<std::string> paths;
  paths.reserve(found.size());
  for (auto &f : found)
    paths.push_back(std::move(f.path));

  LOG(LogLevel::DEBUG, LogComponent::IO_SOURCE,
      "Selected " << paths.size() << " activity file(s)");
  return paths;
}

} // namespace ActivityFiles

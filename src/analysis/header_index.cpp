#include "header_index.hpp"
#include "utils/utils.hpp"

#include <string>
#include <string_view>

namespace analysis {

HeaderIndex::HeaderIndex(std::string_view header_line) {
  std::string_view line = header_line;
  while (!line.empty() && (line.front() == '#' || line.front() == ' '))
    line.remove_prefix(1);

  size_t position = 0;
  for (auto field : Utils::split_string_view(line, FIELD_DELIMITER)) {
    // Keep the first position when a name repeats
    index_.emplace(Utils::trim_copy(field), position++);
  }
}

bool HeaderIndex::is_header_line(std::string_view line) {
  return !line.empty() && line.front() == '#';
}

std::optional<size_t> HeaderIndex::find(const std::string &column) const {
  auto it = index_.find(column);
  if (it == index_.end())
    return std::nullopt;
  return it->second;
}

} // namespace analysis

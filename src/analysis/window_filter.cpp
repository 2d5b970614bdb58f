#include "window_filter.hpp"
#include "core/logger.hpp"
#include "header_index.hpp"
#include "utils/utils.hpp"

#include <string>
#include <vector>

namespace analysis {

std::optional<Window> Window::parse(std::string_view start,
                                    std::string_view end) {
  auto start_s = Utils::parse_time_of_day(start);
  auto end_s = Utils::parse_time_of_day(end);
  if (!start_s || !end_s)
    return std::nullopt;
  return Window(Utils::format_time_of_day(*start_s),
                Utils::format_time_of_day(*end_s));
}

bool Window::contains(std::string_view time_of_day) const {
  if (is_full_day())
    return true;
  if (wraps_midnight())
    return time_of_day >= start_ || time_of_day < end_;
  return time_of_day >= start_ && time_of_day < end_;
}

namespace {

std::optional<std::string_view>
row_time_of_day(std::string_view row, const std::optional<size_t> &ts_column) {
  auto fields = Utils::split_string_view(row, FIELD_DELIMITER);
  if (ts_column && *ts_column < fields.size())
    return Utils::time_of_day_part(fields[*ts_column]);
  for (auto field : fields)
    if (auto tod = Utils::time_of_day_part(field))
      return tod;
  return std::nullopt;
}

} // namespace

std::vector<std::string>
WindowFilter::filter(const std::vector<std::string> &lines) const {
  std::vector<std::string> kept;
  kept.reserve(lines.size());

  std::optional<size_t> ts_column;
  size_t dropped = 0;
  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string &line = lines[i];
    if (i == 0 || HeaderIndex::is_header_line(line)) {
      HeaderIndex header(line);
      ts_column = header.find("timestamp");
      kept.push_back(line);
      continue;
    }

    auto tod = row_time_of_day(line, ts_column);
    if (tod && window_.contains(*tod))
      kept.push_back(line);
    else
      ++dropped;
  }

  LOG(LogLevel::TRACE, LogComponent::ANALYSIS_WINDOW,
      "Window " << window_.start() << "-" << window_.end() << " kept "
                << kept.size() << " of " << lines.size() << " lines ("
                << dropped << " dropped)");
  return kept;
}

} // namespace analysis

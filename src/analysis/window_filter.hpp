#ifndef WINDOW_FILTER_HPP
#define WINDOW_FILTER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace analysis {

// [start, end) time-of-day range, compared as zero-padded "HH:MM:SS"
// strings regardless of the date. start == end selects the full day; a
// start later than end wraps over midnight.
class Window {
public:
  static std::optional<Window> parse(std::string_view start,
                                     std::string_view end);
  static Window full_day() { return Window("00:00:00", "00:00:00"); }

  bool is_full_day() const { return start_ == end_; }
  bool wraps_midnight() const { return start_ > end_; }
  bool contains(std::string_view time_of_day) const;

  const std::string &start() const { return start_; }
  const std::string &end() const { return end_; }

private:
  Window(std::string start, std::string end)
      : start_(std::move(start)), end_(std::move(end)) {}

  std::string start_;
  std::string end_;
};

class WindowFilter {
public:
  explicit WindowFilter(Window window) : window_(std::move(window)) {}

  // Header rows always pass; data rows pass when their timestamp is inside
  // the window. Rows without a recognizable timestamp are dropped.
  std::vector<std::string> filter(const std::vector<std::string> &lines) const;

  const Window &window() const { return window_; }

private:
  Window window_;
};

} // namespace analysis

#endif // WINDOW_FILTER_HPP

#include "utils.hpp"

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter) {
  std::vector<std::string_view> result;
  size_t start = 0;
  size_t end = str.find(delimiter);
  while (end != std::string_view::npos) {
    result.push_back(str.substr(start, end - start));
    start = end + 1;
    end = str.find(delimiter, start);
  }
  result.push_back(str.substr(start));
  return result;
}

std::optional<int> parse_time_of_day(std::string_view text) {
  auto parts = split_string_view(text, ':');
  if (parts.size() < 2 || parts.size() > 3)
    return std::nullopt;

  int limits[3] = {23, 59, 59};
  int values[3] = {0, 0, 0};
  for (size_t i = 0; i < parts.size(); ++i) {
    if (parts[i].size() != 2)
      return std::nullopt;
    if (!std::isdigit(static_cast<unsigned char>(parts[i][0])) ||
        !std::isdigit(static_cast<unsigned char>(parts[i][1])))
      return std::nullopt;
    auto value = string_to_number<int>(parts[i]);
    if (!value || *value > limits[i])
      return std::nullopt;
    values[i] = *value;
  }
  return values[0] * 3600 + values[1] * 60 + values[2];
}

std::string format_time_of_day(int seconds_since_midnight) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d",
                seconds_since_midnight / 3600,
                (seconds_since_midnight % 3600) / 60,
                seconds_since_midnight % 60);
  return buf;
}

std::optional<std::string_view> time_of_day_part(std::string_view timestamp) {
  // sadf always emits "YYYY-MM-DD HH:MM:SS", optionally followed by a zone
  if (timestamp.size() < 19 || timestamp[4] != '-' || timestamp[7] != '-' ||
      timestamp[10] != ' ')
    return std::nullopt;
  std::string_view tod = timestamp.substr(11, 8);
  if (tod[2] != ':' || tod[5] != ':')
    return std::nullopt;
  return tod;
}

std::string format_fixed(double value, int precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  return oss.str();
}

std::string current_iso8601_time() {
  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);
  std::tm local_tm{};
  localtime_r(&time_t_now, &local_tm);
  std::ostringstream oss;
  oss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S%z");
  return oss.str();
}

bool create_directory_for_file(const std::string &file_path) {
  std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
  if (parent.empty())
    return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

} // namespace Utils

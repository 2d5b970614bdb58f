#ifndef HEADER_INDEX_HPP
#define HEADER_INDEX_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace analysis {

constexpr char FIELD_DELIMITER = ';';

// Column name -> position, built from one header row of a decoded stream.
// sadf prefixes its header with "# ", which is stripped from the first name.
class HeaderIndex {
public:
  HeaderIndex() = default;
  explicit HeaderIndex(std::string_view header_line);

  static bool is_header_line(std::string_view line);

  std::optional<size_t> find(const std::string &column) const;
  bool contains(const std::string &column) const {
    return index_.find(column) != index_.end();
  }

private:
  std::unordered_map<std::string, size_t> index_;
};

} // namespace analysis

#endif // HEADER_INDEX_HPP

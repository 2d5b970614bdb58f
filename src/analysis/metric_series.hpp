#ifndef METRIC_SERIES_HPP
#define METRIC_SERIES_HPP

#include <cstddef>
#include <optional>
#include <vector>

namespace analysis {

/**
 * Values of one metric for one resource over the analysis window.
 * Statistics are exact over everything added; an empty series has none.
 */
class MetricSeries {
public:
  void add(double value) { values_.push_back(value); }

  /**
   * Arithmetic mean, or std::nullopt when no value was added
   */
  std::optional<double> mean() const;

  /**
   * Nearest-rank percentile: the value at rank ceil(p * n) of the sorted
   * series, clamped to [1, n]. The result is always a member of the series.
   * @param p Fraction in (0, 1]; anything else throws std::invalid_argument
   */
  std::optional<double> percentile(double p) const;

  std::optional<double> max() const;
  bool any_above(double threshold) const;

  size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }
  const std::vector<double> &values() const { return values_; }

private:
  std::vector<double> values_;
};

} // namespace analysis

#endif // METRIC_SERIES_HPP

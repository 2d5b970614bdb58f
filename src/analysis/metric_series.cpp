#include "metric_series.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace analysis {

namespace {
// Keeps p * n from landing one rank high through rounding (0.95 * 20)
constexpr double RANK_EPSILON = 1e-9;
} // namespace

std::optional<double> MetricSeries::mean() const {
  if (values_.empty())
    return std::nullopt;
  double sum = std::accumulate(values_.begin(), values_.end(), 0.0);
  return sum / static_cast<double>(values_.size());
}

std::optional<double> MetricSeries::percentile(double p) const {
  if (!(p > 0.0 && p <= 1.0))
    throw std::invalid_argument("percentile must be in (0, 1], got " +
                                std::to_string(p));
  if (values_.empty())
    return std::nullopt;

  const size_t n = values_.size();
  auto rank = static_cast<size_t>(
      std::ceil(p * static_cast<double>(n) - RANK_EPSILON));
  rank = std::clamp<size_t>(rank, 1, n);

  std::vector<double> sorted = values_;
  std::nth_element(sorted.begin(), sorted.begin() + (rank - 1), sorted.end());
  return sorted[rank - 1];
}

std::optional<double> MetricSeries::max() const {
  if (values_.empty())
    return std::nullopt;
  return *std::max_element(values_.begin(), values_.end());
}

bool MetricSeries::any_above(double threshold) const {
  return std::any_of(values_.begin(), values_.end(),
                     [threshold](double v) { return v > threshold; });
}

} // namespace analysis

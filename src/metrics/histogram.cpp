// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "metrics/histogram.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace synthnet {
namespace metrics {

uint64_t Histogram::ToBucket(double sample) {
  if (std::isnan(sample) || sample <= 0.0) {
    return 0;
  }
  const double rounded = std::round(sample);
  if (rounded >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
    return std::numeric_limits<uint64_t>::max();
  }
  return static_cast<uint64_t>(rounded);
}

void Histogram::increment(uint64_t value, uint64_t count) {
  if (count == 0) {
    return;
  }
  buckets_[value] += count;
  count_ += count;
}

void Histogram::record(double sample) {
  increment(ToBucket(sample));
}

std::optional<uint64_t> Histogram::min() const {
  if (buckets_.empty()) {
    return std::nullopt;
  }
  return buckets_.begin()->first;
}

std::optional<uint64_t> Histogram::max() const {
  if (buckets_.empty()) {
    return std::nullopt;
  }
  return buckets_.rbegin()->first;
}

std::optional<double> Histogram::mean() const {
  if (count_ == 0) {
    return std::nullopt;
  }
  long double sum = 0;
  for (const auto& [value, n] : buckets_) {
    sum += static_cast<long double>(value) * n;
  }
  return static_cast<double>(sum / count_);
}

std::optional<double> Histogram::stddev() const {
  auto avg = mean();
  if (!avg) {
    return std::nullopt;
  }
  long double sum_sq = 0;
  for (const auto& [value, n] : buckets_) {
    const long double diff = static_cast<long double>(value) - *avg;
    sum_sq += diff * diff * n;
  }
  return static_cast<double>(std::sqrt(sum_sq / count_));
}

std::optional<uint64_t> Histogram::percentile(double p) const {
  if (count_ == 0 || std::isnan(p)) {
    return std::nullopt;
  }
  p = std::clamp(p, 0.0, 100.0);

  // Smallest value whose cumulative count reaches ceil(p% of count), at least rank 1
  uint64_t rank = static_cast<uint64_t>(std::ceil(p / 100.0 * static_cast<double>(count_)));
  rank = std::clamp<uint64_t>(rank, 1, count_);

  uint64_t seen = 0;
  for (const auto& [value, n] : buckets_) {
    seen += n;
    if (seen >= rank) {
      return value;
    }
  }
  return buckets_.rbegin()->first;
}

}  // namespace metrics
}  // namespace synthnet

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <map>
#include <optional>

namespace synthnet {
namespace metrics {

/**
 * Histogram - integer-valued sample distribution.
 *
 * Samples are stored as (value, count) buckets, one bucket per distinct value,
 * so memory grows with the number of distinct values rather than samples.
 * Floating-point samples are rounded to the nearest integer; negative and NaN
 * samples land in bucket 0.
 *
 * Not synchronized; Recorder guards the histograms it owns.
 */
class Histogram {
public:
  Histogram() = default;

  void increment(uint64_t value, uint64_t count = 1);
  void record(double sample);

  uint64_t count() const { return count_; }
  bool empty() const { return count_ == 0; }

  // All of these return std::nullopt for an empty histogram
  std::optional<uint64_t> min() const;
  std::optional<uint64_t> max() const;
  std::optional<double> mean() const;
  std::optional<double> stddev() const;  // population standard deviation

  // Nearest-rank percentile, `p` in [0, 100]
  std::optional<uint64_t> percentile(double p) const;

  const std::map<uint64_t, uint64_t>& buckets() const { return buckets_; }

  // Rounding used by record()
  static uint64_t ToBucket(double sample);

private:
  std::map<uint64_t, uint64_t> buckets_;
  uint64_t count_{0};
};

}  // namespace metrics
}  // namespace synthnet

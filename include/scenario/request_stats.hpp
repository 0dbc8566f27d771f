// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "metrics/histogram.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace synthnet {
namespace scenario {

// Milliseconds as a float, the unit latency histograms are recorded in
inline double DurationAsMs(std::chrono::steady_clock::duration d) {
  return std::chrono::duration<double, std::milli>(d).count();
}

/**
 * RequestStats - one row of a request/response load test.
 *
 * `peers` concurrent peers each attempted `requests` round trips; `latencies`
 * holds one sample (ms) per completed round trip. Latency columns are 0 when
 * no round trip completed.
 */
struct RequestStats {
  uint32_t peers{0};
  uint32_t requests{0};
  metrics::Histogram latencies;
  double time_taken_secs{0.0};

  RequestStats() = default;
  RequestStats(uint32_t peers, uint32_t requests, metrics::Histogram latencies, double time_taken_secs)
      : peers(peers), requests(requests), latencies(std::move(latencies)), time_taken_secs(time_taken_secs) {}

  uint64_t samples() const { return latencies.count(); }
  uint64_t attempted() const { return static_cast<uint64_t>(peers) * requests; }

  uint64_t min_ms() const;
  uint64_t max_ms() const;
  double stddev_ms() const;
  uint64_t percentile_ms(double p) const;

  // samples / (peers * requests) * 100
  double completion_percent() const;

  // samples / time_taken_secs
  double requests_per_sec() const;
};

/**
 * RequestsTable - text table of RequestStats rows, one per peer count.
 *
 *   | peers | requests | min (ms) | max (ms) | std dev (ms) | 10% (ms) | ...
 */
class RequestsTable {
public:
  void add_row(RequestStats row) { rows_.push_back(std::move(row)); }
  const std::vector<RequestStats>& rows() const { return rows_; }
  bool empty() const { return rows_.empty(); }

  std::string ToString() const;

  // JSON array with one object per row
  std::string ToJson() const;

private:
  std::vector<RequestStats> rows_;
};

}  // namespace scenario
}  // namespace synthnet

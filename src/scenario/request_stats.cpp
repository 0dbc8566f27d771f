// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scenario/request_stats.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <array>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace synthnet {
namespace scenario {

uint64_t RequestStats::min_ms() const {
  return latencies.min().value_or(0);
}

uint64_t RequestStats::max_ms() const {
  return latencies.max().value_or(0);
}

double RequestStats::stddev_ms() const {
  return latencies.stddev().value_or(0.0);
}

uint64_t RequestStats::percentile_ms(double p) const {
  return latencies.percentile(p).value_or(0);
}

double RequestStats::completion_percent() const {
  const uint64_t expected = attempted();
  if (expected == 0) {
    return 0.0;
  }
  return static_cast<double>(samples()) / static_cast<double>(expected) * 100.0;
}

double RequestStats::requests_per_sec() const {
  if (time_taken_secs <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(samples()) / time_taken_secs;
}

namespace {

const std::array<const char*, 13> kHeaders = {
    "peers",    "requests", "min (ms)", "max (ms)",     "std dev (ms)", "10% (ms)",   "50% (ms)",
    "75% (ms)", "90% (ms)", "99% (ms)", "completion %", "time (s)",     "requests/s",
};

std::array<std::string, 13> format_row(const RequestStats& row) {
  return {
      std::to_string(row.peers),
      std::to_string(row.requests),
      std::to_string(row.min_ms()),
      std::to_string(row.max_ms()),
      fmt::format("{:.0f}", row.stddev_ms()),
      std::to_string(row.percentile_ms(10)),
      std::to_string(row.percentile_ms(50)),
      std::to_string(row.percentile_ms(75)),
      std::to_string(row.percentile_ms(90)),
      std::to_string(row.percentile_ms(99)),
      fmt::format("{:.2f}", row.completion_percent()),
      fmt::format("{:.2f}", row.time_taken_secs),
      fmt::format("{:.2f}", row.requests_per_sec()),
  };
}

}  // namespace

std::string RequestsTable::ToString() const {
  std::vector<std::array<std::string, 13>> cells;
  cells.reserve(rows_.size());
  for (const auto& row : rows_) {
    cells.push_back(format_row(row));
  }

  std::array<size_t, 13> widths{};
  for (size_t i = 0; i < kHeaders.size(); ++i) {
    widths[i] = std::string(kHeaders[i]).size();
    for (const auto& r : cells) {
      widths[i] = std::max(widths[i], r[i].size());
    }
  }

  std::string separator = "+";
  for (size_t w : widths) {
    separator += std::string(w + 2, '-') + "+";
  }
  separator += "\n";

  std::string out = separator + "|";
  for (size_t i = 0; i < kHeaders.size(); ++i) {
    out += fmt::format(" {:<{}} |", kHeaders[i], widths[i]);
  }
  out += "\n" + separator;

  // Numbers right-aligned
  for (const auto& r : cells) {
    out += "|";
    for (size_t i = 0; i < r.size(); ++i) {
      out += fmt::format(" {:>{}} |", r[i], widths[i]);
    }
    out += "\n";
  }
  out += separator;
  return out;
}

std::string RequestsTable::ToJson() const {
  json rows = json::array();
  for (const auto& row : rows_) {
    json j;
    j["peers"] = row.peers;
    j["requests"] = row.requests;
    j["samples"] = row.samples();
    j["min_ms"] = row.min_ms();
    j["max_ms"] = row.max_ms();
    j["stddev_ms"] = row.stddev_ms();
    j["p10_ms"] = row.percentile_ms(10);
    j["p50_ms"] = row.percentile_ms(50);
    j["p75_ms"] = row.percentile_ms(75);
    j["p90_ms"] = row.percentile_ms(90);
    j["p99_ms"] = row.percentile_ms(99);
    j["completion_percent"] = row.completion_percent();
    j["time_taken_secs"] = row.time_taken_secs;
    j["requests_per_sec"] = row.requests_per_sec();
    rows.push_back(j);
  }
  return rows.dump(2);
}

}  // namespace scenario
}  // namespace synthnet

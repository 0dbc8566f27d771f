// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "metrics/histogram.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace synthnet {
namespace metrics {

using Labels = std::map<std::string, std::string>;

// Metric name plus its label set; two keys with the same name and different
// labels are different series.
struct MetricKey {
  std::string name;
  Labels labels;

  bool operator<(const MetricKey& other) const {
    if (name != other.name)
      return name < other.name;
    return labels < other.labels;
  }
  bool operator==(const MetricKey& other) const { return name == other.name && labels == other.labels; }

  // "name" or "name{k=v,k2=v2}"
  std::string ToString() const;
};

enum class MetricKind { Counter, Gauge, Histogram };

std::string MetricKindAsString(MetricKind kind);

/**
 * Recorder - in-process store of named counters, gauges and histograms.
 *
 * Series must be registered before they are written. Writes to an
 * unregistered (or differently typed) series are dropped with a rate-limited
 * warning and reported through the return value; they never throw.
 *
 * Recorder::instance() is the process default used by scenario code; tests
 * may construct their own Recorder and pass it by reference.
 *
 * Thread-safety: every method locks the recorder's mutex.
 */
class Recorder {
public:
  Recorder() = default;

  Recorder(const Recorder&) = delete;
  Recorder& operator=(const Recorder&) = delete;

  // Process-wide default recorder
  static Recorder& instance();

  // Mark the default recorder installed and return it. Safe to call any
  // number of times; only the first call logs.
  static Recorder& install();
  static bool is_installed();

  // Registration is idempotent; re-registering keeps existing samples.
  // Returns false if the key is already registered as another kind.
  bool register_counter(const std::string& name, const Labels& labels = {});
  bool register_gauge(const std::string& name, const Labels& labels = {});
  bool register_histogram(const std::string& name, const Labels& labels = {});

  bool is_registered(const std::string& name, const Labels& labels = {}) const;

  // Writes return true when the sample was recorded
  bool increment_counter(const std::string& name, uint64_t value = 1, const Labels& labels = {});
  bool set_gauge(const std::string& name, double value, const Labels& labels = {});
  bool record_histogram(const std::string& name, double sample, const Labels& labels = {});

  // Snapshots
  std::map<MetricKey, uint64_t> counters() const;
  std::map<MetricKey, double> gauges() const;
  std::map<MetricKey, Histogram> histograms() const;

  std::optional<uint64_t> counter(const std::string& name, const Labels& labels = {}) const;
  std::optional<double> gauge(const std::string& name, const Labels& labels = {}) const;
  std::optional<Histogram> histogram(const std::string& name, const Labels& labels = {}) const;

  // Writes that hit an unregistered series since construction (or clear())
  uint64_t dropped_writes() const;

  // Drop every registered series and its samples
  void clear();

  // JSON snapshot: {"counters": {...}, "gauges": {...}, "histograms": {...}}
  std::string to_json() const;

private:
  struct Series {
    MetricKind kind;
    uint64_t counter{0};
    double gauge{0.0};
    std::vector<double> samples;
  };

  bool register_series(const MetricKey& key, MetricKind kind);

  // Caller holds mutex_; nullptr (after logging) if key is not a `kind` series
  Series* find_for_write(const MetricKey& key, MetricKind kind);

  mutable std::mutex mutex_;
  std::map<MetricKey, Series> series_;
  uint64_t dropped_writes_{0};

  static std::atomic<bool> installed_;
};

}  // namespace metrics
}  // namespace synthnet

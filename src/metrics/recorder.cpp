// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "metrics/recorder.hpp"

#include "util/logging.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace synthnet {
namespace metrics {

std::atomic<bool> Recorder::installed_{false};

std::string MetricKey::ToString() const {
  if (labels.empty()) {
    return name;
  }
  std::string out = name + "{";
  bool first = true;
  for (const auto& [k, v] : labels) {
    if (!first)
      out += ",";
    out += k + "=" + v;
    first = false;
  }
  out += "}";
  return out;
}

std::string MetricKindAsString(MetricKind kind) {
  switch (kind) {
  case MetricKind::Counter:
    return "counter";
  case MetricKind::Gauge:
    return "gauge";
  case MetricKind::Histogram:
    return "histogram";
  default:
    return "unknown";
  }
}

Recorder& Recorder::instance() {
  static Recorder recorder;
  return recorder;
}

Recorder& Recorder::install() {
  if (!installed_.exchange(true)) {
    LOG_METRICS_DEBUG("metrics recorder installed");
  }
  return instance();
}

bool Recorder::is_installed() {
  return installed_.load();
}

bool Recorder::register_series(const MetricKey& key, MetricKind kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = series_.find(key);
  if (it != series_.end()) {
    if (it->second.kind != kind) {
      LOG_METRICS_WARN("cannot register {} as {}: already a {}", key.ToString(), MetricKindAsString(kind),
                       MetricKindAsString(it->second.kind));
      return false;
    }
    return true;
  }
  series_.emplace(key, Series{kind, 0, 0.0, {}});
  LOG_METRICS_DEBUG("registered {} {}", MetricKindAsString(kind), key.ToString());
  return true;
}

bool Recorder::register_counter(const std::string& name, const Labels& labels) {
  return register_series(MetricKey{name, labels}, MetricKind::Counter);
}

bool Recorder::register_gauge(const std::string& name, const Labels& labels) {
  return register_series(MetricKey{name, labels}, MetricKind::Gauge);
}

bool Recorder::register_histogram(const std::string& name, const Labels& labels) {
  return register_series(MetricKey{name, labels}, MetricKind::Histogram);
}

bool Recorder::is_registered(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return series_.count(MetricKey{name, labels}) > 0;
}

Recorder::Series* Recorder::find_for_write(const MetricKey& key, MetricKind kind) {
  auto it = series_.find(key);
  if (it == series_.end()) {
    ++dropped_writes_;
    LOG_METRICS_WARN_RL("dropping write to unregistered {} {}", MetricKindAsString(kind), key.ToString());
    return nullptr;
  }
  if (it->second.kind != kind) {
    ++dropped_writes_;
    LOG_METRICS_WARN_RL("dropping {} write to {} registered as {}", MetricKindAsString(kind), key.ToString(),
                        MetricKindAsString(it->second.kind));
    return nullptr;
  }
  return &it->second;
}

bool Recorder::increment_counter(const std::string& name, uint64_t value, const Labels& labels) {
  std::lock_guard<std::mutex> lock(mutex_);
  Series* series = find_for_write(MetricKey{name, labels}, MetricKind::Counter);
  if (!series) {
    return false;
  }
  series->counter += value;
  return true;
}

bool Recorder::set_gauge(const std::string& name, double value, const Labels& labels) {
  std::lock_guard<std::mutex> lock(mutex_);
  Series* series = find_for_write(MetricKey{name, labels}, MetricKind::Gauge);
  if (!series) {
    return false;
  }
  series->gauge = value;
  return true;
}

bool Recorder::record_histogram(const std::string& name, double sample, const Labels& labels) {
  std::lock_guard<std::mutex> lock(mutex_);
  Series* series = find_for_write(MetricKey{name, labels}, MetricKind::Histogram);
  if (!series) {
    return false;
  }
  series->samples.push_back(sample);
  return true;
}

std::map<MetricKey, uint64_t> Recorder::counters() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<MetricKey, uint64_t> out;
  for (const auto& [key, series] : series_) {
    if (series.kind == MetricKind::Counter) {
      out.emplace(key, series.counter);
    }
  }
  return out;
}

std::map<MetricKey, double> Recorder::gauges() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<MetricKey, double> out;
  for (const auto& [key, series] : series_) {
    if (series.kind == MetricKind::Gauge) {
      out.emplace(key, series.gauge);
    }
  }
  return out;
}

std::map<MetricKey, Histogram> Recorder::histograms() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<MetricKey, Histogram> out;
  for (const auto& [key, series] : series_) {
    if (series.kind != MetricKind::Histogram)
      continue;
    Histogram h;
    for (double sample : series.samples) {
      h.record(sample);
    }
    out.emplace(key, std::move(h));
  }
  return out;
}

std::optional<uint64_t> Recorder::counter(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = series_.find(MetricKey{name, labels});
  if (it == series_.end() || it->second.kind != MetricKind::Counter) {
    return std::nullopt;
  }
  return it->second.counter;
}

std::optional<double> Recorder::gauge(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = series_.find(MetricKey{name, labels});
  if (it == series_.end() || it->second.kind != MetricKind::Gauge) {
    return std::nullopt;
  }
  return it->second.gauge;
}

std::optional<Histogram> Recorder::histogram(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = series_.find(MetricKey{name, labels});
  if (it == series_.end() || it->second.kind != MetricKind::Histogram) {
    return std::nullopt;
  }
  Histogram h;
  for (double sample : it->second.samples) {
    h.record(sample);
  }
  return h;
}

uint64_t Recorder::dropped_writes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_writes_;
}

void Recorder::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  series_.clear();
  dropped_writes_ = 0;
}

std::string Recorder::to_json() const {
  json j;
  j["counters"] = json::object();
  j["gauges"] = json::object();
  j["histograms"] = json::object();

  for (const auto& [key, value] : counters()) {
    j["counters"][key.ToString()] = value;
  }
  for (const auto& [key, value] : gauges()) {
    j["gauges"][key.ToString()] = value;
  }
  for (const auto& [key, h] : histograms()) {
    json entry;
    entry["count"] = h.count();
    if (!h.empty()) {
      entry["min"] = *h.min();
      entry["max"] = *h.max();
      entry["mean"] = *h.mean();
      entry["stddev"] = *h.stddev();
      entry["p50"] = *h.percentile(50);
      entry["p90"] = *h.percentile(90);
      entry["p99"] = *h.percentile(99);
    }
    j["histograms"][key.ToString()] = entry;
  }
  return j.dump(2);
}

}  // namespace metrics
}  // namespace synthnet

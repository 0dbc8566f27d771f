// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace synthnet {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int burst, int period_seconds) {
  if (burst <= 0 || period_seconds <= 0) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  const auto now = GetSteadyTime();
  Bucket& bucket = buckets_[callsite_key];

  // A fresh callsite starts with a full bucket
  if (!bucket.primed) {
    bucket.tokens = static_cast<double>(burst);
    bucket.last_refill = now;
    bucket.primed = true;
  }

  const auto elapsed_s = std::chrono::duration_cast<std::chrono::seconds>(now - bucket.last_refill).count();
  if (elapsed_s > 0) {
    const double per_second = static_cast<double>(burst) / static_cast<double>(period_seconds);
    bucket.tokens = std::min(static_cast<double>(burst), bucket.tokens + per_second * static_cast<double>(elapsed_s));
    bucket.last_refill = now;
  }

  if (bucket.tokens < 1.0) {
    ++bucket.suppressed;
    return false;
  }
  bucket.tokens -= 1.0;
  return true;
}

uint64_t RateLimiter::suppressed(const std::string& callsite_key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(callsite_key);
  return it == buckets_.end() ? 0 : it->second.suppressed;
}

void RateLimiter::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.clear();
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace synthnet

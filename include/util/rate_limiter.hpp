// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Per-callsite token bucket used by the rate-limited log macros

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace synthnet {
namespace util {

/**
 * RateLimiter - token bucket keyed by log callsite
 *
 * A misbehaving node under test can produce the same protocol error thousands
 * of times per second (unknown commands, writes to unregistered metrics from
 * 800 concurrent peers). Each callsite gets `burst` tokens refilled evenly over
 * `period_seconds`; once empty, further messages from that callsite are
 * counted but not emitted.
 */
class RateLimiter {
public:
  // Returns true if the callsite may log now and consumes one token.
  bool should_log(const std::string& callsite_key, int burst, int period_seconds);

  // Number of messages suppressed for a callsite since it was created or reset
  uint64_t suppressed(const std::string& callsite_key) const;

  // Forget all callsites (tests)
  void reset();

  static RateLimiter& instance();

private:
  struct Bucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill{};
    uint64_t suppressed{0};
    bool primed{false};
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
};

}  // namespace util
}  // namespace synthnet

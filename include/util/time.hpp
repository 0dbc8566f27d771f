// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace synthnet {
namespace util {

// Current unix time in seconds (mockable)
int64_t GetTime();

// Monotonic clock (advances with mock time when mock time is active)
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time (0 disables mock time)
void SetMockTime(int64_t time);

int64_t GetMockTime();

// Format unix time as "YYYY-MM-DD HH:MM:SS UTC"
std::string FormatTime(int64_t unix_time);

// RAII mock time: sets mock time on construction, restores the previous value on destruction
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace synthnet

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace synthnet {
namespace util {

namespace {

// 0 = real time
std::atomic<int64_t> g_mock_time{0};

// Anchor used to derive a monotonic clock from mock time. The first call to
// GetSteadyTime() while mocked pins (real steady now, mock seconds); later
// calls add the mock delta to the pinned steady point.
struct SteadyAnchor {
  std::mutex mutex;
  bool pinned{false};
  std::chrono::steady_clock::time_point steady{};
  int64_t mock_seconds{0};
};

SteadyAnchor& anchor() {
  static SteadyAnchor a;
  return a;
}

}  // namespace

int64_t GetTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  SteadyAnchor& a = anchor();
  std::lock_guard<std::mutex> lock(a.mutex);
  if (!a.pinned) {
    a.steady = std::chrono::steady_clock::now();
    a.mock_seconds = mock;
    a.pinned = true;
  }
  return a.steady + std::chrono::seconds(mock - a.mock_seconds);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
  if (time == 0) {
    SteadyAnchor& a = anchor();
    std::lock_guard<std::mutex> lock(a.mutex);
    a.pinned = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

std::string FormatTime(int64_t unix_time) {
  const std::chrono::sys_seconds secs{std::chrono::seconds{unix_time}};
  const auto days = std::chrono::floor<std::chrono::days>(secs);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss hms{secs - days};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2) << static_cast<unsigned>(ymd.day()) << ' '
      << std::setw(2) << hms.hours().count() << ':' << std::setw(2) << hms.minutes().count() << ':' << std::setw(2)
      << hms.seconds().count() << " UTC";
  return oss.str();
}

}  // namespace util
}  // namespace synthnet

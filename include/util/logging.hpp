// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace synthnet {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "network", "metrics", "app") sharing
 * the same sinks. Loggers are created on first use, so library code can log
 * before the harness has called Initialize(); the first explicit Initialize()
 * after that rebuilds the sinks with the requested level and destination.
 *
 * Thread-safety: all methods are protected by a single mutex.
 */
class LogManager {
public:
  // Initialize logging. An empty log_file_path logs to stdout.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "synthnet.log");

  // Flush and drop all loggers. Later logging calls re-initialize with defaults.
  static void Shutdown();

  // Logger for a component; unknown names map to "default".
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  static void SetLogLevel(const std::string& level);

  static void SetComponentLevel(const std::string& component, const std::string& level);

  static std::vector<std::string> Components();
};

}  // namespace util
}  // namespace synthnet

// Convenience macros for logging
#define LOG_TRACE(...) synthnet::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) synthnet::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) synthnet::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) synthnet::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) synthnet::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...) synthnet::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) synthnet::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) synthnet::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) synthnet::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) synthnet::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_METRICS_DEBUG(...) synthnet::util::LogManager::GetLogger("metrics")->debug(__VA_ARGS__)
#define LOG_METRICS_INFO(...) synthnet::util::LogManager::GetLogger("metrics")->info(__VA_ARGS__)
#define LOG_METRICS_WARN(...) synthnet::util::LogManager::GetLogger("metrics")->warn(__VA_ARGS__)

#define LOG_APP_INFO(...) synthnet::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...) synthnet::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...) synthnet::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// For messages driven by the node under test or by scenario code running on
// hundreds of peers at once: 200 messages per hour per callsite.

#include "util/rate_limiter.hpp"

// Helper macro to generate callsite key from file:line
#define SYNTHNET_CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define SYNTHNET_LOG_RL_(component, level, ...)                                                                        \
  do {                                                                                                                 \
    if (synthnet::util::RateLimiter::instance().should_log(SYNTHNET_CALLSITE_KEY_, 200, 3600)) {                       \
      synthnet::util::LogManager::GetLogger(component)->level(__VA_ARGS__);                                            \
    }                                                                                                                  \
  } while (0)

#define LOG_WARN_RL(...) SYNTHNET_LOG_RL_("default", warn, __VA_ARGS__)
#define LOG_ERROR_RL(...) SYNTHNET_LOG_RL_("default", error, __VA_ARGS__)
#define LOG_NET_WARN_RL(...) SYNTHNET_LOG_RL_("network", warn, __VA_ARGS__)
#define LOG_NET_ERROR_RL(...) SYNTHNET_LOG_RL_("network", error, __VA_ARGS__)
#define LOG_METRICS_WARN_RL(...) SYNTHNET_LOG_RL_("metrics", warn, __VA_ARGS__)

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <iostream>
#include <map>
#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace synthnet {
namespace util {

namespace {

const std::vector<std::string> kComponents = {"default", "network", "metrics", "app"};

struct LogState {
  std::mutex mutex;
  bool initialized{false};
  // True once Initialize() has been called explicitly (not an implicit default)
  bool configured{false};
  std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
};

LogState& state() {
  static LogState s;
  return s;
}

// Caller holds state().mutex
void build_loggers(LogState& s, const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::vector<spdlog::sink_ptr> sinks;
  if (log_to_file && !log_file_path.empty()) {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    sinks.push_back(file_sink);
  } else {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
    sinks.push_back(console_sink);
  }

  const auto level = spdlog::level::from_str(log_level);
  for (const auto& component : kComponents) {
    spdlog::drop(component);
    auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    s.loggers[component] = logger;
  }
  s.initialized = true;
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.configured) {
    return;
  }

  try {
    build_loggers(s, log_level, log_to_file, log_file_path);
    s.configured = true;
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    return;
  }
  s.loggers["default"]->debug("logging initialized (level: {})", log_level);
}

void LogManager::Shutdown() {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (!s.initialized) {
    return;
  }
  for (auto& [name, logger] : s.loggers) {
    logger->flush();
    spdlog::drop(name);
  }
  s.loggers.clear();
  s.initialized = false;
  s.configured = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (!s.initialized) {
    try {
      build_loggers(s, "info", false, "");
    } catch (const spdlog::spdlog_ex& ex) {
      std::cerr << "Log initialization failed: " << ex.what() << std::endl;
      return spdlog::default_logger();
    }
  }

  auto it = s.loggers.find(name);
  if (it != s.loggers.end()) {
    return it->second;
  }
  return s.loggers["default"];
}

void LogManager::SetLogLevel(const std::string& level) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  const auto log_level = spdlog::level::from_str(level);
  for (auto& [name, logger] : s.loggers) {
    logger->set_level(log_level);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  auto it = s.loggers.find(component);
  if (it == s.loggers.end()) {
    return;
  }
  it->second->set_level(spdlog::level::from_str(level));
}

std::vector<std::string> LogManager::Components() {
  return kComponents;
}

}  // namespace util
}  // namespace synthnet

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/node_config.hpp"

#include "util/logging.hpp"

#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace synthnet {
namespace network {

std::string FilterActionAsString(FilterAction action) {
  switch (action) {
  case FilterAction::Pass:
    return "pass";
  case FilterAction::Drop:
    return "drop";
  case FilterAction::AutoReply:
    return "auto-reply";
  case FilterAction::AutoReplyAndPass:
    return "auto-reply-and-pass";
  default:
    return "unknown";
  }
}

std::optional<FilterAction> ParseFilterAction(std::string_view text) {
  if (text == "pass")
    return FilterAction::Pass;
  if (text == "drop")
    return FilterAction::Drop;
  if (text == "auto-reply")
    return FilterAction::AutoReply;
  if (text == "auto-reply-and-pass")
    return FilterAction::AutoReplyAndPass;
  return std::nullopt;
}

std::optional<uint32_t> MagicForNetwork(std::string_view name) {
  if (name == "mainnet")
    return protocol::magic::MAINNET;
  if (name == "testnet")
    return protocol::magic::TESTNET;
  if (name == "regtest")
    return protocol::magic::REGTEST;
  return std::nullopt;
}

FilterAction SyntheticNodeConfig::action_for(message::MessageKind kind) const {
  auto it = filters.find(kind);
  if (it != filters.end()) {
    return it->second;
  }
  if (auto_reply == AutoReplyMode::All) {
    switch (kind) {
    case message::MessageKind::Ping:
    case message::MessageKind::Version:
    case message::MessageKind::GetAddr:
    case message::MessageKind::MemPool:
    case message::MessageKind::GetBlocks:
    case message::MessageKind::GetHeaders:
    case message::MessageKind::GetData:
      return FilterAction::AutoReplyAndPass;
    default:
      break;
    }
  }
  return FilterAction::Pass;
}

namespace {

template <typename T>
std::optional<std::string> read_unsigned(const json& j, const char* key, T& out) {
  if (!j.contains(key))
    return std::nullopt;
  const auto& v = j.at(key);
  if (!v.is_number_unsigned()) {
    return std::string("'") + key + "' must be a non-negative integer";
  }
  auto value = v.get<uint64_t>();
  if (value > std::numeric_limits<T>::max()) {
    return std::string("'") + key + "' is out of range";
  }
  out = static_cast<T>(value);
  return std::nullopt;
}

// Timeouts are positive and at most MAX_TIMEOUT
std::optional<std::string> read_timeout(const json& j, const char* key, std::chrono::milliseconds& out) {
  uint64_t ms = 0;
  if (auto err = read_unsigned(j, key, ms))
    return err;
  if (ms == 0 || ms > static_cast<uint64_t>(MAX_TIMEOUT.count())) {
    return std::string("'") + key + "' must be between 1 and " + std::to_string(MAX_TIMEOUT.count());
  }
  out = std::chrono::milliseconds(static_cast<int64_t>(ms));
  return std::nullopt;
}

std::optional<std::string> apply_json(const json& j, SyntheticNodeConfig& cfg) {
  if (!j.is_object()) {
    return "configuration must be a JSON object";
  }

  static const char* const kKnownKeys[] = {
      "handshake",  "auto_reply",  "max_peers",  "connect_timeout_ms", "io_timeout_ms", "network", "network_magic",
      "listen",     "listen_port", "user_agent", "start_height",       "services",      "filters",
  };
  for (const auto& [key, value] : j.items()) {
    bool known = false;
    for (const char* k : kKnownKeys) {
      if (key == k) {
        known = true;
        break;
      }
    }
    if (!known) {
      return "unknown key '" + key + "'";
    }
  }

  if (j.contains("handshake")) {
    const auto mode = j.at("handshake").get<std::string>();
    if (mode == "full") {
      cfg.handshake = HandshakeMode::Full;
    } else if (mode == "none") {
      cfg.handshake = HandshakeMode::None;
    } else {
      return "invalid handshake mode '" + mode + "'";
    }
  }

  if (j.contains("auto_reply")) {
    const auto mode = j.at("auto_reply").get<std::string>();
    if (mode == "all") {
      cfg.auto_reply = AutoReplyMode::All;
    } else if (mode == "none") {
      cfg.auto_reply = AutoReplyMode::None;
    } else {
      return "invalid auto_reply mode '" + mode + "'";
    }
  }

  if (auto err = read_unsigned(j, "max_peers", cfg.max_peers))
    return err;

  if (j.contains("connect_timeout_ms")) {
    if (auto err = read_timeout(j, "connect_timeout_ms", cfg.connect_timeout))
      return err;
  }
  if (j.contains("io_timeout_ms")) {
    if (auto err = read_timeout(j, "io_timeout_ms", cfg.io_timeout))
      return err;
  }

  if (j.contains("network")) {
    const auto name = j.at("network").get<std::string>();
    auto magic = MagicForNetwork(name);
    if (!magic) {
      return "unknown network '" + name + "'";
    }
    cfg.network_magic = *magic;
  }
  // An explicit magic wins over the network name
  if (auto err = read_unsigned(j, "network_magic", cfg.network_magic))
    return err;

  if (j.contains("listen")) {
    cfg.listen = j.at("listen").get<bool>();
  }
  if (auto err = read_unsigned(j, "listen_port", cfg.listen_port))
    return err;
  if (j.contains("user_agent")) {
    cfg.user_agent = j.at("user_agent").get<std::string>();
    if (!message::IsValidUtf8(cfg.user_agent)) {
      return "'user_agent' is not valid UTF-8";
    }
  }
  if (auto err = read_unsigned(j, "start_height", cfg.start_height))
    return err;
  if (auto err = read_unsigned(j, "services", cfg.services))
    return err;

  if (j.contains("filters")) {
    const auto& filters = j.at("filters");
    if (!filters.is_object()) {
      return "'filters' must be an object";
    }
    for (const auto& [command, action_value] : filters.items()) {
      auto kind = message::KindFromCommand(command);
      if (!kind) {
        return "unknown message kind '" + command + "' in filters";
      }
      const auto action_name = action_value.get<std::string>();
      auto action = ParseFilterAction(action_name);
      if (!action) {
        return "invalid filter action '" + action_name + "' for '" + command + "'";
      }
      cfg.filters[*kind] = *action;
    }
  }

  if (cfg.max_peers == 0) {
    return "'max_peers' must be at least 1";
  }
  return std::nullopt;
}

}  // namespace

std::optional<std::string> LoadNodeConfigFromString(const std::string& text, SyntheticNodeConfig& config) {
  try {
    json j = json::parse(text);
    SyntheticNodeConfig updated = config;
    if (auto err = apply_json(j, updated)) {
      return err;
    }
    config = std::move(updated);
    return std::nullopt;
  } catch (const json::exception& e) {
    return std::string("invalid configuration JSON: ") + e.what();
  }
}

std::optional<std::string> LoadNodeConfigFromFile(const std::string& path, SyntheticNodeConfig& config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return "cannot open configuration file " + path;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto err = LoadNodeConfigFromString(buffer.str(), config);
  if (err) {
    LOG_ERROR("failed to load configuration from {}: {}", path, *err);
  } else {
    LOG_DEBUG("loaded configuration from {}", path);
  }
  return err;
}

std::string NodeConfigToJson(const SyntheticNodeConfig& config) {
  json j;
  j["handshake"] = config.handshake == HandshakeMode::Full ? "full" : "none";
  j["auto_reply"] = config.auto_reply == AutoReplyMode::All ? "all" : "none";
  j["max_peers"] = config.max_peers;
  j["connect_timeout_ms"] = config.connect_timeout.count();
  j["io_timeout_ms"] = config.io_timeout.count();
  j["network_magic"] = config.network_magic;
  j["listen"] = config.listen;
  j["listen_port"] = config.listen_port;
  j["user_agent"] = config.user_agent;
  j["start_height"] = config.start_height;
  j["services"] = config.services;

  json filters = json::object();
  for (const auto& [kind, action] : config.filters) {
    filters[message::CommandName(kind)] = FilterActionAsString(action);
  }
  j["filters"] = filters;
  return j.dump(2);
}

}  // namespace network
}  // namespace synthnet

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace synthnet {
namespace network {

enum class HandshakeMode {
  None,  // Connection is Ready once TCP is open
  Full,  // VERSION/VERACK exchange before Ready
};

enum class AutoReplyMode {
  None,  // Every message is queued for the caller
  All,   // Messages with a canonical reply are answered automatically
};

// What a session does with one inbound message kind once Ready
enum class FilterAction {
  Pass,              // Queue for the caller
  Drop,              // Discard silently
  AutoReply,         // Send the canonical reply (if any) and consume
  AutoReplyAndPass,  // Send the canonical reply (if any) and queue
};

std::string FilterActionAsString(FilterAction action);
std::optional<FilterAction> ParseFilterAction(std::string_view text);

// Magic bytes for "mainnet", "testnet" or "regtest"
std::optional<uint32_t> MagicForNetwork(std::string_view name);

// Defaults
inline constexpr size_t DEFAULT_MAX_PEERS = 100;
inline constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{std::chrono::seconds(10)};
inline constexpr std::chrono::milliseconds DEFAULT_IO_TIMEOUT{std::chrono::seconds(10)};
// Largest connect or I/O timeout a configuration file may set (one day)
inline constexpr std::chrono::milliseconds MAX_TIMEOUT{std::chrono::hours(24)};

/**
 * SyntheticNodeConfig - everything a synthetic node needs, fixed at construction.
 *
 * Under AutoReplyMode::All, kinds with a canonical reply default to
 * AutoReplyAndPass and all other kinds to Pass. Entries in `filters` override
 * the default for their kind in either mode.
 */
struct SyntheticNodeConfig {
  HandshakeMode handshake;
  AutoReplyMode auto_reply;
  size_t max_peers;                            // Tracked connections, including those mid-handshake
  std::chrono::milliseconds connect_timeout;   // TCP connect deadline (<= 0 disables it)
  std::chrono::milliseconds io_timeout;        // Deadline for each handshake await (<= 0 disables it)
  uint32_t network_magic;
  bool listen;           // Accept inbound connections
  uint16_t listen_port;  // 0 = ephemeral

  // Fields of the VERSION we send
  std::string user_agent;
  uint32_t start_height;
  uint64_t services;

  std::map<message::MessageKind, FilterAction> filters;

  SyntheticNodeConfig()
      : handshake(HandshakeMode::None), auto_reply(AutoReplyMode::None), max_peers(DEFAULT_MAX_PEERS),
        connect_timeout(DEFAULT_CONNECT_TIMEOUT), io_timeout(DEFAULT_IO_TIMEOUT),
        network_magic(protocol::magic::TESTNET), listen(false), listen_port(0), user_agent(""), start_height(0),
        services(protocol::NODE_NETWORK) {}

  // Effective action for `kind` (override first, then the auto-reply default)
  FilterAction action_for(message::MessageKind kind) const;

  // Builder-style helpers
  SyntheticNodeConfig& with_full_handshake() {
    handshake = HandshakeMode::Full;
    return *this;
  }
  SyntheticNodeConfig& with_all_auto_reply() {
    auto_reply = AutoReplyMode::All;
    return *this;
  }
  SyntheticNodeConfig& with_filter(message::MessageKind kind, FilterAction action) {
    filters[kind] = action;
    return *this;
  }
};

/**
 * JSON configuration. Every key is optional; absent keys keep the value
 * already in `config`.
 *
 *   {
 *     "handshake": "full" | "none",
 *     "auto_reply": "all" | "none",
 *     "max_peers": 100,
 *     "connect_timeout_ms": 10000,
 *     "io_timeout_ms": 10000,
 *     "network": "mainnet" | "testnet" | "regtest",
 *     "network_magic": 3220773626,
 *     "listen": false,
 *     "listen_port": 0,
 *     "user_agent": "",
 *     "start_height": 0,
 *     "services": 1,
 *     "filters": { "ping": "auto-reply", "inv": "drop" }
 *   }
 *
 * Returns std::nullopt on success, or a description of the first problem.
 * `config` is only modified on success.
 */
std::optional<std::string> LoadNodeConfigFromString(const std::string& text, SyntheticNodeConfig& config);
std::optional<std::string> LoadNodeConfigFromFile(const std::string& path, SyntheticNodeConfig& config);

// Pretty-printed JSON in the format accepted above
std::string NodeConfigToJson(const SyntheticNodeConfig& config);

}  // namespace network
}  // namespace synthnet

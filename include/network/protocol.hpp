// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/hash.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include <asio/ip/tcp.hpp>

namespace synthnet {
namespace protocol {

// Protocol version we advertise in VERSION (zcashd 4.x era)
constexpr uint32_t PROTOCOL_VERSION = 170013;

// Network magic bytes, stored so that little-endian serialization yields the
// on-wire byte order (e.g. TESTNET goes out as fa 1a f9 bf)
namespace magic {
constexpr uint32_t MAINNET = 0x6427E924;  // 24 e9 27 64
constexpr uint32_t TESTNET = 0xBFF91AFA;  // fa 1a f9 bf
constexpr uint32_t REGTEST = 0x5F3FE8AA;  // aa e8 3f 5f
}  // namespace magic

namespace ports {
constexpr uint16_t MAINNET = 8233;
constexpr uint16_t TESTNET = 18233;
constexpr uint16_t REGTEST = 18344;
}  // namespace ports

enum ServiceFlags : uint64_t {
  NODE_NONE = 0,
  NODE_NETWORK = (1 << 0),
};

// Message types - 12 bytes, null-padded
namespace commands {
// Handshake
constexpr const char* VERSION = "version";
constexpr const char* VERACK = "verack";

// Keep-alive
constexpr const char* PING = "ping";
constexpr const char* PONG = "pong";

// Peer discovery
constexpr const char* GETADDR = "getaddr";
constexpr const char* ADDR = "addr";

// Inventory
constexpr const char* MEMPOOL = "mempool";
constexpr const char* INV = "inv";
constexpr const char* GETDATA = "getdata";
constexpr const char* NOTFOUND = "notfound";

// Block sync
constexpr const char* GETHEADERS = "getheaders";
constexpr const char* GETBLOCKS = "getblocks";
constexpr const char* HEADERS = "headers";

constexpr const char* REJECT = "reject";
}  // namespace commands

// Message header constants
constexpr size_t MESSAGE_HEADER_SIZE = 24;
constexpr size_t COMMAND_SIZE = 12;
constexpr size_t CHECKSUM_SIZE = 4;

// Size of a network address on the wire: services(8) + ip(16) + port(2)
constexpr size_t NETWORK_ADDRESS_SIZE = 26;

// Size of the fixed part of a VERSION body (everything except the user agent bytes
// and its CompactSize prefix)
constexpr size_t VERSION_FIXED_SIZE = 85;

// Zcash block header size without the Equihash solution
constexpr size_t BLOCK_HEADER_FIXED_SIZE = 140;

// ============================================================================
// LIMITS
// ============================================================================

// Largest value accepted for a CompactSize length prefix
constexpr uint64_t MAX_SIZE = 0x02000000;

// zcashd MAX_PROTOCOL_MESSAGE_LENGTH
constexpr size_t MAX_PROTOCOL_MESSAGE_LENGTH = 2 * 1024 * 1024;

// Outbound bytes queued per connection before the connection is dropped
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 10 * 1000 * 1000;

// Bytes buffered per connection waiting for a complete frame
constexpr size_t DEFAULT_RECV_FLOOD_SIZE = 10 * 1000 * 1000;

// Message header structure (24 bytes):
// magic (4 bytes), command (12 bytes null-padded), length (4 bytes), checksum (4 bytes)
struct MessageHeader {
  uint32_t magic;
  std::array<char, COMMAND_SIZE> command;
  uint32_t length;
  std::array<uint8_t, CHECKSUM_SIZE> checksum;

  MessageHeader() noexcept;
  MessageHeader(uint32_t magic, const std::string& cmd, uint32_t len);

  // Get command as string (strips null padding)
  [[nodiscard]] std::string get_command() const;

  // Set command from string (adds null padding)
  void set_command(const std::string& cmd);
};

// Network address (26 bytes on wire: 8 services + 16 IP + 2 port).
// The IP is always stored as 16 bytes; IPv4 is kept in IPv4-mapped form.
struct NetworkAddress {
  uint64_t services;
  std::array<uint8_t, 16> ip;
  uint16_t port;  // Host byte order; written big-endian on the wire

  NetworkAddress() noexcept;
  NetworkAddress(uint64_t svcs, const std::array<uint8_t, 16>& addr, uint16_t p) noexcept;

  [[nodiscard]] static NetworkAddress from_ipv4(uint64_t services, uint32_t ipv4, uint16_t port) noexcept;

  // Parse an IPv4 or IPv6 literal. Returns std::nullopt on parse failure.
  [[nodiscard]] static std::optional<NetworkAddress> from_string(const std::string& ip_str, uint16_t port,
                                                                 uint64_t services = NODE_NETWORK);

  [[nodiscard]] static NetworkAddress from_endpoint(const asio::ip::tcp::endpoint& endpoint,
                                                    uint64_t services = NODE_NETWORK);

  // IPv4-mapped addresses come back as IPv4 endpoints, everything else as IPv6
  [[nodiscard]] asio::ip::tcp::endpoint to_endpoint() const;

  [[nodiscard]] bool is_ipv4() const noexcept;
  [[nodiscard]] bool is_zero() const noexcept;

  // "a.b.c.d" for IPv4-mapped, RFC 5952 text otherwise
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool operator==(const NetworkAddress& other) const noexcept = default;
};

// Timestamped network address (30 bytes: 4 timestamp + 26 NetworkAddress)
struct TimestampedAddress {
  uint32_t timestamp;
  NetworkAddress address;

  TimestampedAddress() noexcept;
  TimestampedAddress(uint32_t ts, const NetworkAddress& addr) noexcept;

  [[nodiscard]] bool operator==(const TimestampedAddress& other) const noexcept = default;
};

enum class InventoryType : uint32_t {
  ERROR = 0,
  MSG_TX = 1,
  MSG_BLOCK = 2,
  MSG_FILTERED_BLOCK = 3,
};

// Inventory vector (36 bytes: 4 type + 32 hash)
struct InventoryVector {
  InventoryType type;
  Hash256 hash;

  InventoryVector() noexcept;
  InventoryVector(InventoryType t, const Hash256& h) noexcept;

  [[nodiscard]] bool operator==(const InventoryVector& other) const noexcept = default;
};

// "ip:port" with brackets around IPv6 literals
std::string EndpointToString(const asio::ip::tcp::endpoint& endpoint);

// Parse "ip:port" / "[ipv6]:port". Returns std::nullopt on malformed input.
std::optional<asio::ip::tcp::endpoint> ParseEndpoint(const std::string& text);

}  // namespace protocol
}  // namespace synthnet

// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/protocol.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>

#include <asio/ip/address.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/address_v6.hpp>

namespace synthnet {
namespace protocol {

// MessageHeader implementation
MessageHeader::MessageHeader() noexcept : magic(0), length(0) {
  command.fill(0);
  checksum.fill(0);
}

MessageHeader::MessageHeader(uint32_t magic, const std::string& cmd, uint32_t len) : magic(magic), length(len) {
  set_command(cmd);
  checksum.fill(0);  // Checksum set separately
}

std::string MessageHeader::get_command() const {
  auto end = std::find(command.begin(), command.end(), '\0');
  return std::string(command.begin(), end);
}

void MessageHeader::set_command(const std::string& cmd) {
  command.fill(0);
  size_t copy_len = std::min(cmd.length(), COMMAND_SIZE);
  std::memcpy(command.data(), cmd.data(), copy_len);
}

// NetworkAddress implementation
NetworkAddress::NetworkAddress() noexcept : services(0), port(0) {
  ip.fill(0);
}

NetworkAddress::NetworkAddress(uint64_t svcs, const std::array<uint8_t, 16>& addr, uint16_t p) noexcept
    : services(svcs), ip(addr), port(p) {}

NetworkAddress NetworkAddress::from_ipv4(uint64_t services, uint32_t ipv4, uint16_t port) noexcept {
  NetworkAddress addr;
  addr.services = services;
  addr.port = port;

  // ::ffff:a.b.c.d
  addr.ip[10] = 0xff;
  addr.ip[11] = 0xff;
  addr.ip[12] = (ipv4 >> 24) & 0xff;
  addr.ip[13] = (ipv4 >> 16) & 0xff;
  addr.ip[14] = (ipv4 >> 8) & 0xff;
  addr.ip[15] = ipv4 & 0xff;
  return addr;
}

std::optional<NetworkAddress> NetworkAddress::from_string(const std::string& ip_str, uint16_t port,
                                                          uint64_t services) {
  asio::error_code ec;
  auto ip_addr = asio::ip::make_address(ip_str, ec);
  if (ec) {
    return std::nullopt;
  }
  return from_endpoint(asio::ip::tcp::endpoint(ip_addr, port), services);
}

NetworkAddress NetworkAddress::from_endpoint(const asio::ip::tcp::endpoint& endpoint, uint64_t services) {
  NetworkAddress addr;
  addr.services = services;
  addr.port = endpoint.port();

  const auto ip_addr = endpoint.address();
  asio::ip::address_v6::bytes_type bytes;
  if (ip_addr.is_v4()) {
    bytes = asio::ip::make_address_v6(asio::ip::v4_mapped, ip_addr.to_v4()).to_bytes();
  } else {
    bytes = ip_addr.to_v6().to_bytes();
  }
  std::copy(bytes.begin(), bytes.end(), addr.ip.begin());
  return addr;
}

asio::ip::tcp::endpoint NetworkAddress::to_endpoint() const {
  asio::ip::address_v6::bytes_type bytes;
  std::copy(ip.begin(), ip.end(), bytes.begin());
  const auto v6 = asio::ip::make_address_v6(bytes);
  if (v6.is_v4_mapped()) {
    return asio::ip::tcp::endpoint(asio::ip::make_address_v4(asio::ip::v4_mapped, v6), port);
  }
  return asio::ip::tcp::endpoint(v6, port);
}

bool NetworkAddress::is_ipv4() const noexcept {
  static constexpr std::array<uint8_t, 12> kMappedPrefix = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};
  return std::equal(kMappedPrefix.begin(), kMappedPrefix.end(), ip.begin());
}

bool NetworkAddress::is_zero() const noexcept {
  return std::all_of(ip.begin(), ip.end(), [](uint8_t b) { return b == 0; });
}

std::string NetworkAddress::to_string() const {
  return to_endpoint().address().to_string();
}

// TimestampedAddress implementation
TimestampedAddress::TimestampedAddress() noexcept : timestamp(0) {}

TimestampedAddress::TimestampedAddress(uint32_t ts, const NetworkAddress& addr) noexcept
    : timestamp(ts), address(addr) {}

// InventoryVector implementation
InventoryVector::InventoryVector() noexcept : type(InventoryType::ERROR) {
  hash.fill(0);
}

InventoryVector::InventoryVector(InventoryType t, const Hash256& h) noexcept : type(t), hash(h) {}

std::string EndpointToString(const asio::ip::tcp::endpoint& endpoint) {
  const auto addr = endpoint.address();
  if (addr.is_v6()) {
    return "[" + addr.to_string() + "]:" + std::to_string(endpoint.port());
  }
  return addr.to_string() + ":" + std::to_string(endpoint.port());
}

std::optional<asio::ip::tcp::endpoint> ParseEndpoint(const std::string& text) {
  std::string host;
  std::string port_str;

  if (!text.empty() && text.front() == '[') {
    auto close = text.find(']');
    if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
      return std::nullopt;
    }
    host = text.substr(1, close - 1);
    port_str = text.substr(close + 2);
  } else {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || text.find(':') != colon) {
      return std::nullopt;
    }
    host = text.substr(0, colon);
    port_str = text.substr(colon + 1);
  }

  uint16_t port = 0;
  const char* first = port_str.data();
  const char* last = port_str.data() + port_str.size();
  auto [ptr, err] = std::from_chars(first, last, port);
  if (port_str.empty() || err != std::errc() || ptr != last) {
    return std::nullopt;
  }

  asio::error_code ec;
  auto addr = asio::ip::make_address(host, ec);
  if (ec) {
    return std::nullopt;
  }
  return asio::ip::tcp::endpoint(addr, port);
}

}  // namespace protocol
}  // namespace synthnet

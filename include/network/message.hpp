// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace synthnet {
namespace message {

// Why a frame or payload failed to decode. Every failure is reported through
// this enum; decoding never throws or aborts.
enum class DecodeError {
  None,
  Incomplete,        // Streaming only: more bytes needed to finish the frame
  BadMagic,          // Header magic is not the configured network's
  OversizedMessage,  // Declared body length above MAX_PROTOCOL_MESSAGE_LENGTH
  ChecksumMismatch,  // First 4 bytes of SHA256d(body) differ from the header
  UnknownCommand,    // Well-formed frame with a command we do not model
  Truncated,         // A field needs more bytes than the body holds
  LengthMismatch,    // Body has bytes left over after the payload was parsed
  BadCompactSize,    // Non-minimal CompactSize or length above MAX_SIZE
  InvalidUtf8,       // String field is not valid UTF-8
};

const char* DecodeErrorString(DecodeError error);

// CompactSize - Bitcoin's variable length integer encoding
//   value <= 0xfc        -> 1 byte
//   value <= 0xffff      -> 0xfd + 2 bytes LE
//   value <= 0xffffffff  -> 0xfe + 4 bytes LE
//   otherwise            -> 0xff + 8 bytes LE
class CompactSize {
public:
  uint64_t value;

  CompactSize() : value(0) {}
  explicit CompactSize(uint64_t v) : value(v) {}

  size_t encoded_size() const;

  // Encode to buffer (at least encoded_size() bytes), returns bytes written
  size_t encode(uint8_t* buffer) const;

  // Decode from buffer, returns bytes consumed or 0 on failure. Non-minimal
  // encodings are rejected. `error` receives Truncated or BadCompactSize.
  size_t decode(const uint8_t* buffer, size_t available, DecodeError* error = nullptr);
};

// Serialization buffer for building wire-format messages
class MessageSerializer {
public:
  MessageSerializer() = default;

  void write_uint8(uint8_t value);
  void write_uint16(uint16_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);
  void write_int32(int32_t value);
  void write_int64(int64_t value);
  void write_bool(bool value);

  void write_compact_size(uint64_t value);
  void write_string(const std::string& str);
  void write_bytes(const uint8_t* data, size_t len);
  void write_bytes(const std::vector<uint8_t>& data);
  void write_hash(const Hash256& hash);

  void write_network_address(const protocol::NetworkAddress& addr);
  void write_timestamped_address(const protocol::TimestampedAddress& addr);
  void write_inventory(const protocol::InventoryVector& inv);

  const std::vector<uint8_t>& data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }
  size_t size() const { return buffer_.size(); }

private:
  std::vector<uint8_t> buffer_;
};

// Deserialization cursor for parsing wire-format payloads. The first failure
// is sticky: later reads return zero values and error() keeps the original cause.
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t* data, size_t size);
  explicit MessageDeserializer(const std::vector<uint8_t>& data);

  uint8_t read_uint8();
  uint16_t read_uint16();
  uint32_t read_uint32();
  uint64_t read_uint64();
  int32_t read_int32();
  int64_t read_int64();
  bool read_bool();

  // CompactSize, rejected as BadCompactSize when above `max_value`
  uint64_t read_compact_size(uint64_t max_value = protocol::MAX_SIZE);
  // CompactSize-prefixed UTF-8 string
  std::string read_string();
  std::vector<uint8_t> read_bytes(size_t count);
  Hash256 read_hash();

  protocol::NetworkAddress read_network_address();
  protocol::TimestampedAddress read_timestamped_address();
  protocol::InventoryVector read_inventory();

  // CompactSize element count, rejected up front when `count * min_element_size`
  // cannot fit in the remaining bytes
  uint64_t read_count(size_t min_element_size);

  size_t bytes_remaining() const { return size_ - position_; }
  size_t position() const { return position_; }
  bool has_error() const { return error_ != DecodeError::None; }
  DecodeError error() const { return error_; }

private:
  const uint8_t* data_;
  size_t size_;
  size_t position_;
  DecodeError error_;

  bool check_available(size_t bytes);
  void fail(DecodeError error);
};

// True if `bytes` is well-formed UTF-8 (no overlongs, surrogates or values above U+10FFFF)
bool IsValidUtf8(std::string_view bytes);

// ============================================================================
// PAYLOADS
// ============================================================================

// Random 64-bit value for VERSION and PING nonces (thread-safe)
uint64_t GenerateNonce();

// VERSION - first message sent on a connection
struct Version {
  uint32_t version{protocol::PROTOCOL_VERSION};
  uint64_t services{protocol::NODE_NETWORK};
  int64_t timestamp{0};
  protocol::NetworkAddress addr_recv;
  protocol::NetworkAddress addr_from;
  uint64_t nonce{0};
  std::string user_agent;
  uint32_t start_height{0};
  bool relay{false};

  // Harness defaults: current time, random nonce, services 1 on both addresses
  static Version create(const asio::ip::tcp::endpoint& addr_recv, const asio::ip::tcp::endpoint& addr_from);

  bool operator==(const Version&) const = default;
};

struct Verack {
  bool operator==(const Verack&) const = default;
};

struct Ping {
  uint64_t nonce{0};
  bool operator==(const Ping&) const = default;
};

struct Pong {
  uint64_t nonce{0};
  bool operator==(const Pong&) const = default;
};

struct GetAddr {
  bool operator==(const GetAddr&) const = default;
};

struct Addr {
  std::vector<protocol::TimestampedAddress> addresses;
  bool operator==(const Addr&) const = default;
};

struct MemPool {
  bool operator==(const MemPool&) const = default;
};

struct Inv {
  std::vector<protocol::InventoryVector> inventory;
  bool operator==(const Inv&) const = default;
};

struct GetData {
  std::vector<protocol::InventoryVector> inventory;
  bool operator==(const GetData&) const = default;
};

struct NotFound {
  std::vector<protocol::InventoryVector> inventory;
  bool operator==(const NotFound&) const = default;
};

// Shared body of GETHEADERS and GETBLOCKS
struct BlockLocator {
  uint32_t version{protocol::PROTOCOL_VERSION};
  std::vector<Hash256> hashes;
  Hash256 hash_stop{};
  bool operator==(const BlockLocator&) const = default;
};

struct GetHeaders {
  BlockLocator locator;
  bool operator==(const GetHeaders&) const = default;
};

struct GetBlocks {
  BlockLocator locator;
  bool operator==(const GetBlocks&) const = default;
};

// Zcash block header: 140 fixed bytes followed by the Equihash solution.
// tx_count is the CompactSize that follows every header in a HEADERS message.
struct BlockHeader {
  int32_t version{4};
  Hash256 prev_block{};
  Hash256 merkle_root{};
  Hash256 final_sapling_root{};
  uint32_t time{0};
  uint32_t bits{0};
  Hash256 nonce{};
  std::vector<uint8_t> solution;
  uint64_t tx_count{0};
  bool operator==(const BlockHeader&) const = default;
};

struct Headers {
  std::vector<BlockHeader> headers;
  bool operator==(const Headers&) const = default;
};

// REJECT - `data` is only present for tx/block rejections
struct Reject {
  std::string message;
  uint8_t ccode{0};
  std::string reason;
  std::optional<Hash256> data;
  bool operator==(const Reject&) const = default;
};

// Closed set of supported messages. The alternative index is the MessageKind.
using Message = std::variant<Version, Verack, Ping, Pong, GetAddr, Addr, MemPool, Inv, GetData, NotFound, GetHeaders,
                             GetBlocks, Headers, Reject>;

enum class MessageKind : size_t {
  Version,
  Verack,
  Ping,
  Pong,
  GetAddr,
  Addr,
  MemPool,
  Inv,
  GetData,
  NotFound,
  GetHeaders,
  GetBlocks,
  Headers,
  Reject,
};

constexpr size_t MESSAGE_KIND_COUNT = std::variant_size_v<Message>;

inline MessageKind KindOf(const Message& msg) {
  return static_cast<MessageKind>(msg.index());
}

// Wire command for a kind ("version", "ping", ...)
const char* CommandName(MessageKind kind);

inline std::string CommandOf(const Message& msg) {
  return CommandName(KindOf(msg));
}

std::optional<MessageKind> KindFromCommand(std::string_view command);

// Canonical response an auto-replying peer sends for `msg`, if any:
// Ping -> Pong(same nonce), Version -> Verack, GetAddr -> empty Addr,
// MemPool/GetBlocks -> empty Inv, GetHeaders -> empty Headers,
// GetData -> NotFound(same inventory)
std::optional<Message> CanonicalReply(const Message& msg);

// ============================================================================
// FRAMING
// ============================================================================

// Serialize only the payload of `msg`
std::vector<uint8_t> SerializePayload(const Message& msg);

// Decode a complete payload of the given kind. Leftover bytes are a LengthMismatch.
DecodeError DeserializePayload(MessageKind kind, const uint8_t* data, size_t size, Message& out);

// Create message header with checksum
protocol::MessageHeader create_header(uint32_t magic, const std::string& command, const std::vector<uint8_t>& payload);

// Serialize header to bytes
std::vector<uint8_t> serialize_header(const protocol::MessageHeader& header);

// Deserialize header from bytes
bool deserialize_header(const uint8_t* data, size_t size, protocol::MessageHeader& header);

// Full frame: header (with length and checksum) followed by the payload
std::vector<uint8_t> EncodeMessage(uint32_t magic, const Message& msg);

// Result of decoding one frame from the front of a byte stream
struct FrameResult {
  DecodeError error{DecodeError::Incomplete};
  size_t consumed{0};   // Bytes to drop from the stream (0 unless a full frame was present)
  std::string command;  // Header command, filled once the header has been read
};

// Decode one frame from the front of `data`. Returns Incomplete (consumed == 0)
// until the whole frame is buffered. UnknownCommand frames report the full frame
// size in `consumed` so the caller can skip them.
FrameResult DecodeFrame(uint32_t magic, const uint8_t* data, size_t size, Message& out);

// Decode a buffer that must contain exactly one frame. Missing bytes are Truncated.
DecodeError DecodeMessage(uint32_t magic, const std::vector<uint8_t>& frame, Message& out);

}  // namespace message
}  // namespace synthnet

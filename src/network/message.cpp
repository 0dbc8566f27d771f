// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message.hpp"

#include "util/time.hpp"

#include <algorithm>
#include <cstring>
#include <mutex>
#include <random>
#include <span>

namespace synthnet {
namespace message {

namespace {

constexpr size_t TIMESTAMPED_ADDRESS_SIZE = 4 + protocol::NETWORK_ADDRESS_SIZE;
constexpr size_t INVENTORY_SIZE = 4 + 32;
// Fixed header bytes plus the two smallest CompactSizes (solution length, tx count)
constexpr size_t MIN_HEADERS_ENTRY_SIZE = protocol::BLOCK_HEADER_FIXED_SIZE + 2;

const char* const kCommandNames[MESSAGE_KIND_COUNT] = {
    protocol::commands::VERSION,  protocol::commands::VERACK,     protocol::commands::PING,
    protocol::commands::PONG,     protocol::commands::GETADDR,    protocol::commands::ADDR,
    protocol::commands::MEMPOOL,  protocol::commands::INV,        protocol::commands::GETDATA,
    protocol::commands::NOTFOUND, protocol::commands::GETHEADERS, protocol::commands::GETBLOCKS,
    protocol::commands::HEADERS,  protocol::commands::REJECT,
};

uint64_t read_le(const uint8_t* p, size_t n) {
  uint64_t v = 0;
  for (size_t i = 0; i < n; ++i) {
    v |= static_cast<uint64_t>(p[i]) << (8 * i);
  }
  return v;
}

}  // namespace

const char* DecodeErrorString(DecodeError error) {
  switch (error) {
  case DecodeError::None:
    return "none";
  case DecodeError::Incomplete:
    return "incomplete";
  case DecodeError::BadMagic:
    return "bad magic";
  case DecodeError::OversizedMessage:
    return "oversized message";
  case DecodeError::ChecksumMismatch:
    return "checksum mismatch";
  case DecodeError::UnknownCommand:
    return "unknown command";
  case DecodeError::Truncated:
    return "truncated";
  case DecodeError::LengthMismatch:
    return "length mismatch";
  case DecodeError::BadCompactSize:
    return "bad compact size";
  case DecodeError::InvalidUtf8:
    return "invalid utf-8";
  }
  return "unknown";
}

// ============================================================================
// CompactSize
// ============================================================================

size_t CompactSize::encoded_size() const {
  if (value < 0xfd)
    return 1;
  if (value <= 0xffff)
    return 3;
  if (value <= 0xffffffff)
    return 5;
  return 9;
}

size_t CompactSize::encode(uint8_t* buffer) const {
  size_t width = 0;
  if (value < 0xfd) {
    buffer[0] = static_cast<uint8_t>(value);
    return 1;
  } else if (value <= 0xffff) {
    buffer[0] = 0xfd;
    width = 2;
  } else if (value <= 0xffffffff) {
    buffer[0] = 0xfe;
    width = 4;
  } else {
    buffer[0] = 0xff;
    width = 8;
  }
  for (size_t i = 0; i < width; ++i) {
    buffer[1 + i] = static_cast<uint8_t>(value >> (8 * i));
  }
  return 1 + width;
}

size_t CompactSize::decode(const uint8_t* buffer, size_t available, DecodeError* error) {
  auto fail = [error](DecodeError e) -> size_t {
    if (error)
      *error = e;
    return 0;
  };

  if (available < 1)
    return fail(DecodeError::Truncated);

  const uint8_t marker = buffer[0];
  if (marker < 0xfd) {
    value = marker;
    return 1;
  }

  const size_t width = marker == 0xfd ? 2 : (marker == 0xfe ? 4 : 8);
  if (available < 1 + width)
    return fail(DecodeError::Truncated);

  const uint64_t v = read_le(buffer + 1, width);
  const uint64_t minimum = marker == 0xfd ? 0xfd : (marker == 0xfe ? 0x10000 : 0x100000000ULL);
  if (v < minimum)
    return fail(DecodeError::BadCompactSize);

  value = v;
  return 1 + width;
}

// ============================================================================
// MessageSerializer
// ============================================================================

void MessageSerializer::write_uint8(uint8_t value) {
  buffer_.push_back(value);
}

void MessageSerializer::write_uint16(uint16_t value) {
  buffer_.push_back(static_cast<uint8_t>(value));
  buffer_.push_back(static_cast<uint8_t>(value >> 8));
}

void MessageSerializer::write_uint32(uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

void MessageSerializer::write_uint64(uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

void MessageSerializer::write_int32(int32_t value) {
  write_uint32(static_cast<uint32_t>(value));
}

void MessageSerializer::write_int64(int64_t value) {
  write_uint64(static_cast<uint64_t>(value));
}

void MessageSerializer::write_bool(bool value) {
  write_uint8(value ? 1 : 0);
}

void MessageSerializer::write_compact_size(uint64_t value) {
  uint8_t buf[9];
  size_t n = CompactSize(value).encode(buf);
  buffer_.insert(buffer_.end(), buf, buf + n);
}

void MessageSerializer::write_string(const std::string& str) {
  write_compact_size(str.size());
  buffer_.insert(buffer_.end(), str.begin(), str.end());
}

void MessageSerializer::write_bytes(const uint8_t* data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

void MessageSerializer::write_bytes(const std::vector<uint8_t>& data) {
  buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void MessageSerializer::write_hash(const Hash256& hash) {
  buffer_.insert(buffer_.end(), hash.begin(), hash.end());
}

void MessageSerializer::write_network_address(const protocol::NetworkAddress& addr) {
  write_uint64(addr.services);
  buffer_.insert(buffer_.end(), addr.ip.begin(), addr.ip.end());
  // Port is big-endian on the wire, unlike every other integer field
  buffer_.push_back(static_cast<uint8_t>(addr.port >> 8));
  buffer_.push_back(static_cast<uint8_t>(addr.port & 0xff));
}

void MessageSerializer::write_timestamped_address(const protocol::TimestampedAddress& addr) {
  write_uint32(addr.timestamp);
  write_network_address(addr.address);
}

void MessageSerializer::write_inventory(const protocol::InventoryVector& inv) {
  write_uint32(static_cast<uint32_t>(inv.type));
  write_hash(inv.hash);
}

// ============================================================================
// MessageDeserializer
// ============================================================================

MessageDeserializer::MessageDeserializer(const uint8_t* data, size_t size)
    : data_(data), size_(size), position_(0), error_(DecodeError::None) {}

MessageDeserializer::MessageDeserializer(const std::vector<uint8_t>& data)
    : MessageDeserializer(data.data(), data.size()) {}

void MessageDeserializer::fail(DecodeError error) {
  if (error_ == DecodeError::None) {
    error_ = error;
  }
}

bool MessageDeserializer::check_available(size_t bytes) {
  if (has_error())
    return false;
  if (bytes > bytes_remaining()) {
    fail(DecodeError::Truncated);
    return false;
  }
  return true;
}

uint8_t MessageDeserializer::read_uint8() {
  if (!check_available(1))
    return 0;
  return data_[position_++];
}

uint16_t MessageDeserializer::read_uint16() {
  if (!check_available(2))
    return 0;
  auto v = static_cast<uint16_t>(read_le(data_ + position_, 2));
  position_ += 2;
  return v;
}

uint32_t MessageDeserializer::read_uint32() {
  if (!check_available(4))
    return 0;
  auto v = static_cast<uint32_t>(read_le(data_ + position_, 4));
  position_ += 4;
  return v;
}

uint64_t MessageDeserializer::read_uint64() {
  if (!check_available(8))
    return 0;
  uint64_t v = read_le(data_ + position_, 8);
  position_ += 8;
  return v;
}

int32_t MessageDeserializer::read_int32() {
  return static_cast<int32_t>(read_uint32());
}

int64_t MessageDeserializer::read_int64() {
  return static_cast<int64_t>(read_uint64());
}

bool MessageDeserializer::read_bool() {
  return read_uint8() != 0;
}

uint64_t MessageDeserializer::read_compact_size(uint64_t max_value) {
  if (has_error())
    return 0;

  CompactSize cs;
  DecodeError err = DecodeError::None;
  size_t consumed = cs.decode(data_ + position_, bytes_remaining(), &err);
  if (consumed == 0) {
    fail(err);
    return 0;
  }
  if (cs.value > max_value) {
    fail(DecodeError::BadCompactSize);
    return 0;
  }
  position_ += consumed;
  return cs.value;
}

std::string MessageDeserializer::read_string() {
  uint64_t len = read_compact_size();
  if (!check_available(len))
    return {};

  std::string s(reinterpret_cast<const char*>(data_ + position_), len);
  position_ += len;
  if (!IsValidUtf8(s)) {
    fail(DecodeError::InvalidUtf8);
    return {};
  }
  return s;
}

std::vector<uint8_t> MessageDeserializer::read_bytes(size_t count) {
  if (!check_available(count))
    return {};
  std::vector<uint8_t> out(data_ + position_, data_ + position_ + count);
  position_ += count;
  return out;
}

Hash256 MessageDeserializer::read_hash() {
  Hash256 h{};
  if (!check_available(h.size()))
    return h;
  std::memcpy(h.data(), data_ + position_, h.size());
  position_ += h.size();
  return h;
}

protocol::NetworkAddress MessageDeserializer::read_network_address() {
  protocol::NetworkAddress addr;
  if (!check_available(protocol::NETWORK_ADDRESS_SIZE))
    return addr;
  addr.services = read_uint64();
  std::memcpy(addr.ip.data(), data_ + position_, addr.ip.size());
  position_ += addr.ip.size();
  addr.port = static_cast<uint16_t>((static_cast<uint16_t>(data_[position_]) << 8) | data_[position_ + 1]);
  position_ += 2;
  return addr;
}

protocol::TimestampedAddress MessageDeserializer::read_timestamped_address() {
  protocol::TimestampedAddress ts;
  ts.timestamp = read_uint32();
  ts.address = read_network_address();
  return ts;
}

protocol::InventoryVector MessageDeserializer::read_inventory() {
  protocol::InventoryVector inv;
  inv.type = static_cast<protocol::InventoryType>(read_uint32());
  inv.hash = read_hash();
  return inv;
}

uint64_t MessageDeserializer::read_count(size_t min_element_size) {
  uint64_t count = read_compact_size();
  if (has_error())
    return 0;
  if (min_element_size > 0 && count > bytes_remaining() / min_element_size) {
    fail(DecodeError::Truncated);
    return 0;
  }
  return count;
}

bool IsValidUtf8(std::string_view bytes) {
  size_t i = 0;
  const size_t n = bytes.size();
  while (i < n) {
    const auto c = static_cast<uint8_t>(bytes[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t extra = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;
    if ((c & 0xe0) == 0xc0) {
      extra = 1;
      cp = c & 0x1f;
      min_cp = 0x80;
    } else if ((c & 0xf0) == 0xe0) {
      extra = 2;
      cp = c & 0x0f;
      min_cp = 0x800;
    } else if ((c & 0xf8) == 0xf0) {
      extra = 3;
      cp = c & 0x07;
      min_cp = 0x10000;
    } else {
      return false;
    }

    if (i + extra >= n) {
      return false;
    }
    for (size_t k = 1; k <= extra; ++k) {
      const auto cc = static_cast<uint8_t>(bytes[i + k]);
      if ((cc & 0xc0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3f);
    }

    if (cp < min_cp || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

// ============================================================================
// Payloads
// ============================================================================

namespace {

std::mutex g_nonce_mutex;

uint64_t next_nonce() {
  std::lock_guard<std::mutex> lock(g_nonce_mutex);
  static std::mt19937_64 gen{std::random_device{}()};
  return gen();
}

void write_locator(MessageSerializer& s, const BlockLocator& locator) {
  s.write_uint32(locator.version);
  s.write_compact_size(locator.hashes.size());
  for (const auto& h : locator.hashes) {
    s.write_hash(h);
  }
  s.write_hash(locator.hash_stop);
}

BlockLocator read_locator(MessageDeserializer& d) {
  BlockLocator locator;
  locator.version = d.read_uint32();
  uint64_t count = d.read_count(32);
  locator.hashes.reserve(count);
  for (uint64_t i = 0; i < count && !d.has_error(); ++i) {
    locator.hashes.push_back(d.read_hash());
  }
  locator.hash_stop = d.read_hash();
  return locator;
}

void write_inventory_list(MessageSerializer& s, const std::vector<protocol::InventoryVector>& list) {
  s.write_compact_size(list.size());
  for (const auto& inv : list) {
    s.write_inventory(inv);
  }
}

std::vector<protocol::InventoryVector> read_inventory_list(MessageDeserializer& d) {
  std::vector<protocol::InventoryVector> list;
  uint64_t count = d.read_count(INVENTORY_SIZE);
  list.reserve(count);
  for (uint64_t i = 0; i < count && !d.has_error(); ++i) {
    list.push_back(d.read_inventory());
  }
  return list;
}

struct PayloadWriter {
  MessageSerializer& s;

  void operator()(const Version& m) const {
    s.write_uint32(m.version);
    s.write_uint64(m.services);
    s.write_int64(m.timestamp);
    s.write_network_address(m.addr_recv);
    s.write_network_address(m.addr_from);
    s.write_uint64(m.nonce);
    s.write_string(m.user_agent);
    s.write_uint32(m.start_height);
    s.write_bool(m.relay);
  }
  void operator()(const Verack&) const {}
  void operator()(const Ping& m) const { s.write_uint64(m.nonce); }
  void operator()(const Pong& m) const { s.write_uint64(m.nonce); }
  void operator()(const GetAddr&) const {}
  void operator()(const Addr& m) const {
    s.write_compact_size(m.addresses.size());
    for (const auto& a : m.addresses) {
      s.write_timestamped_address(a);
    }
  }
  void operator()(const MemPool&) const {}
  void operator()(const Inv& m) const { write_inventory_list(s, m.inventory); }
  void operator()(const GetData& m) const { write_inventory_list(s, m.inventory); }
  void operator()(const NotFound& m) const { write_inventory_list(s, m.inventory); }
  void operator()(const GetHeaders& m) const { write_locator(s, m.locator); }
  void operator()(const GetBlocks& m) const { write_locator(s, m.locator); }
  void operator()(const Headers& m) const {
    s.write_compact_size(m.headers.size());
    for (const auto& h : m.headers) {
      s.write_int32(h.version);
      s.write_hash(h.prev_block);
      s.write_hash(h.merkle_root);
      s.write_hash(h.final_sapling_root);
      s.write_uint32(h.time);
      s.write_uint32(h.bits);
      s.write_hash(h.nonce);
      s.write_compact_size(h.solution.size());
      s.write_bytes(h.solution);
      s.write_compact_size(h.tx_count);
    }
  }
  void operator()(const Reject& m) const {
    s.write_string(m.message);
    s.write_uint8(m.ccode);
    s.write_string(m.reason);
    if (m.data) {
      s.write_hash(*m.data);
    }
  }
};

Message read_payload(MessageKind kind, MessageDeserializer& d) {
  switch (kind) {
  case MessageKind::Version: {
    Version m;
    m.version = d.read_uint32();
    m.services = d.read_uint64();
    m.timestamp = d.read_int64();
    m.addr_recv = d.read_network_address();
    m.addr_from = d.read_network_address();
    m.nonce = d.read_uint64();
    m.user_agent = d.read_string();
    m.start_height = d.read_uint32();
    // relay is optional (BIP37): absent means false
    m.relay = d.bytes_remaining() > 0 ? d.read_bool() : false;
    return m;
  }
  case MessageKind::Verack:
    return Verack{};
  case MessageKind::Ping:
    return Ping{d.read_uint64()};
  case MessageKind::Pong:
    return Pong{d.read_uint64()};
  case MessageKind::GetAddr:
    return GetAddr{};
  case MessageKind::Addr: {
    Addr m;
    uint64_t count = d.read_count(TIMESTAMPED_ADDRESS_SIZE);
    m.addresses.reserve(count);
    for (uint64_t i = 0; i < count && !d.has_error(); ++i) {
      m.addresses.push_back(d.read_timestamped_address());
    }
    return m;
  }
  case MessageKind::MemPool:
    return MemPool{};
  case MessageKind::Inv:
    return Inv{read_inventory_list(d)};
  case MessageKind::GetData:
    return GetData{read_inventory_list(d)};
  case MessageKind::NotFound:
    return NotFound{read_inventory_list(d)};
  case MessageKind::GetHeaders:
    return GetHeaders{read_locator(d)};
  case MessageKind::GetBlocks:
    return GetBlocks{read_locator(d)};
  case MessageKind::Headers: {
    Headers m;
    uint64_t count = d.read_count(MIN_HEADERS_ENTRY_SIZE);
    m.headers.reserve(count);
    for (uint64_t i = 0; i < count && !d.has_error(); ++i) {
      BlockHeader h;
      h.version = d.read_int32();
      h.prev_block = d.read_hash();
      h.merkle_root = d.read_hash();
      h.final_sapling_root = d.read_hash();
      h.time = d.read_uint32();
      h.bits = d.read_uint32();
      h.nonce = d.read_hash();
      h.solution = d.read_bytes(d.read_compact_size());
      h.tx_count = d.read_compact_size();
      m.headers.push_back(std::move(h));
    }
    return m;
  }
  case MessageKind::Reject: {
    Reject m;
    m.message = d.read_string();
    m.ccode = d.read_uint8();
    m.reason = d.read_string();
    if (d.bytes_remaining() == 32) {
      m.data = d.read_hash();
    }
    return m;
  }
  }
  return Verack{};
}

}  // namespace

Version Version::create(const asio::ip::tcp::endpoint& addr_recv, const asio::ip::tcp::endpoint& addr_from) {
  Version v;
  v.timestamp = util::GetTime();
  v.addr_recv = protocol::NetworkAddress::from_endpoint(addr_recv, protocol::NODE_NETWORK);
  v.addr_from = protocol::NetworkAddress::from_endpoint(addr_from, protocol::NODE_NETWORK);
  v.nonce = GenerateNonce();
  return v;
}

uint64_t GenerateNonce() {
  return next_nonce();
}

const char* CommandName(MessageKind kind) {
  auto idx = static_cast<size_t>(kind);
  return idx < MESSAGE_KIND_COUNT ? kCommandNames[idx] : "";
}

std::optional<MessageKind> KindFromCommand(std::string_view command) {
  for (size_t i = 0; i < MESSAGE_KIND_COUNT; ++i) {
    if (command == kCommandNames[i]) {
      return static_cast<MessageKind>(i);
    }
  }
  return std::nullopt;
}

std::optional<Message> CanonicalReply(const Message& msg) {
  switch (KindOf(msg)) {
  case MessageKind::Ping:
    return Pong{std::get<Ping>(msg).nonce};
  case MessageKind::Version:
    return Verack{};
  case MessageKind::GetAddr:
    return Addr{};
  case MessageKind::MemPool:
  case MessageKind::GetBlocks:
    return Inv{};
  case MessageKind::GetHeaders:
    return Headers{};
  case MessageKind::GetData:
    return NotFound{std::get<GetData>(msg).inventory};
  default:
    return std::nullopt;
  }
}

// ============================================================================
// Framing
// ============================================================================

std::vector<uint8_t> SerializePayload(const Message& msg) {
  MessageSerializer s;
  std::visit(PayloadWriter{s}, msg);
  return s.release();
}

DecodeError DeserializePayload(MessageKind kind, const uint8_t* data, size_t size, Message& out) {
  MessageDeserializer d(data, size);
  Message decoded = read_payload(kind, d);
  if (d.has_error()) {
    return d.error();
  }
  if (d.bytes_remaining() != 0) {
    return DecodeError::LengthMismatch;
  }
  out = std::move(decoded);
  return DecodeError::None;
}

protocol::MessageHeader create_header(uint32_t magic, const std::string& command, const std::vector<uint8_t>& payload) {
  protocol::MessageHeader header(magic, command, static_cast<uint32_t>(payload.size()));
  Hash256 hash = Hash(payload);
  std::memcpy(header.checksum.data(), hash.data(), protocol::CHECKSUM_SIZE);
  return header;
}

std::vector<uint8_t> serialize_header(const protocol::MessageHeader& header) {
  MessageSerializer s;
  s.write_uint32(header.magic);
  s.write_bytes(reinterpret_cast<const uint8_t*>(header.command.data()), protocol::COMMAND_SIZE);
  s.write_uint32(header.length);
  s.write_bytes(header.checksum.data(), protocol::CHECKSUM_SIZE);
  return s.release();
}

bool deserialize_header(const uint8_t* data, size_t size, protocol::MessageHeader& header) {
  if (size < protocol::MESSAGE_HEADER_SIZE) {
    return false;
  }
  header.magic = static_cast<uint32_t>(read_le(data, 4));
  std::memcpy(header.command.data(), data + 4, protocol::COMMAND_SIZE);
  header.length = static_cast<uint32_t>(read_le(data + 16, 4));
  std::memcpy(header.checksum.data(), data + 20, protocol::CHECKSUM_SIZE);
  return true;
}

std::vector<uint8_t> EncodeMessage(uint32_t magic, const Message& msg) {
  // Body first: length and checksum depend on it
  std::vector<uint8_t> payload = SerializePayload(msg);
  auto frame = serialize_header(create_header(magic, CommandOf(msg), payload));
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

FrameResult DecodeFrame(uint32_t magic, const uint8_t* data, size_t size, Message& out) {
  FrameResult result;

  protocol::MessageHeader header;
  if (!deserialize_header(data, size, header)) {
    return result;
  }
  result.command = header.get_command();

  if (header.magic != magic) {
    result.error = DecodeError::BadMagic;
    return result;
  }
  if (header.length > protocol::MAX_PROTOCOL_MESSAGE_LENGTH) {
    result.error = DecodeError::OversizedMessage;
    return result;
  }

  const size_t total = protocol::MESSAGE_HEADER_SIZE + header.length;
  if (size < total) {
    return result;
  }
  result.consumed = total;

  const uint8_t* payload = data + protocol::MESSAGE_HEADER_SIZE;
  Hash256 hash = Hash(std::span<const uint8_t>(payload, header.length));
  if (std::memcmp(header.checksum.data(), hash.data(), protocol::CHECKSUM_SIZE) != 0) {
    result.error = DecodeError::ChecksumMismatch;
    return result;
  }

  auto kind = KindFromCommand(result.command);
  if (!kind) {
    result.error = DecodeError::UnknownCommand;
    return result;
  }

  result.error = DeserializePayload(*kind, payload, header.length, out);
  return result;
}

DecodeError DecodeMessage(uint32_t magic, const std::vector<uint8_t>& frame, Message& out) {
  FrameResult result = DecodeFrame(magic, frame.data(), frame.size(), out);
  if (result.error == DecodeError::Incomplete) {
    return DecodeError::Truncated;
  }
  if (result.error == DecodeError::None && result.consumed != frame.size()) {
    return DecodeError::LengthMismatch;
  }
  return result.error;
}

}  // namespace message
}  // namespace synthnet

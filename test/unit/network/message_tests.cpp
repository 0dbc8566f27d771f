// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for network/message.cpp - wire codec
//
// These tests verify:
// - CompactSize widths and rejection of non-minimal encodings
// - Frame layout (magic, command, length, checksum)
// - Every DecodeError the frame and payload decoders can report
// - Round trip of each message variant
// - Canonical auto-replies

#include <catch2/catch_test_macros.hpp>
#include "network/message.hpp"
#include "network/protocol.hpp"
#include <cstring>
#include <string>
#include <vector>

using namespace synthnet;
using namespace synthnet::message;
using namespace synthnet::protocol;

namespace {

Hash256 filled_hash(uint8_t value) {
    Hash256 h;
    h.fill(value);
    return h;
}

// Frame with a valid header for `command` around an arbitrary body
std::vector<uint8_t> raw_frame(uint32_t magic, const std::string& command, const std::vector<uint8_t>& body) {
    auto frame = serialize_header(create_header(magic, command, body));
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

}  // namespace

TEST_CASE("CompactSize - Encoding widths", "[network][message][compactsize][unit]") {
    REQUIRE(CompactSize(0).encoded_size() == 1);
    REQUIRE(CompactSize(0xfc).encoded_size() == 1);
    REQUIRE(CompactSize(0xfd).encoded_size() == 3);
    REQUIRE(CompactSize(0xffff).encoded_size() == 3);
    REQUIRE(CompactSize(0x10000).encoded_size() == 5);
    REQUIRE(CompactSize(0xffffffffULL).encoded_size() == 5);
    REQUIRE(CompactSize(0x100000000ULL).encoded_size() == 9);

    uint8_t buf[9];
    REQUIRE(CompactSize(0xfd).encode(buf) == 3);
    CHECK(buf[0] == 0xfd);
    CHECK(buf[1] == 0xfd);
    CHECK(buf[2] == 0x00);
}

TEST_CASE("CompactSize - Decode", "[network][message][compactsize][unit]") {
    SECTION("Values survive encode/decode at each width boundary") {
        for (uint64_t value : {0ULL, 0xfcULL, 0xfdULL, 0xffffULL, 0x10000ULL, 0xffffffffULL, 0x100000000ULL}) {
            uint8_t buf[9];
            size_t n = CompactSize(value).encode(buf);
            CompactSize decoded;
            REQUIRE(decoded.decode(buf, n) == n);
            REQUIRE(decoded.value == value);
        }
    }

    SECTION("Non-minimal encodings are rejected") {
        const uint8_t two_byte_small[] = {0xfd, 0x10, 0x00};
        const uint8_t four_byte_small[] = {0xfe, 0xff, 0xff, 0x00, 0x00};
        const uint8_t eight_byte_small[] = {0xff, 0xff, 0xff, 0xff, 0xff, 0x00, 0x00, 0x00, 0x00};

        CompactSize cs;
        DecodeError err = DecodeError::None;
        CHECK(cs.decode(two_byte_small, sizeof(two_byte_small), &err) == 0);
        CHECK(err == DecodeError::BadCompactSize);

        err = DecodeError::None;
        CHECK(cs.decode(four_byte_small, sizeof(four_byte_small), &err) == 0);
        CHECK(err == DecodeError::BadCompactSize);

        err = DecodeError::None;
        CHECK(cs.decode(eight_byte_small, sizeof(eight_byte_small), &err) == 0);
        CHECK(err == DecodeError::BadCompactSize);
    }

    SECTION("Missing bytes are Truncated") {
        const uint8_t partial[] = {0xfe, 0x00, 0x00};
        CompactSize cs;
        DecodeError err = DecodeError::None;
        CHECK(cs.decode(partial, sizeof(partial), &err) == 0);
        CHECK(err == DecodeError::Truncated);

        err = DecodeError::None;
        CHECK(cs.decode(partial, 0, &err) == 0);
        CHECK(err == DecodeError::Truncated);
    }

    SECTION("Length prefixes above MAX_SIZE are rejected") {
        MessageSerializer s;
        s.write_compact_size(MAX_SIZE + 1);
        MessageDeserializer d(s.data());
        d.read_compact_size();
        CHECK(d.error() == DecodeError::BadCompactSize);
    }
}

TEST_CASE("MessageSerializer - Little-endian integers and big-endian port", "[network][message][unit]") {
    MessageSerializer s;
    s.write_uint32(0x12345678);
    auto addr = NetworkAddress::from_ipv4(NODE_NETWORK, 0x7f000001, 8233);
    s.write_network_address(addr);

    const auto& bytes = s.data();
    REQUIRE(bytes.size() == 4 + NETWORK_ADDRESS_SIZE);
    CHECK(bytes[0] == 0x78);
    CHECK(bytes[3] == 0x12);

    // services (8) then IPv4-mapped address (16)
    CHECK(bytes[4] == 0x01);
    CHECK(bytes[4 + 8 + 10] == 0xff);
    CHECK(bytes[4 + 8 + 11] == 0xff);
    CHECK(bytes[4 + 8 + 12] == 127);
    CHECK(bytes[4 + 8 + 15] == 1);

    // 8233 = 0x2029, high byte first
    CHECK(bytes[4 + 24] == 0x20);
    CHECK(bytes[4 + 25] == 0x29);
}

TEST_CASE("MessageDeserializer - First error is sticky", "[network][message][unit]") {
    const std::vector<uint8_t> data = {0x01, 0x02};
    MessageDeserializer d(data);

    CHECK(d.read_uint32() == 0);
    CHECK(d.error() == DecodeError::Truncated);

    // Later reads keep the original error and return zero values
    CHECK(d.read_uint8() == 0);
    CHECK(d.error() == DecodeError::Truncated);
    CHECK(d.position() == 0);
}

TEST_CASE("IsValidUtf8", "[network][message][utf8][unit]") {
    CHECK(IsValidUtf8(""));
    CHECK(IsValidUtf8("/Satoshi:0.1/"));
    CHECK(IsValidUtf8("caf\xc3\xa9"));
    CHECK(IsValidUtf8("\xe2\x82\xac"));
    CHECK(IsValidUtf8("\xf0\x9f\x98\x80"));

    CHECK_FALSE(IsValidUtf8("\xc0\xaf"));          // overlong '/'
    CHECK_FALSE(IsValidUtf8("\xed\xa0\x80"));      // UTF-16 surrogate
    CHECK_FALSE(IsValidUtf8("\xf4\x90\x80\x80"));  // above U+10FFFF
    CHECK_FALSE(IsValidUtf8("\xe2\x82"));          // truncated sequence
    CHECK_FALSE(IsValidUtf8("\x80"));              // lone continuation byte
    CHECK_FALSE(IsValidUtf8("\xff"));
}

TEST_CASE("EncodeMessage - Frame layout", "[network][message][frame][unit]") {
    auto frame = EncodeMessage(magic::TESTNET, Ping{0x0102030405060708ULL});

    REQUIRE(frame.size() == MESSAGE_HEADER_SIZE + 8);

    // Testnet magic goes out as fa 1a f9 bf
    CHECK(frame[0] == 0xfa);
    CHECK(frame[1] == 0x1a);
    CHECK(frame[2] == 0xf9);
    CHECK(frame[3] == 0xbf);

    // Command "ping", NUL padded to 12 bytes
    CHECK(std::memcmp(frame.data() + 4, "ping\0\0\0\0\0\0\0\0", 12) == 0);

    // Length 8, little-endian
    CHECK(frame[16] == 8);
    CHECK(frame[17] == 0);

    // Checksum is the first 4 bytes of double SHA-256 of the body
    std::vector<uint8_t> body(frame.begin() + MESSAGE_HEADER_SIZE, frame.end());
    Hash256 digest = Hash(body);
    CHECK(std::memcmp(frame.data() + 20, digest.data(), 4) == 0);

    // Nonce, little-endian
    CHECK(body[0] == 0x08);
    CHECK(body[7] == 0x01);
}

TEST_CASE("Message round trip for every variant", "[network][message][unit]") {
    Version version;
    version.timestamp = 1700000000;
    version.addr_recv = NetworkAddress::from_ipv4(NODE_NETWORK, 0x0a000001, 8233);
    version.addr_from = *NetworkAddress::from_string("2001:db8::1", 18233);
    version.nonce = 0xdeadbeefcafef00dULL;
    version.user_agent = "/synthnet:0.1/";
    version.start_height = 123456;

    BlockHeader header;
    header.prev_block = filled_hash(0x11);
    header.merkle_root = filled_hash(0x22);
    header.final_sapling_root = filled_hash(0x33);
    header.time = 1700000000;
    header.bits = 0x1f07ffff;
    header.nonce = filled_hash(0x44);
    header.solution = std::vector<uint8_t>(1344, 0x5a);
    header.tx_count = 0;

    BlockLocator locator;
    locator.hashes = {filled_hash(1), filled_hash(2)};
    locator.hash_stop = filled_hash(0);

    const InventoryVector block_inv(InventoryType::MSG_BLOCK, filled_hash(0xab));
    const InventoryVector tx_inv(InventoryType::MSG_TX, filled_hash(0xcd));

    const std::vector<Message> messages = {
        version,
        Verack{},
        Ping{42},
        Pong{42},
        GetAddr{},
        Addr{{TimestampedAddress(1700000000, NetworkAddress::from_ipv4(NODE_NETWORK, 0xc0a80001, 8233)),
              TimestampedAddress(1700000001, *NetworkAddress::from_string("::1", 18233))}},
        MemPool{},
        Inv{{block_inv, tx_inv}},
        GetData{{block_inv}},
        NotFound{{tx_inv}},
        GetHeaders{locator},
        GetBlocks{locator},
        Headers{{header}},
        Reject{"tx", 0x10, "bad-txns", filled_hash(0x99)},
        Reject{"version", 0x11, "obsolete", std::nullopt},
    };

    for (const auto& msg : messages) {
        INFO("command: " << CommandOf(msg));
        auto frame = EncodeMessage(magic::MAINNET, msg);

        Message decoded;
        REQUIRE(DecodeMessage(magic::MAINNET, frame, decoded) == DecodeError::None);
        CHECK(KindOf(decoded) == KindOf(msg));
        CHECK(decoded == msg);
    }
}

TEST_CASE("NetworkAddress - IPv4 stays IPv4, IPv6 unchanged", "[network][message][address][unit]") {
    auto v4 = NetworkAddress::from_string("192.168.1.7", 8233);
    auto v6 = NetworkAddress::from_string("2001:db8::7", 8233);
    REQUIRE(v4);
    REQUIRE(v6);

    Addr addr{{TimestampedAddress(1, *v4), TimestampedAddress(2, *v6)}};
    Message decoded;
    REQUIRE(DecodeMessage(magic::REGTEST, EncodeMessage(magic::REGTEST, addr), decoded) == DecodeError::None);

    const auto& out = std::get<Addr>(decoded).addresses;
    REQUIRE(out.size() == 2);
    CHECK(out[0].address.is_ipv4());
    CHECK(out[0].address.to_endpoint().address().is_v4());
    CHECK(out[0].address.to_string() == "192.168.1.7");
    CHECK_FALSE(out[1].address.is_ipv4());
    CHECK(out[1].address.to_string() == "2001:db8::7");
    CHECK(out[1].address.port == 8233);
}

TEST_CASE("DecodeFrame - Stream handling", "[network][message][frame][unit]") {
    auto frame = EncodeMessage(magic::TESTNET, Pong{7});

    SECTION("Partial frame is Incomplete and consumes nothing") {
        for (size_t len : {size_t(0), size_t(10), MESSAGE_HEADER_SIZE, frame.size() - 1}) {
            Message out;
            auto result = DecodeFrame(magic::TESTNET, frame.data(), len, out);
            CHECK(result.error == DecodeError::Incomplete);
            CHECK(result.consumed == 0);
        }
    }

    SECTION("Two frames back to back decode one at a time") {
        auto second = EncodeMessage(magic::TESTNET, Ping{8});
        std::vector<uint8_t> stream = frame;
        stream.insert(stream.end(), second.begin(), second.end());

        Message out;
        auto first = DecodeFrame(magic::TESTNET, stream.data(), stream.size(), out);
        REQUIRE(first.error == DecodeError::None);
        REQUIRE(first.consumed == frame.size());
        CHECK(std::get<Pong>(out).nonce == 7);

        auto next = DecodeFrame(magic::TESTNET, stream.data() + first.consumed, stream.size() - first.consumed, out);
        REQUIRE(next.error == DecodeError::None);
        CHECK(next.consumed == second.size());
        CHECK(std::get<Ping>(out).nonce == 8);
    }

    SECTION("Missing bytes through DecodeMessage are Truncated") {
        std::vector<uint8_t> partial(frame.begin(), frame.end() - 1);
        Message out;
        CHECK(DecodeMessage(magic::TESTNET, partial, out) == DecodeError::Truncated);
    }

    SECTION("Trailing bytes after the frame are a LengthMismatch") {
        std::vector<uint8_t> longer = frame;
        longer.push_back(0x00);
        Message out;
        CHECK(DecodeMessage(magic::TESTNET, longer, out) == DecodeError::LengthMismatch);
    }
}

TEST_CASE("DecodeFrame - Header errors", "[network][message][frame][unit]") {
    SECTION("Wrong network magic") {
        auto frame = EncodeMessage(magic::MAINNET, Verack{});
        Message out;
        auto result = DecodeFrame(magic::TESTNET, frame.data(), frame.size(), out);
        CHECK(result.error == DecodeError::BadMagic);
    }

    SECTION("Declared length above the protocol limit, before the body arrives") {
        MessageHeader header(magic::TESTNET, "inv", static_cast<uint32_t>(MAX_PROTOCOL_MESSAGE_LENGTH + 1));
        auto bytes = serialize_header(header);
        Message out;
        auto result = DecodeFrame(magic::TESTNET, bytes.data(), bytes.size(), out);
        CHECK(result.error == DecodeError::OversizedMessage);
    }

    SECTION("Any single flipped body byte is a checksum mismatch") {
        auto frame = EncodeMessage(magic::TESTNET, Ping{0x1122334455667788ULL});
        for (size_t i = MESSAGE_HEADER_SIZE; i < frame.size(); ++i) {
            auto corrupted = frame;
            corrupted[i] ^= 0x01;
            Message out;
            auto result = DecodeFrame(magic::TESTNET, corrupted.data(), corrupted.size(), out);
            CHECK(result.error == DecodeError::ChecksumMismatch);
        }
    }

    SECTION("Unknown command reports the whole frame as consumed") {
        const std::vector<uint8_t> body = {1, 2, 3};
        auto frame = raw_frame(magic::TESTNET, "sendheaders", body);
        Message out;
        auto result = DecodeFrame(magic::TESTNET, frame.data(), frame.size(), out);
        CHECK(result.error == DecodeError::UnknownCommand);
        CHECK(result.consumed == frame.size());
        CHECK(result.command == "sendheaders");
    }
}

TEST_CASE("DecodeFrame - Payload errors", "[network][message][frame][unit]") {
    Message out;

    SECTION("Leftover body bytes") {
        auto frame = raw_frame(magic::TESTNET, "ping", std::vector<uint8_t>(9, 0x01));
        CHECK(DecodeMessage(magic::TESTNET, frame, out) == DecodeError::LengthMismatch);
    }

    SECTION("Short body") {
        auto frame = raw_frame(magic::TESTNET, "pong", std::vector<uint8_t>(4, 0x01));
        CHECK(DecodeMessage(magic::TESTNET, frame, out) == DecodeError::Truncated);
    }

    SECTION("Element count larger than the body can hold") {
        MessageSerializer s;
        s.write_compact_size(1000);
        s.write_bytes(std::vector<uint8_t>(36, 0));
        auto frame = raw_frame(magic::TESTNET, "inv", s.data());
        CHECK(DecodeMessage(magic::TESTNET, frame, out) == DecodeError::Truncated);
    }

    SECTION("Non-minimal count prefix") {
        const std::vector<uint8_t> body = {0xfd, 0x01, 0x00};
        auto frame = raw_frame(magic::TESTNET, "addr", body);
        CHECK(DecodeMessage(magic::TESTNET, frame, out) == DecodeError::BadCompactSize);
    }

    SECTION("Invalid UTF-8 user agent") {
        Version v;
        v.user_agent = "ok";
        auto body = SerializePayload(v);
        // user agent bytes sit right after the 80 fixed bytes and the 1-byte length
        body[81] = 0xc0;
        body[82] = 0xaf;
        auto frame = raw_frame(magic::TESTNET, "version", body);
        CHECK(DecodeMessage(magic::TESTNET, frame, out) == DecodeError::InvalidUtf8);
    }
}

TEST_CASE("Version - relay flag is optional on decode", "[network][message][version][unit]") {
    Version v;
    v.nonce = 99;
    v.relay = false;
    auto body = SerializePayload(v);
    REQUIRE(body.size() == VERSION_FIXED_SIZE + 1);

    body.pop_back();
    Message out;
    REQUIRE(DeserializePayload(MessageKind::Version, body.data(), body.size(), out) == DecodeError::None);
    CHECK(std::get<Version>(out).nonce == 99);
    CHECK_FALSE(std::get<Version>(out).relay);
}

TEST_CASE("Version::create fills harness defaults", "[network][message][version][unit]") {
    asio::ip::tcp::endpoint remote(asio::ip::make_address("127.0.0.1"), 8233);
    asio::ip::tcp::endpoint local(asio::ip::make_address("::"), 0);
    auto v = Version::create(remote, local);

    CHECK(v.version == PROTOCOL_VERSION);
    CHECK(v.services == NODE_NETWORK);
    CHECK(v.addr_recv.services == NODE_NETWORK);
    CHECK(v.addr_recv.is_ipv4());
    CHECK(v.addr_recv.port == 8233);
    CHECK(v.timestamp > 0);
    CHECK_FALSE(v.relay);

    // Nonces differ between calls
    auto w = Version::create(remote, local);
    CHECK(v.nonce != w.nonce);
}

TEST_CASE("Reject - data hash only when exactly 32 bytes remain", "[network][message][unit]") {
    Reject with_data{"block", 0x10, "bad-blk", filled_hash(0x42)};
    auto body = SerializePayload(with_data);

    Message out;
    REQUIRE(DeserializePayload(MessageKind::Reject, body.data(), body.size(), out) == DecodeError::None);
    REQUIRE(std::get<Reject>(out).data.has_value());
    CHECK(*std::get<Reject>(out).data == filled_hash(0x42));

    // A stray byte after the reason is not a hash
    Reject without{"version", 0x11, "obsolete", std::nullopt};
    auto short_body = SerializePayload(without);
    short_body.push_back(0x00);
    CHECK(DeserializePayload(MessageKind::Reject, short_body.data(), short_body.size(), out) ==
          DecodeError::LengthMismatch);
}

TEST_CASE("Command names and kinds", "[network][message][unit]") {
    CHECK(std::string(CommandName(MessageKind::Version)) == "version");
    CHECK(std::string(CommandName(MessageKind::GetHeaders)) == "getheaders");
    CHECK(CommandOf(Message{MemPool{}}) == "mempool");

    for (size_t i = 0; i < MESSAGE_KIND_COUNT; ++i) {
        auto kind = static_cast<MessageKind>(i);
        auto parsed = KindFromCommand(CommandName(kind));
        REQUIRE(parsed);
        CHECK(*parsed == kind);
    }
    CHECK_FALSE(KindFromCommand("sendheaders"));
    CHECK_FALSE(KindFromCommand(""));
}

TEST_CASE("CanonicalReply", "[network][message][autoreply][unit]") {
    SECTION("Ping -> Pong with the same nonce") {
        auto reply = CanonicalReply(Ping{1234});
        REQUIRE(reply);
        CHECK(*reply == Message{Pong{1234}});
    }

    SECTION("Version -> Verack") {
        auto reply = CanonicalReply(Version{});
        REQUIRE(reply);
        CHECK(std::holds_alternative<Verack>(*reply));
    }

    SECTION("Requests get empty answers") {
        CHECK(*CanonicalReply(GetAddr{}) == Message{Addr{}});
        CHECK(*CanonicalReply(MemPool{}) == Message{Inv{}});
        CHECK(*CanonicalReply(GetBlocks{}) == Message{Inv{}});
        CHECK(*CanonicalReply(GetHeaders{}) == Message{Headers{}});
    }

    SECTION("GetData -> NotFound for the same inventory") {
        GetData request{{InventoryVector(InventoryType::MSG_BLOCK, filled_hash(7))}};
        auto reply = CanonicalReply(request);
        REQUIRE(reply);
        CHECK(std::get<NotFound>(*reply).inventory == request.inventory);
    }

    SECTION("Replies and announcements have no reply") {
        CHECK_FALSE(CanonicalReply(Pong{1}));
        CHECK_FALSE(CanonicalReply(Verack{}));
        CHECK_FALSE(CanonicalReply(Addr{}));
        CHECK_FALSE(CanonicalReply(Inv{}));
        CHECK_FALSE(CanonicalReply(Headers{}));
        CHECK_FALSE(CanonicalReply(Reject{}));
    }
}

TEST_CASE("GenerateNonce varies", "[network][message][unit]") {
    uint64_t a = GenerateNonce();
    uint64_t b = GenerateNonce();
    uint64_t c = GenerateNonce();
    CHECK_FALSE((a == b && b == c));
}

// Fuzz target for wire frame decoding
// Feeds arbitrary bytes through DecodeFrame the way a session consumes its
// receive buffer, and checks every successfully decoded message re-encodes
// to a frame that decodes to the same message.
//
// Frame decoding sees untrusted bytes from the node under test.
// Bugs in this code can:
// - Crash the harness (out-of-bounds reads on truncated fields)
// - Exhaust memory (element counts trusted before the bytes are present)
// - Stall a session (consumed == 0 on a complete frame)
//
// Target code:
// - src/network/message.cpp (DecodeFrame, DeserializePayload, EncodeMessage)

#include "network/message.hpp"
#include "network/protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

using namespace synthnet;

namespace {

void check_round_trip(uint32_t magic, const message::Message &msg) {
    auto frame = message::EncodeMessage(magic, msg);

    message::Message decoded;
    auto err = message::DecodeMessage(magic, frame, decoded);
    if (err != message::DecodeError::None) {
        // A message we decoded must re-encode to something we accept - BUG!
        __builtin_trap();
    }
    if (!(decoded == msg)) {
        __builtin_trap();
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) return 0;

    // First byte picks the magic: the network's own, or whatever the header says
    const bool use_header_magic = (data[0] & 0x01) != 0;
    data += 1;
    size -= 1;

    uint32_t magic = protocol::magic::TESTNET;
    if (use_header_magic && size >= 4) {
        magic = static_cast<uint32_t>(data[0]) | (static_cast<uint32_t>(data[1]) << 8) |
                (static_cast<uint32_t>(data[2]) << 16) | (static_cast<uint32_t>(data[3]) << 24);
    }

    // Stream decode: consume frames until one is incomplete or fatal
    size_t offset = 0;
    while (offset < size) {
        message::Message msg;
        auto result = message::DecodeFrame(magic, data + offset, size - offset, msg);

        if (result.consumed > size - offset) {
            __builtin_trap();
        }

        if (result.error == message::DecodeError::Incomplete) {
            if (result.consumed != 0) {
                __builtin_trap();
            }
            break;
        }
        if (result.error == message::DecodeError::BadMagic ||
            result.error == message::DecodeError::OversizedMessage ||
            result.error == message::DecodeError::ChecksumMismatch) {
            // Fatal for a session; nothing more to parse
            break;
        }

        // Every other outcome means a whole frame was present
        if (result.consumed < protocol::MESSAGE_HEADER_SIZE) {
            __builtin_trap();
        }
        if (result.error == message::DecodeError::None) {
            check_round_trip(magic, msg);
        }
        offset += result.consumed;
    }

    return 0;
}

// Fuzz target for payload and field decoding
// Tests DeserializePayload for every message kind, CompactSize decoding and
// the UTF-8 validator, without the frame header and checksum in the way.
//
// Target code:
// - src/network/message.cpp (CompactSize, MessageDeserializer, IsValidUtf8)

#include "network/message.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

using namespace synthnet;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) return 0;

    const uint8_t mode = data[0];
    data += 1;
    size -= 1;

    // TEST 1: CompactSize decode must consume a canonical encoding
    if ((mode & 0x80) != 0) {
        message::CompactSize cs;
        message::DecodeError err = message::DecodeError::None;
        size_t used = cs.decode(data, size, &err);
        if (used > 0) {
            if (used > size || err != message::DecodeError::None) {
                __builtin_trap();
            }
            // Minimal encodings only, so the width must match the value
            if (used != cs.encoded_size()) {
                __builtin_trap();
            }
            std::vector<uint8_t> reencoded(cs.encoded_size());
            cs.encode(reencoded.data());
            for (size_t i = 0; i < used; ++i) {
                if (reencoded[i] != data[i]) {
                    __builtin_trap();
                }
            }
        } else if (err == message::DecodeError::None) {
            __builtin_trap();
        }
        return 0;
    }

    // TEST 2: UTF-8 validation never reads past the end
    if ((mode & 0x40) != 0) {
        (void)message::IsValidUtf8(std::string_view(reinterpret_cast<const char *>(data), size));
        return 0;
    }

    // TEST 3: Payload decode for the kind selected by the mode byte
    const auto kind = static_cast<message::MessageKind>(mode % message::MESSAGE_KIND_COUNT);
    message::Message msg;
    auto err = message::DeserializePayload(kind, data, size, msg);
    if (err != message::DecodeError::None) {
        return 0;
    }
    if (message::KindOf(msg) != kind) {
        __builtin_trap();
    }

    auto payload = message::SerializePayload(msg);
    message::Message again;
    if (message::DeserializePayload(kind, payload.data(), payload.size(), again) != message::DecodeError::None) {
        __builtin_trap();
    }
    if (!(again == msg)) {
        __builtin_trap();
    }
    return 0;
}

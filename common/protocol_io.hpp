#pragma once

// ============================================================
// protocol_io.hpp -- Frame size field encode/decode
// ============================================================

#include "protocol.hpp"
#include "errors.hpp"
#include <string>

namespace proto {

// ---- Size field ----

// Writes the 10-digit zero-padded decimal form of len into buf.
// Throws PayloadTooLarge if len does not fit.
inline void encode_size_field(u64 len, char buf[FRAME_SIZE_FIELD_LEN]) {
    if (len > MAX_FRAME_PAYLOAD) {
        throw PayloadTooLarge("Payload of " + std::to_string(len) +
                              " bytes exceeds frame maximum of " +
                              std::to_string(MAX_FRAME_PAYLOAD));
    }
    for (size_t i = FRAME_SIZE_FIELD_LEN; i > 0; --i) {
        buf[i - 1] = (char)('0' + (len % 10));
        len /= 10;
    }
}

inline std::string encode_size_field(u64 len) {
    char buf[FRAME_SIZE_FIELD_LEN];
    encode_size_field(len, buf);
    return std::string(buf, FRAME_SIZE_FIELD_LEN);
}

// Parses a 10-byte size field. Throws MalformedLength unless every
// byte is an ASCII digit.
inline u64 decode_size_field(const char buf[FRAME_SIZE_FIELD_LEN]) {
    u64 len = 0;
    for (size_t i = 0; i < FRAME_SIZE_FIELD_LEN; ++i) {
        char c = buf[i];
        if (c < '0' || c > '9') {
            std::string shown;
            for (size_t j = 0; j < FRAME_SIZE_FIELD_LEN; ++j) {
                unsigned char b = (unsigned char)buf[j];
                shown += (b >= 0x20 && b < 0x7f) ? (char)b : '?';
            }
            throw MalformedLength("Malformed frame size field '" + shown + "'");
        }
        len = len * 10 + (u64)(c - '0');
    }
    return len;
}

// ---- Whole frames (in-memory) ----

inline std::string encode_frame(const std::string& payload) {
    std::string out = encode_size_field((u64)payload.size());
    out += payload;
    return out;
}

} // namespace proto

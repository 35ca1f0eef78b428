#pragma once

// ============================================================
// hash.hpp -- xxHash3 payload digests for minftp
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <stdexcept>

// XXH_STATIC_LINKING_ONLY exposes the XXH3 streaming state type
#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

// 16-byte (128-bit) hash result, big-endian
using Hash128 = std::array<u8, 16>;

inline Hash128 to_bytes(const XXH128_hash_t& h) {
    Hash128 result;
    for (int i = 0; i < 8; ++i) {
        result[(size_t)i]     = (u8)(h.high64 >> (56 - 8 * i));
        result[(size_t)i + 8] = (u8)(h.low64  >> (56 - 8 * i));
    }
    return result;
}

// One-shot xxh3_128 of a memory buffer
inline Hash128 xxh3_128(const void* data, size_t len) {
    return to_bytes(XXH3_128bits(data, len));
}

// Streaming hasher: fed chunk by chunk as a payload crosses the wire
class StreamHasher128 {
public:
    StreamHasher128() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~StreamHasher128() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher128(const StreamHasher128&) = delete;
    StreamHasher128& operator=(const StreamHasher128&) = delete;

    void reset() {
        XXH3_128bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        XXH3_128bits_update(state_, data, len);
    }

    Hash128 digest() const {
        return to_bytes(XXH3_128bits_digest(state_));
    }

private:
    XXH3_state_t* state_;
};

inline std::string to_hex(const Hash128& h) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(32);
    for (u8 b : h) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

} // namespace hash

#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers for resumecp
//
// Used to seal the completion ledger file so a torn or edited
// ledger is detected on load. Never used to compare file data.
// ============================================================

#include "platform.hpp"
#include <string>
#include <cstddef>

#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

// Compute xxh3_64 of a memory buffer
inline u64 xxh3_64(const void* data, size_t len) {
    return (u64)XXH3_64bits(data, len);
}

inline u64 xxh3_64(const std::string& s) {
    return xxh3_64(s.data(), s.size());
}

// Fixed-width lowercase hex, 16 digits
inline std::string to_hex(u64 v) {
    static const char digits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[(size_t)i] = digits[v & 0xF];
        v >>= 4;
    }
    return out;
}

// Parse exactly 16 hex digits; false on any other input
inline bool from_hex(const std::string& s, u64& out) {
    if (s.size() != 16) return false;
    u64 v = 0;
    for (char c : s) {
        v <<= 4;
        if (c >= '0' && c <= '9')      v |= (u64)(c - '0');
        else if (c >= 'a' && c <= 'f') v |= (u64)(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') v |= (u64)(c - 'A' + 10);
        else return false;
    }
    out = v;
    return true;
}

} // namespace hash

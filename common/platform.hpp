#pragma once

// ============================================================
// platform.hpp -- POSIX headers and portable integer types
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>
#include <cstring>

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>

namespace platform {

// errno text with the numeric code appended, e.g. "Permission denied (errno=13)"
inline std::string errno_str(int err) {
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

inline std::string last_error_str() {
    return errno_str(errno);
}

} // namespace platform

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

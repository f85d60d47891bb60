#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace utils {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

// Current time in nanoseconds since epoch
inline u64 now_ns() {
    using namespace std::chrono;
    return (u64)duration_cast<nanoseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    std::ostringstream ss;
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        ss << std::fixed << std::setprecision(2) << (double)bytes / 1024.0 << " KB";
    } else if (bytes < 1024ULL * 1024 * 1024) {
        ss << std::fixed << std::setprecision(2) << (double)bytes / BYTES_PER_MB << " MB";
    } else {
        ss << std::fixed << std::setprecision(2) << (double)bytes / (BYTES_PER_MB * 1024) << " GB";
    }
    return ss.str();
}

// Rate in MB/s, right-aligned to 5 columns: " 3.14 MB/s"
inline std::string format_rate_mbps(double mbps) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << std::setw(5) << mbps << " MB/s";
    return ss.str();
}

// Remaining time as "MM:SS"; "unknown" for an infinite or invalid estimate.
// Minutes are not wrapped into hours.
inline std::string format_mmss(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0) return "unknown";
    u64 total = (u64)seconds;
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(2) << total / 60
       << ':' << std::setw(2) << total % 60;
    return ss.str();
}

// Format duration as "1h 23m 45s" or "45s"
inline std::string format_duration_s(u64 seconds) {
    if (seconds < 60) return std::to_string(seconds) + "s";
    if (seconds < 3600) {
        return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
    }
    return std::to_string(seconds / 3600) + "h " +
           std::to_string((seconds % 3600) / 60) + "m " +
           std::to_string(seconds % 60) + "s";
}

// Integer percentage, floor(done * 100 / total); 100 for an empty total
inline u32 percent_of(u64 done, u64 total) {
    if (total == 0) return 100;
    if (done >= total) return 100;
    // done < total, so done * 100 only overflows above ~1.8e17 bytes
    return (u32)((done * 100) / total);
}

// Nanosecond timestamp as "SECONDS.NNNNNNNNN"
inline std::string format_timestamp_ns(u64 ns) {
    std::ostringstream ss;
    ss << ns / 1000000000ULL << '.'
       << std::setfill('0') << std::setw(9) << ns % 1000000000ULL;
    return ss.str();
}

// Inverse of format_timestamp_ns. The fraction may have 0-9 digits.
// Returns false on anything that is not "digits[.digits]".
inline bool parse_timestamp_ns(const std::string& s, u64& out) {
    if (s.empty()) return false;
    size_t dot = s.find('.');
    std::string sec  = s.substr(0, dot);
    std::string frac = dot == std::string::npos ? "" : s.substr(dot + 1);
    if (sec.empty() || sec.size() > 11 || frac.size() > 9) return false;

    u64 secs = 0;
    for (char c : sec) {
        if (c < '0' || c > '9') return false;
        secs = secs * 10 + (u64)(c - '0');
    }
    u64 nanos = 0;
    for (size_t i = 0; i < 9; ++i) {
        char c = i < frac.size() ? frac[i] : '0';
        if (c < '0' || c > '9') return false;
        nanos = nanos * 10 + (u64)(c - '0');
    }
    out = secs * 1000000000ULL + nanos;
    return true;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

// Clamp value
template<typename T>
inline T clamp(T val, T lo, T hi) {
    return val < lo ? lo : (val > hi ? hi : val);
}

} // namespace utils

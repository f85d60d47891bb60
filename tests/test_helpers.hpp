#pragma once

// ============================================================
// test_helpers.hpp -- Scratch directories and file fixtures
// ============================================================

#include "common/platform.hpp"
#include "common/file_io.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <atomic>

namespace fs = std::filesystem;

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<u32> counter{0};
        path_ = fs::temp_directory_path() /
                ("resumecp_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(utils::now_ns()) + "_" +
                 std::to_string(counter.fetch_add(1)));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str(const std::string& rel = "") const {
        return rel.empty() ? path_.string() : (path_ / rel).string();
    }

private:
    fs::path path_;
};

inline void write_file(const std::string& path, const std::string& content) {
    fs::path p(path);
    if (!p.parent_path().empty()) fs::create_directories(p.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(content.data(), (std::streamsize)content.size());
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

// Deterministic content without zero bytes
inline std::string pattern_bytes(size_t n, u32 seed = 7) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) {
        s[i] = (char)(((i * 131 + seed) % 255) + 1);
    }
    return s;
}

// Pattern content with zeros over [zero_from, zero_to) and a zeroed
// final `zero_tail` bytes, the shape of disk images and padded archives
inline std::string zero_run_bytes(size_t n, size_t zero_from, size_t zero_to,
                                  size_t zero_tail) {
    std::string s = pattern_bytes(n);
    for (size_t i = zero_from; i < zero_to && i < n; ++i) s[i] = '\0';
    for (size_t i = n > zero_tail ? n - zero_tail : 0; i < n; ++i) s[i] = '\0';
    return s;
}

inline u64 mtime_of(const std::string& path) {
    return file_io::stat_path(path).mtime_ns;
}

#pragma once

// ============================================================
// file_io.hpp -- mmap reads, sequential writes, stat helpers
// ============================================================

#include "platform.hpp"
#include <string>
#include <cstdint>

namespace file_io {

// Access pattern hint passed to madvise
enum class Access {
    Sequential,  // streaming copy
    Random,      // block probes of the divergence search
};

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path, Access access = Access::Sequential);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    // Get pointer to chunk at given offset, nullptr at or past end-of-file
    const char* chunk_ptr(u64 offset) const {
        if (offset >= size_) return nullptr;
        return data_ + offset;
    }

    // Bytes available at offset, clamped to max_len and end-of-file
    u64 chunk_len(u64 offset, u64 max_len) const {
        if (offset >= size_) return 0;
        u64 remaining = size_ - offset;
        return remaining < max_len ? remaining : max_len;
    }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};
    int fd_{-1};
};

// ---- SequentialWriter: pwrite from a start offset ----
// The file never extends past the bytes actually written, so an
// interrupted copy leaves a destination that is a prefix of the source.
class SequentialWriter {
public:
    SequentialWriter() = default;
    ~SequentialWriter();

    SequentialWriter(const SequentialWriter&) = delete;
    SequentialWriter& operator=(const SequentialWriter&) = delete;

    // Open/create the file and position at `offset`. resume=false truncates
    // to zero (offset must be 0). resume=true keeps the first `offset` bytes
    // and drops everything after them.
    void open(const std::string& path, u64 offset, bool resume = false);

    // Write at the current position; throws IoError on failure
    void write(const void* data, size_t len);

    // fdatasync and close; throws IoError
    void close();

    bool is_open() const { return fd_ >= 0; }
    u64 offset() const { return offset_; }

private:
    int   fd_{-1};
    u64   offset_{0};
    std::string path_;

    // Close without syncing or throwing
    void release();
};

// ---- Metadata ----

struct FileStat {
    bool exists{false};
    bool is_regular{false};
    bool is_dir{false};
    u64  size{0};
    u64  mtime_ns{0};
};

// stat(2) the path (following symlinks). A missing path yields
// exists=false; any other failure throws IoError.
FileStat stat_path(const std::string& path);

// Set file modification time (nanoseconds since epoch); throws IoError
void set_mtime(const std::string& path, u64 mtime_ns);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Replace `path` with `content` and fsync it before returning; throws IoError
void write_file_synced(const std::string& path, const std::string& content);

// fsync the directory holding `path` so a rename into it is durable
void sync_parent_dir(const std::string& path);

} // namespace file_io

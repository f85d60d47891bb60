#pragma once

// ============================================================
// completion_ledger.hpp -- Persistent record of finished files
// ============================================================

#include "../common/platform.hpp"
#include "file_status.hpp"
#include "sync_config.hpp"
#include <string>
#include <unordered_map>
#include <mutex>
#include <chrono>

// Maps a destination path to the source mtime it was verified against.
// Stored as a text file:
//
//   # resumecp completion ledger
//   1712345678.123456789<TAB>/abs/path/to/destination
//   ...
//   # xxh3 0123456789abcdef
//
// The trailing digest covers the entry lines; a ledger that fails to
// parse or verify is discarded as a whole. Entries whose timestamp is
// older than the retention window are dropped whenever the file is
// written. The file is rewritten after every completion.
class CompletionLedger {
public:
    explicit CompletionLedger(const std::string& path,
                              std::chrono::seconds retention =
                                  std::chrono::hours(24 * 7 * DEFAULT_RETENTION_WEEKS));

    // Classify src/dst for one pass (see classify_file). Only stats,
    // never modifies anything.
    FileStatus is_done(const std::string& src_path,
                       const std::string& dst_path,
                       CopyMode mode) const;

    // Stamp the source mtime onto the destination, record it, and
    // persist immediately. The stamp lands before the ledger write.
    void mark_done(const std::string& src_path, const std::string& dst_path);

    // In-memory insert/overwrite, no persistence
    void record(const std::string& dst_path, u64 mtime_ns);

    // Recorded timestamp for dst_path; false if there is none
    bool lookup(const std::string& dst_path, u64& mtime_ns) const;

    // Write the map to storage via <path>.tmp + rename, pruning entries
    // older than now - retention. Throws IoError.
    void persist();

    size_t size() const;
    const std::string& path() const { return path_; }

    // Absolute, lexically normalized form used as the map key
    static std::string key_for(const std::string& dst_path);

private:
    void load();
    void persist_locked();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, u64> entries_;
    std::string path_;
    std::chrono::seconds retention_;
};

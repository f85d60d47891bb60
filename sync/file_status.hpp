#pragma once

// ============================================================
// file_status.hpp -- Per-pass file classification
//
// The two-pass policy as a pure function over stat/ledger facts,
// so it can be exercised without touching the filesystem.
// ============================================================

#include "../common/platform.hpp"

enum class CopyMode {
    NewFilesOnly,   // pass 1: only grab destinations that don't exist yet
    AllFiles,       // pass 2: also verify/resume existing destinations
};

enum class FileStatus {
    New,              // destination missing
    Cached,           // ledger record equals the source mtime
    PartiallyCopied,  // destination exists, not trusted; needs a resume search
    Done,             // destination still carries its recorded stamp
};

// Everything the classification looks at for one file
struct FileFacts {
    u64  src_mtime_ns{0};
    bool dst_exists{false};
    u64  dst_mtime_ns{0};
    bool has_record{false};
    u64  recorded_mtime_ns{0};
};

// Classify one file for the given pass.
//   Cached           record == source mtime (either pass)
//   New              destination missing
//   Done             AllFiles only: destination mtime == record
//   PartiallyCopied  anything else; under NewFilesOnly it means "deferred"
FileStatus classify_file(CopyMode mode, const FileFacts& facts);

// Whether the pass hands a file with this status to the transfer engine
bool needs_transfer(CopyMode mode, FileStatus status);

const char* to_string(CopyMode mode);
const char* to_string(FileStatus status);

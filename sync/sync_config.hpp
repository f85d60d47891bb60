#pragma once

// ============================================================
// sync_config.hpp -- Tunables and run configuration
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <chrono>

// Divergence search compares blocks of this many bytes
static constexpr u64 DEFAULT_BLOCK_SIZE  = 1024;
// Stream copy chunk (independent of the divergence block)
static constexpr u64 DEFAULT_CHUNK_SIZE  = 1024 * 1024;
static constexpr u64 MIN_CHUNK_SIZE      = 4 * 1024;
static constexpr u64 MAX_CHUNK_SIZE      = 64 * 1024 * 1024;
// Throughput samples kept by the rate estimator
static constexpr size_t DEFAULT_RATE_WINDOW = 10;
static constexpr int DEFAULT_RETENTION_WEEKS = 4;
static constexpr int MAX_RETENTION_WEEKS     = 5200;

// find_resume_offset() result: destination already equals source
static constexpr i64 RESUME_NOT_NEEDED = -1;

struct SyncConfig {
    std::string src_path;
    std::string dst_path;
    bool        dry_run{false};
    u64         block_size{DEFAULT_BLOCK_SIZE};
    u64         chunk_size{DEFAULT_CHUNK_SIZE};
    size_t      rate_window{DEFAULT_RATE_WINDOW};
    int         retention_weeks{DEFAULT_RETENTION_WEEKS};
    std::string ledger_path;    // empty = default_ledger_path()
    std::string start_from;     // base name to start the walk at (empty = all)
    std::string log_file;
    std::string error_log;
    bool        verbose{false};

    std::chrono::seconds retention() const {
        return std::chrono::seconds((i64)retention_weeks * 7 * 24 * 3600);
    }
};

// $HOME/.resumecp/ledger, or ./.resumecp_ledger without HOME
std::string default_ledger_path();

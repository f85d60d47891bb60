#pragma once

// ============================================================
// transfer_engine.hpp -- Resumable single-file copy
// ============================================================

#include "../common/platform.hpp"
#include "../common/cancel_token.hpp"
#include "completion_ledger.hpp"
#include "divergence_locator.hpp"
#include "sync_config.hpp"
#include <string>
#include <functional>

struct TransferOptions {
    u64    chunk_size{DEFAULT_CHUNK_SIZE};
    size_t rate_window{DEFAULT_RATE_WINDOW};
    bool   dry_run{false};
};

// Emitted whenever the integer percentage changes
struct ProgressEvent {
    u32    percent{0};
    double rate_mbps{0.0};      // rolling median
    double remaining_s{0.0};    // +inf when the rate is still zero
    u64    copied_bytes{0};     // including the resumed prefix
    u64    total_bytes{0};
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

enum class CopyOutcome {
    AlreadyEqual,   // destination verified equal; marked done, nothing written
    Copied,         // bytes streamed, marked done
    DryRun,         // classification reported only
    Cancelled,      // stopped mid-stream; partial destination left in place
};

struct CopyResult {
    CopyOutcome outcome{CopyOutcome::Copied};
    i64 resume_offset{0};
    u64 bytes_copied{0};
    u64 total_bytes{0};
};

const char* to_string(CopyOutcome outcome);

class TransferEngine {
public:
    TransferEngine(CompletionLedger& ledger,
                   const DivergenceLocator& locator,
                   const CancelToken& cancel,
                   TransferOptions opts = TransferOptions{});

    void set_progress_callback(ProgressCallback cb) { on_progress_ = std::move(cb); }

    // Copy src to dst, resuming after the verified prefix of an existing
    // destination. Throws IoError when src can't be read and
    // PathConflictError when dst is a directory.
    CopyResult copy_file(const std::string& src_path, const std::string& dst_path);

    const TransferOptions& options() const { return opts_; }

private:
    CompletionLedger&        ledger_;
    const DivergenceLocator& locator_;
    const CancelToken&       cancel_;
    TransferOptions          opts_;
    ProgressCallback         on_progress_;
};

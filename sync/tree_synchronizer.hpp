#pragma once

// ============================================================
// tree_synchronizer.hpp -- Two-pass directory synchronization
//
// Pass 1 (NewFilesOnly) copies files whose destination doesn't exist
// yet; those need no resume search. Pass 2 (AllFiles) then verifies
// and resumes everything that exists but isn't in the ledger. A run
// interrupted during pass 2 finds the pass-1 files Cached next time
// instead of verifying them again.
// ============================================================

#include "../common/platform.hpp"
#include "../common/cancel_token.hpp"
#include "completion_ledger.hpp"
#include "dir_walker.hpp"
#include "file_status.hpp"
#include "transfer_engine.hpp"
#include <string>
#include <functional>
#include <unordered_set>

struct SyncStats {
    u32  cached{0};         // ledger hit before anything was copied
    u32  done{0};           // destination still carries its recorded stamp
    u32  equal{0};          // verified equal by the divergence search
    u32  copied_new{0};     // destination created from scratch
    u32  resumed{0};        // destination existed and was completed
    u32  dry_run{0};        // would have been copied
    u32  skipped{0};        // before the --start-from file
    u32  failed{0};         // distinct files that raised an error
    u64  bytes_copied{0};
    bool cancelled{false};
};

// Called once per file and pass with the classification outcome
using ClassifyObserver = std::function<void(const FileEntry&, CopyMode, FileStatus)>;

class TreeSynchronizer {
public:
    TreeSynchronizer(CompletionLedger& ledger,
                     TransferEngine& engine,
                     const CancelToken& cancel);

    // Skip files until the first one whose base name matches
    void set_start_file(const std::string& name) { start_file_ = name; }
    void set_observer(ClassifyObserver obs) { observer_ = std::move(obs); }

    // Both passes over src_root. Per-file errors are logged and counted;
    // an enumeration error throws IoError.
    SyncStats synchronize(const std::string& src_root, const std::string& dst_root);

    // A single file with AllFiles rules (cached / done / new / resume)
    SyncStats synchronize_file(const std::string& src_path, const std::string& dst_path);

private:
    CompletionLedger&  ledger_;
    TransferEngine&    engine_;
    const CancelToken& cancel_;
    std::string        start_file_;
    ClassifyObserver   observer_;
    bool               two_pass_{true};
    std::unordered_set<std::string> failed_;

    void run_pass(const DirWalker& walker, CopyMode mode, SyncStats& stats);

    // Returns false when the walk should stop (cancelled mid-copy)
    bool process_file(const FileEntry& fe, CopyMode mode, SyncStats& stats);
};

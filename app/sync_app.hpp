#pragma once

// ============================================================
// sync_app.hpp -- resumecp driver: resolves source/destination,
//   wires ledger, locator, engine and synchronizer, runs once
// ============================================================

#include "../common/platform.hpp"
#include "../common/cancel_token.hpp"
#include "../sync/sync_config.hpp"
#include "../sync/tree_synchronizer.hpp"
#include <string>

// What the source/destination arguments resolve to
struct SyncPlan {
    bool        single_file{false};
    std::string src;
    std::string dst;
};

class SyncApp {
public:
    explicit SyncApp(SyncConfig cfg);
    ~SyncApp();

    SyncApp(const SyncApp&) = delete;
    SyncApp& operator=(const SyncApp&) = delete;

    // 0 after a completed or cancelled run, 1 for a usage/structural
    // error, 2 when the run aborted.
    int run();

    // Signal stop from a signal handler
    void stop();

    const SyncStats& stats() const { return stats_; }

    // Source file -> destination directory (keep base name) or exact
    // path; source directory -> destination must not be a regular file.
    // Throws UsageError or PathConflictError.
    static SyncPlan resolve_paths(const std::string& src, const std::string& dst);

private:
    SyncConfig  cfg_;
    CancelToken cancel_;
    SyncStats   stats_;

    void log_summary() const;
};

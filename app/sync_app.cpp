// ============================================================
// sync_app.cpp -- resumecp driver
// ============================================================

#include "sync_app.hpp"
#include "progress_display.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../sync/completion_ledger.hpp"
#include "../sync/divergence_locator.hpp"
#include "../sync/transfer_engine.hpp"
#include <filesystem>

#include <unistd.h>

namespace fs = std::filesystem;

SyncApp::SyncApp(SyncConfig cfg)
    : cfg_(std::move(cfg))
{
    LOG_DEBUG("SyncApp: src=" + cfg_.src_path + " dst=" + cfg_.dst_path +
              " block=" + std::to_string(cfg_.block_size) +
              " chunk=" + std::to_string(cfg_.chunk_size) +
              (cfg_.dry_run ? " dry-run" : ""));
}

SyncApp::~SyncApp() = default;

void SyncApp::stop() {
    cancel_.cancel();
    // write(2) is async-signal-safe; iostreams are not
    static const char msg[] = "\nCopying interrupted by user.\n";
    ssize_t n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)n;
}

SyncPlan SyncApp::resolve_paths(const std::string& src, const std::string& dst) {
    file_io::FileStat src_st = file_io::stat_path(src);
    if (!src_st.exists) {
        throw UsageError("Source does not exist: " + src);
    }
    file_io::FileStat dst_st = file_io::stat_path(dst);

    SyncPlan plan;
    plan.src = src;

    if (src_st.is_regular) {
        plan.single_file = true;
        // An existing directory, or a path spelled with a trailing
        // slash, receives the file under its own name
        if ((dst_st.exists && dst_st.is_dir) || fs::path(dst).filename().empty()) {
            plan.dst = (fs::path(dst) / fs::path(src).filename()).string();
        } else {
            plan.dst = dst;
        }
        return plan;
    }

    if (src_st.is_dir) {
        if (dst_st.exists && !dst_st.is_dir) {
            throw PathConflictError("Destination is a file but source is a directory: " + dst);
        }
        plan.dst = dst;
        return plan;
    }

    throw UsageError("Source is neither a regular file nor a directory: " + src);
}

int SyncApp::run() {
    SyncPlan plan;
    try {
        plan = resolve_paths(cfg_.src_path, cfg_.dst_path);
    } catch (const UsageError& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const PathConflictError& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const IoError& e) {
        LOG_ERROR(e.what());
        return 1;
    }

    std::string ledger_path = cfg_.ledger_path.empty() ? default_ledger_path()
                                                       : cfg_.ledger_path;
    LOG_DEBUG("Ledger: " + ledger_path);

    CompletionLedger  ledger(ledger_path, cfg_.retention());
    DivergenceLocator locator(cfg_.block_size);

    TransferOptions opts;
    opts.chunk_size  = cfg_.chunk_size;
    opts.rate_window = cfg_.rate_window;
    opts.dry_run     = cfg_.dry_run;
    TransferEngine engine(ledger, locator, cancel_, opts);

    ProgressDisplay display;
    engine.set_progress_callback([&display](const ProgressEvent& ev) {
        display.update(ev);
    });

    TreeSynchronizer sync(ledger, engine, cancel_);
    sync.set_start_file(cfg_.start_from);

    LOG_INFO((plan.single_file ? "Copying file " : "Synchronizing ") + plan.src +
             " -> " + plan.dst + (cfg_.dry_run ? " (dry run)" : ""));

    const u64 start_ns = utils::now_ns();
    try {
        stats_ = plan.single_file ? sync.synchronize_file(plan.src, plan.dst)
                                  : sync.synchronize(plan.src, plan.dst);
    } catch (const std::exception& e) {
        display.finish();
        LOG_ERROR("Synchronization aborted: " + std::string(e.what()));
        return 2;
    }

    display.finish();
    log_summary();
    LOG_INFO("Finished in " + utils::format_duration_s((utils::now_ns() - start_ns) / 1000000000ULL));
    return 0;
}

void SyncApp::log_summary() const {
    LOG_INFO("Summary: " +
             std::to_string(stats_.copied_new) + " new, " +
             std::to_string(stats_.resumed) + " resumed, " +
             std::to_string(stats_.equal) + " equal, " +
             std::to_string(stats_.cached) + " cached, " +
             std::to_string(stats_.done) + " done, " +
             std::to_string(stats_.failed) + " failed, " +
             utils::format_bytes(stats_.bytes_copied) + " copied");
    if (stats_.dry_run > 0) {
        LOG_INFO("Dry run: " + std::to_string(stats_.dry_run) + " files would be copied");
    }
    if (stats_.skipped > 0) {
        LOG_INFO("Skipped before start file: " + std::to_string(stats_.skipped));
    }
    if (stats_.cancelled) {
        LOG_WARN("Run cancelled; partial files will resume on the next run");
    }
}

// ============================================================
// tree_synchronizer.cpp -- Two-pass directory synchronization
// ============================================================

#include "tree_synchronizer.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

TreeSynchronizer::TreeSynchronizer(CompletionLedger& ledger,
                                   TransferEngine& engine,
                                   const CancelToken& cancel)
    : ledger_(ledger)
    , engine_(engine)
    , cancel_(cancel)
{}

SyncStats TreeSynchronizer::synchronize(const std::string& src_root, const std::string& dst_root) {
    DirWalker walker(src_root, dst_root);
    SyncStats stats;
    failed_.clear();
    two_pass_ = true;

    for (CopyMode mode : {CopyMode::NewFilesOnly, CopyMode::AllFiles}) {
        LOG_DEBUG(std::string("Starting pass: ") + to_string(mode));
        run_pass(walker, mode, stats);
        if (cancel_.requested()) {
            stats.cancelled = true;
            break;
        }
    }

    stats.failed = (u32)failed_.size();
    return stats;
}

SyncStats TreeSynchronizer::synchronize_file(const std::string& src_path,
                                             const std::string& dst_path)
{
    SyncStats stats;
    failed_.clear();
    two_pass_ = false;

    FileEntry fe;
    fe.src_path = src_path;
    fe.dst_path = dst_path;
    fe.rel_path = fs::path(src_path).filename().string();

    if (cancel_.requested()) {
        stats.cancelled = true;
        return stats;
    }
    process_file(fe, CopyMode::AllFiles, stats);
    stats.cancelled = cancel_.requested();
    stats.failed = (u32)failed_.size();
    return stats;
}

void TreeSynchronizer::run_pass(const DirWalker& walker, CopyMode mode, SyncStats& stats) {
    bool started = start_file_.empty();

    walker.walk([&](const FileEntry& fe) {
        if (cancel_.requested()) return false;

        if (!started) {
            if (fs::path(fe.rel_path).filename().string() != start_file_) {
                LOG_DEBUG("Skipping before start file: " + fe.rel_path);
                if (mode == CopyMode::AllFiles) ++stats.skipped;
                return true;
            }
            started = true;
        }
        return process_file(fe, mode, stats);
    });

    if (!started) {
        LOG_WARN("Start file not found in " + walker.src_root() + ": " + start_file_);
    }
}

bool TreeSynchronizer::process_file(const FileEntry& fe, CopyMode mode, SyncStats& stats) {
    try {
        if (!fe.stat_error.empty()) {
            throw IoError("Cannot stat " + fe.src_path + ": " + fe.stat_error);
        }

        FileStatus status = ledger_.is_done(fe.src_path, fe.dst_path, mode);
        if (observer_) observer_(fe, mode, status);

        switch (status) {
            case FileStatus::Cached:
                // Pass 2 sees pass-1 copies as cached too; count the first sighting
                if (mode == CopyMode::NewFilesOnly || !two_pass_) {
                    LOG_INFO("File cached: " + fe.rel_path);
                    ++stats.cached;
                }
                return true;
            case FileStatus::Done:
                LOG_INFO("File unchanged since last copy: " + fe.rel_path);
                ++stats.done;
                return true;
            case FileStatus::New:
                LOG_INFO("Copy new file: " + fe.rel_path);
                break;
            case FileStatus::PartiallyCopied:
                if (!needs_transfer(mode, status)) {
                    LOG_DEBUG("Deferred to second pass: " + fe.rel_path);
                    return true;
                }
                LOG_INFO("Check existing file: " + fe.rel_path);
                break;
        }

        CopyResult r = engine_.copy_file(fe.src_path, fe.dst_path);
        stats.bytes_copied += r.bytes_copied;

        switch (r.outcome) {
            case CopyOutcome::AlreadyEqual:
                ++stats.equal;
                break;
            case CopyOutcome::Copied:
                if (status == FileStatus::New) ++stats.copied_new;
                else                           ++stats.resumed;
                break;
            case CopyOutcome::DryRun:
                // A new file is reported by both passes
                if (mode == CopyMode::AllFiles) ++stats.dry_run;
                break;
            case CopyOutcome::Cancelled:
                stats.cancelled = true;
                return false;
        }
    } catch (const std::exception& e) {
        LOG_FILE_ERROR(fe.rel_path + ": " + e.what());
        failed_.insert(fe.src_path);
    }
    return !cancel_.requested();
}

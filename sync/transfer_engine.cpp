// ============================================================
// transfer_engine.cpp -- Resumable single-file copy
// ============================================================

#include "transfer_engine.hpp"
#include "rate_estimator.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

const char* to_string(CopyOutcome outcome) {
    switch (outcome) {
        case CopyOutcome::AlreadyEqual: return "already-equal";
        case CopyOutcome::Copied:       return "copied";
        case CopyOutcome::DryRun:       return "dry-run";
        case CopyOutcome::Cancelled:    return "cancelled";
    }
    return "?";
}

TransferEngine::TransferEngine(CompletionLedger& ledger,
                               const DivergenceLocator& locator,
                               const CancelToken& cancel,
                               TransferOptions opts)
    : ledger_(ledger)
    , locator_(locator)
    , cancel_(cancel)
    , opts_(opts)
{
    if (opts_.chunk_size == 0) opts_.chunk_size = DEFAULT_CHUNK_SIZE;
}

CopyResult TransferEngine::copy_file(const std::string& src_path, const std::string& dst_path) {
    file_io::FileStat src_st = file_io::stat_path(src_path);
    if (!src_st.exists) {
        throw IoError("Source not found: " + src_path);
    }
    if (!src_st.is_regular) {
        throw IoError("Source is not a regular file: " + src_path);
    }
    file_io::FileStat dst_st = file_io::stat_path(dst_path);
    if (dst_st.exists && dst_st.is_dir) {
        throw PathConflictError("Destination is a directory: " + dst_path);
    }

    const std::string name = fs::path(dst_path).filename().string();
    CopyResult result;
    result.total_bytes = src_st.size;

    // ---- Step 1: where to resume ----
    i64 resume = 0;
    if (dst_st.exists) {
        resume = locator_.find_resume_offset(src_path, dst_path, src_st.size, dst_st.size);
    }
    result.resume_offset = resume;

    if (resume == RESUME_NOT_NEEDED) {
        ledger_.mark_done(src_path, dst_path);
        LOG_INFO("Files are equal: " + name);
        result.outcome = CopyOutcome::AlreadyEqual;
        return result;
    }

    if (resume == 0) {
        LOG_INFO("File is new: " + name);
    } else {
        std::ostringstream pct;
        pct << std::setfill('0') << std::setw(2)
            << utils::percent_of((u64)resume, src_st.size);
        LOG_INFO("File is incomplete (" + pct.str() + "%): " + name);
    }

    if (opts_.dry_run) {
        result.outcome = CopyOutcome::DryRun;
        return result;
    }

    // ---- Step 2: stream the remainder ----
    file_io::ensure_parent_dirs(dst_path);

    file_io::MmapReader reader(src_path);
    const u64 total = reader.size();
    result.total_bytes = total;
    if ((u64)resume > total) resume = (i64)total;

    LOG_INFO("Start copying " + name + " from offset " + std::to_string(resume) +
             " of " + std::to_string(total) + " bytes");

    // Resume mode keeps the verified prefix and drops the rest; the file
    // then grows only as chunks land, so a cancelled copy stays a prefix
    file_io::SequentialWriter writer;
    writer.open(dst_path, (u64)resume, resume > 0);

    using clock = std::chrono::steady_clock;
    RateEstimator rate(opts_.rate_window);
    u64 copied = (u64)resume;
    i64 last_percent = -1;
    u64 bytes_since_emit = 0;
    auto window_start = clock::now();

    while (copied < total && !cancel_.requested()) {
        u64 len = reader.chunk_len(copied, opts_.chunk_size);
        writer.write(reader.chunk_ptr(copied), (size_t)len);
        copied += len;
        bytes_since_emit += len;
        result.bytes_copied += len;

        u32 percent = utils::percent_of(copied, total);
        if ((i64)percent == last_percent || cancel_.requested()) continue;

        auto now = clock::now();
        double elapsed = std::chrono::duration<double>(now - window_start).count();
        double sample = elapsed > 0
            ? ((double)bytes_since_emit / utils::BYTES_PER_MB) / elapsed
            : 0.0;
        rate.add(sample);

        ProgressEvent ev;
        ev.percent      = percent;
        ev.rate_mbps    = rate.median();
        ev.copied_bytes = copied;
        ev.total_bytes  = total;
        ev.remaining_s  = ev.rate_mbps > 0
            ? (double)(total - copied) / (ev.rate_mbps * utils::BYTES_PER_MB)
            : std::numeric_limits<double>::infinity();

        last_percent     = percent;
        window_start     = now;
        bytes_since_emit = 0;

        if (on_progress_) on_progress_(ev);
    }

    const bool cancelled = cancel_.requested();
    writer.close();

    if (cancelled) {
        LOG_WARN("Copy of " + name + " interrupted at " + std::to_string(copied) +
                 " of " + std::to_string(total) + " bytes");
        result.outcome = CopyOutcome::Cancelled;
        return result;
    }

    ledger_.mark_done(src_path, dst_path);
    LOG_INFO("File copied successfully: " + name + " (" +
             utils::format_bytes(result.bytes_copied) + " written)");
    result.outcome = CopyOutcome::Copied;
    return result;
}

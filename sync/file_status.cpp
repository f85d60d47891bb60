// ============================================================
// file_status.cpp -- Per-pass file classification
// ============================================================

#include "file_status.hpp"

FileStatus classify_file(CopyMode mode, const FileFacts& facts) {
    if (facts.has_record && facts.recorded_mtime_ns == facts.src_mtime_ns) {
        return FileStatus::Cached;
    }
    if (!facts.dst_exists) {
        return FileStatus::New;
    }
    if (mode == CopyMode::AllFiles &&
        facts.has_record && facts.dst_mtime_ns == facts.recorded_mtime_ns) {
        return FileStatus::Done;
    }
    return FileStatus::PartiallyCopied;
}

bool needs_transfer(CopyMode mode, FileStatus status) {
    switch (status) {
        case FileStatus::New:             return true;
        case FileStatus::PartiallyCopied: return mode == CopyMode::AllFiles;
        case FileStatus::Cached:
        case FileStatus::Done:            return false;
    }
    return false;
}

const char* to_string(CopyMode mode) {
    switch (mode) {
        case CopyMode::NewFilesOnly: return "new-files-only";
        case CopyMode::AllFiles:     return "all-files";
    }
    return "?";
}

const char* to_string(FileStatus status) {
    switch (status) {
        case FileStatus::New:             return "new";
        case FileStatus::Cached:          return "cached";
        case FileStatus::PartiallyCopied: return "partially-copied";
        case FileStatus::Done:            return "done";
    }
    return "?";
}

// ============================================================
// completion_ledger.cpp
// ============================================================

#include "completion_ledger.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static const char* LEDGER_HEADER = "# resumecp completion ledger";
static const char* DIGEST_PREFIX = "# xxh3 ";

CompletionLedger::CompletionLedger(const std::string& path, std::chrono::seconds retention)
    : path_(path), retention_(retention)
{
    load();
}

std::string CompletionLedger::key_for(const std::string& dst_path) {
    std::error_code ec;
    fs::path abs = fs::absolute(dst_path, ec);
    if (ec) abs = fs::path(dst_path);
    return abs.lexically_normal().string();
}

FileStatus CompletionLedger::is_done(const std::string& src_path,
                                     const std::string& dst_path,
                                     CopyMode mode) const
{
    file_io::FileStat src = file_io::stat_path(src_path);
    if (!src.exists) {
        throw IoError("Source vanished: " + src_path);
    }
    file_io::FileStat dst = file_io::stat_path(dst_path);

    FileFacts facts;
    facts.src_mtime_ns = src.mtime_ns;
    facts.dst_exists   = dst.exists;
    facts.dst_mtime_ns = dst.mtime_ns;
    facts.has_record   = lookup(dst_path, facts.recorded_mtime_ns);
    return classify_file(mode, facts);
}

void CompletionLedger::mark_done(const std::string& src_path, const std::string& dst_path) {
    file_io::FileStat src = file_io::stat_path(src_path);
    if (!src.exists) {
        throw IoError("Source vanished: " + src_path);
    }
    // Stamp first: the destination's own mtime must agree with the
    // ledger before the ledger says so.
    file_io::set_mtime(dst_path, src.mtime_ns);

    std::lock_guard<std::mutex> lk(mutex_);
    entries_[key_for(dst_path)] = src.mtime_ns;
    persist_locked();
}

void CompletionLedger::record(const std::string& dst_path, u64 mtime_ns) {
    std::lock_guard<std::mutex> lk(mutex_);
    entries_[key_for(dst_path)] = mtime_ns;
}

bool CompletionLedger::lookup(const std::string& dst_path, u64& mtime_ns) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = entries_.find(key_for(dst_path));
    if (it == entries_.end()) return false;
    mtime_ns = it->second;
    return true;
}

void CompletionLedger::persist() {
    std::lock_guard<std::mutex> lk(mutex_);
    persist_locked();
}

size_t CompletionLedger::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return entries_.size();
}

void CompletionLedger::load() {
    std::ifstream f(path_);
    if (!f) {
        LOG_DEBUG("No ledger at " + path_ + ", starting empty");
        return;
    }

    std::unordered_map<std::string, u64> parsed;
    std::string body;
    std::string line;
    bool have_digest = false;
    u64 digest = 0;
    bool corrupt = false;

    while (std::getline(f, line)) {
        if (have_digest) {
            // Nothing may follow the digest line
            if (!line.empty()) { corrupt = true; break; }
            continue;
        }
        if (line.empty()) continue;
        if (line.rfind(DIGEST_PREFIX, 0) == 0) {
            if (!hash::from_hex(line.substr(std::strlen(DIGEST_PREFIX)), digest)) {
                corrupt = true;
                break;
            }
            have_digest = true;
            continue;
        }
        if (line[0] == '#') continue;

        size_t tab = line.find('\t');
        u64 mtime_ns = 0;
        if (tab == std::string::npos || tab + 1 >= line.size() ||
            !utils::parse_timestamp_ns(line.substr(0, tab), mtime_ns)) {
            corrupt = true;
            break;
        }
        parsed[line.substr(tab + 1)] = mtime_ns;
        body += line;
        body += '\n';
    }

    if (!corrupt && !have_digest) corrupt = true;
    if (!corrupt && hash::xxh3_64(body) != digest) corrupt = true;

    if (corrupt) {
        LOG_WARN("Ledger " + path_ + " is corrupt, starting empty");
        return;
    }

    entries_ = std::move(parsed);
    LOG_DEBUG("Loaded " + std::to_string(entries_.size()) + " ledger entries from " + path_);
}

void CompletionLedger::persist_locked() {
    // Cutoff in whole seconds first; a retention longer than the epoch
    // keeps everything
    const u64 now = utils::now_ns();
    const u64 now_s = now / 1000000000ULL;
    const u64 retention_s = retention_.count() > 0 ? (u64)retention_.count() : 0;
    const u64 cutoff = retention_s < now_s ? now - retention_s * 1000000000ULL : 0;

    std::string body;
    size_t kept = 0;
    for (const auto& [key, mtime_ns] : entries_) {
        if (mtime_ns <= cutoff) continue;
        if (key.find('\n') != std::string::npos) {
            LOG_DEBUG("Ledger: not persisting path with a newline: " + key);
            continue;
        }
        body += utils::format_timestamp_ns(mtime_ns);
        body += '\t';
        body += key;
        body += '\n';
        ++kept;
    }

    std::string text;
    text += LEDGER_HEADER;
    text += "\n";
    text += body;
    text += DIGEST_PREFIX;
    text += hash::to_hex(hash::xxh3_64(body));
    text += "\n";

    // Synced temp file, rename, then sync the directory entry
    file_io::ensure_parent_dirs(path_);
    std::string tmp = path_ + ".tmp";
    file_io::write_file_synced(tmp, text);
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        throw IoError("Cannot replace ledger " + path_ + ": " + platform::last_error_str());
    }
    file_io::sync_parent_dir(path_);
    LOG_DEBUG("Ledger persisted: " + std::to_string(kept) + " entries");
}

// ============================================================
// dir_walker.cpp -- Recursive source tree enumeration
// ============================================================

#include "dir_walker.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

DirWalker::DirWalker(const std::string& src_root, const std::string& dst_root)
    : src_root_(src_root), dst_root_(dst_root) {}

FileEntry DirWalker::make_entry(const std::string& abs_path, const std::string& rel_path) const {
    FileEntry fe;
    fe.src_path = abs_path;
    fe.rel_path = rel_path;
    fe.dst_path = (fs::path(dst_root_) / fs::path(rel_path)).string();

    // One stat for size and mtime
    struct ::stat st{};
    if (::stat(abs_path.c_str(), &st) == 0) {
        fe.file_size = (u64)st.st_size;
        fe.mtime_ns  = (u64)st.st_mtim.tv_sec * 1000000000ULL
                     + (u64)st.st_mtim.tv_nsec;
    } else {
        fe.stat_error = platform::last_error_str();
    }
    return fe;
}

u32 DirWalker::walk(const FileVisitor& visit) const {
    fs::path root(src_root_);
    std::error_code ec;

    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        throw IoError("Cannot enumerate " + src_root_ + ": " + ec.message());
    }

    u32 visited = 0;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const fs::directory_entry& entry = *it;

        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) continue;

        fs::path rel = entry.path().lexically_relative(root);
        if (rel.empty()) continue;

        ++visited;
        if (!visit(make_entry(entry.path().string(), rel.generic_string()))) {
            LOG_DEBUG("Walk of " + src_root_ + " stopped after " +
                      std::to_string(visited) + " files");
            return visited;
        }
    }
    if (ec) {
        throw IoError("Cannot enumerate " + src_root_ + ": " + ec.message());
    }
    return visited;
}

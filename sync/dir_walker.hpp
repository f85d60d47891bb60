#pragma once

// ============================================================
// dir_walker.hpp -- Recursive source tree enumeration
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <functional>

// One regular file found under the source root. Built per pass and
// dropped once the file has been classified and handled.
struct FileEntry {
    std::string rel_path;   // relative to the source root, generic form
    std::string src_path;
    std::string dst_path;   // same relative path under the destination root
    u64  file_size{0};
    u64  mtime_ns{0};
    std::string stat_error; // non-empty when the file could not be stat'ed
};

// Return false to stop the walk
using FileVisitor = std::function<bool(const FileEntry&)>;

class DirWalker {
public:
    DirWalker(const std::string& src_root, const std::string& dst_root);

    // Visit every regular file in directory order (unsorted). Throws
    // IoError if a directory cannot be enumerated. Returns the number
    // of files visited.
    u32 walk(const FileVisitor& visit) const;

    const std::string& src_root() const { return src_root_; }
    const std::string& dst_root() const { return dst_root_; }

private:
    std::string src_root_;
    std::string dst_root_;

    FileEntry make_entry(const std::string& abs_path, const std::string& rel_path) const;
};

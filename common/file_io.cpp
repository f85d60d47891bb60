// ============================================================
// file_io.cpp -- mmap reads, sequential writes, stat helpers
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include <algorithm>
#include <string>
#include <filesystem>

#include <sys/mman.h>
#include <time.h>

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path, Access access) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw IoError("Cannot open file: " + path + ": " + platform::last_error_str());
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw IoError("fstat failed: " + path + ": " + platform::errno_str(err));
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd_);
        fd_ = -1;
        throw IoError("Cannot read a directory as a file: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw IoError("mmap failed: " + path + ": " + platform::errno_str(err));
    }
    if (access == Access::Sequential) {
        madvise(p, (size_t)size_, MADV_SEQUENTIAL);
        madvise(p, std::min((size_t)size_, (size_t)4*1024*1024), MADV_WILLNEED);
    } else {
        madvise(p, (size_t)size_, MADV_RANDOM);
    }
    data_ = static_cast<const char*>(p);
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    size_ = 0;
}

// ============================================================
// SequentialWriter
// ============================================================

SequentialWriter::~SequentialWriter() {
    release();
}

void SequentialWriter::release() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void SequentialWriter::open(const std::string& file_path, u64 offset, bool resume) {
    if (is_open()) release();
    path_   = file_path;
    offset_ = resume ? offset : 0;

    ensure_parent_dirs(file_path);

    // resume=true: open existing without O_TRUNC so the verified prefix is kept
    int flags = resume ? (O_WRONLY | O_CREAT) : (O_WRONLY | O_CREAT | O_TRUNC);
    fd_ = ::open(file_path.c_str(), flags, 0644);
    if (fd_ < 0) {
        throw IoError("Cannot create file: " + file_path + ": " + platform::last_error_str());
    }

    // Bytes past the resume point are unverified; drop them
    if (resume && ftruncate(fd_, (off_t)offset_) != 0) {
        int err = errno;
        release();
        throw IoError("ftruncate failed: " + file_path + ": " + platform::errno_str(err));
    }
}

void SequentialWriter::write(const void* data, size_t len) {
    if (!is_open()) {
        throw IoError("SequentialWriter::write on closed file: " + path_);
    }
    const char* p = static_cast<const char*>(data);
    while (len > 0) {
        ssize_t nw = ::pwrite(fd_, p, len, (off_t)offset_);
        if (nw < 0) {
            if (errno == EINTR) continue;
            throw IoError("pwrite failed: " + path_ + ": " + platform::last_error_str());
        }
        if (nw == 0) {
            throw IoError("pwrite made no progress: " + path_);
        }
        p       += nw;
        len     -= (size_t)nw;
        offset_ += (u64)nw;
    }
}

void SequentialWriter::close() {
    if (!is_open()) return;
    if (fdatasync(fd_) != 0) {
        int err = errno;
        release();
        throw IoError("fdatasync failed: " + path_ + ": " + platform::errno_str(err));
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
        throw IoError("close failed: " + path_ + ": " + platform::last_error_str());
    }
}

// ============================================================
// Utility functions
// ============================================================

FileStat file_io::stat_path(const std::string& path) {
    FileStat fst;
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) return fst;
        throw IoError("stat failed: " + path + ": " + platform::last_error_str());
    }
    fst.exists     = true;
    fst.is_regular = S_ISREG(st.st_mode);
    fst.is_dir     = S_ISDIR(st.st_mode);
    fst.size       = (u64)st.st_size;
    fst.mtime_ns   = (u64)st.st_mtim.tv_sec * 1000000000ULL + (u64)st.st_mtim.tv_nsec;
    return fst;
}

void file_io::set_mtime(const std::string& path, u64 mtime_ns) {
    struct timespec ts[2];
    // Leave atime alone; stamp mtime only
    ts[0].tv_sec  = 0;
    ts[0].tv_nsec = UTIME_OMIT;
    ts[1].tv_sec  = (time_t)(mtime_ns / 1000000000ULL);
    ts[1].tv_nsec = (long)(mtime_ns % 1000000000ULL);
    if (utimensat(AT_FDCWD, path.c_str(), ts, 0) != 0) {
        throw IoError("Cannot set modification time: " + path + ": " +
                      platform::last_error_str());
    }
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw IoError("Cannot create directory " + parent.string() + ": " + ec.message());
        }
    }
}

void file_io::write_file_synced(const std::string& path, const std::string& content) {
    SequentialWriter w;
    w.open(path, 0, false);
    w.write(content.data(), content.size());
    w.close();
}

void file_io::sync_parent_dir(const std::string& path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) parent = ".";
    int fd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        throw IoError("Cannot open directory " + parent.string() + ": " +
                      platform::last_error_str());
    }
    int rc = fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        throw IoError("fsync failed: " + parent.string() + ": " + platform::errno_str(err));
    }
}

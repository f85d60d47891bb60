#pragma once

// ============================================================
// errors.hpp -- Exception types raised by resumecp
// ============================================================

#include <stdexcept>
#include <string>

// A file could not be opened, stat'ed, mapped, written or time-stamped.
class IoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A path exists with the wrong type (directory where a file is needed,
// or a regular file where a directory is needed).
class PathConflictError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Structural problem detected before any copy starts.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

#pragma once

// ============================================================
// divergence_locator.hpp -- Find where an interrupted copy resumes
//
// An interrupted copy leaves a destination whose prefix matches the
// source and whose tail is garbage (usually the zeros of a
// preallocated file). Instead of reading both files end to end, the
// locator compares a handful of blocks:
//
//   1. the trailing block of the common length; if it matches, the
//      destination is complete (equal sizes) or a clean prefix
//      (unequal sizes);
//   2. otherwise a binary search over [0, common length) whose lower
//      bound only advances past blocks that compare equal.
//
// The answer is block-granular and conservative: a few bytes before
// the first real difference may be copied again. The search trusts
// that everything after a differing block differs too, which holds
// for truncated or zero-padded writes but not for arbitrary edits.
// ============================================================

#include "../common/platform.hpp"
#include "sync_config.hpp"
#include <string>

namespace file_io { class MmapReader; }

class DivergenceLocator {
public:
    explicit DivergenceLocator(u64 block_size = DEFAULT_BLOCK_SIZE);

    // Offset at which copying src onto dst should resume, or
    // RESUME_NOT_NEEDED (-1) when dst already equals src.
    // Both files must exist and be readable; IoError otherwise.
    i64 find_resume_offset(const std::string& src_path,
                           const std::string& dst_path,
                           u64 src_size,
                           u64 dst_size) const;

    // Same search over already-open readers
    i64 find_resume_offset(const file_io::MmapReader& src,
                           const file_io::MmapReader& dst,
                           u64 src_size,
                           u64 dst_size) const;

    u64 block_size() const { return block_size_; }

private:
    u64 block_size_;
};

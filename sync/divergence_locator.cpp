// ============================================================
// divergence_locator.cpp
// ============================================================

#include "divergence_locator.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <cstring>

using file_io::MmapReader;

// Compare up to `len` bytes at `offset`. Reads are clamped at each
// file's end, so a short read on one side counts as a difference.
static bool blocks_differ(const MmapReader& a, const MmapReader& b, u64 offset, u64 len) {
    u64 la = a.chunk_len(offset, len);
    u64 lb = b.chunk_len(offset, len);
    if (la != lb) return true;
    if (la == 0) return false;
    return std::memcmp(a.chunk_ptr(offset), b.chunk_ptr(offset), (size_t)la) != 0;
}

DivergenceLocator::DivergenceLocator(u64 block_size)
    : block_size_(block_size == 0 ? 1 : block_size) {}

i64 DivergenceLocator::find_resume_offset(const std::string& src_path,
                                          const std::string& dst_path,
                                          u64 src_size,
                                          u64 dst_size) const
{
    MmapReader src(src_path, file_io::Access::Random);
    MmapReader dst(dst_path, file_io::Access::Random);
    return find_resume_offset(src, dst, src_size, dst_size);
}

i64 DivergenceLocator::find_resume_offset(const MmapReader& src,
                                          const MmapReader& dst,
                                          u64 src_size,
                                          u64 dst_size) const
{
    const bool same_size = src_size == dst_size;
    const u64 common = std::min(src_size, dst_size);

    if (common == 0) {
        // Two empty files are equal; otherwise nothing is reusable
        return same_size ? RESUME_NOT_NEEDED : 0;
    }

    const u64 block = std::min(block_size_, common);

    if (!blocks_differ(src, dst, common - block, block)) {
        if (same_size) return RESUME_NOT_NEEDED;
        // Truncated destination resumes at its end; an over-long one
        // gets cut back to the source length by the writer.
        LOG_DEBUG("Size mismatch with matching tail, resume at " + std::to_string(common));
        return (i64)common;
    }

    // Invariant: [0, start) is accepted, the block at `end` differs
    // (or `end` is the common length).
    u64 start = 0;
    u64 end   = common;
    u32 probes = 0;
    while (start + 1 < end) {
        u64 mid = start + (end - start) / 2;
        if (blocks_differ(src, dst, mid, block)) {
            end = mid;
        } else {
            start = mid;
        }
        ++probes;
    }

    LOG_DEBUG("Divergence search: " + std::to_string(probes) + " probes, resume at " +
              std::to_string(start));
    return (i64)start;
}

#include <gtest/gtest.h>
#include "sync/divergence_locator.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"

class DivergenceLocatorTest : public ::testing::Test {
protected:
    TempDir tmp;

    i64 locate(const std::string& src, const std::string& dst, u64 block) {
        write_file(tmp.str("src"), src);
        write_file(tmp.str("dst"), dst);
        DivergenceLocator loc(block);
        return loc.find_resume_offset(tmp.str("src"), tmp.str("dst"), src.size(), dst.size());
    }
};

TEST_F(DivergenceLocatorTest, OffsetForEachCorruptionPointWithBlockOfTwo) {
    const std::string src = "0123456789";
    // Index = number of leading bytes the destination gets right
    const i64 expected[] = {0, 0, 0, 1, 2, 3, 4, 5, 6, 7, -1};

    for (size_t good = 0; good <= src.size(); ++good) {
        SCOPED_TRACE("good bytes: " + std::to_string(good));
        std::string dst = src;
        for (size_t i = good; i < dst.size(); ++i) dst[i] = 'x';
        EXPECT_EQ(locate(src, dst, 2), expected[good]);
    }
}

TEST_F(DivergenceLocatorTest, SameLengthFileWithMatchingLastBlockCountsAsEqual) {
    // Only the last block is probed before the search; a difference
    // earlier in an otherwise matching file goes unnoticed
    EXPECT_EQ(locate("0123456789", "0123x56789", 2), RESUME_NOT_NEEDED);
}

TEST_F(DivergenceLocatorTest, IdenticalFilesNeedNoResume) {
    const std::string data = pattern_bytes(5000);
    EXPECT_EQ(locate(data, data, 1024), RESUME_NOT_NEEDED);
    EXPECT_EQ(locate(data, data, 3), RESUME_NOT_NEEDED);
    EXPECT_EQ(locate("a", "a", 1024), RESUME_NOT_NEEDED);
}

TEST_F(DivergenceLocatorTest, EmptyFiles) {
    EXPECT_EQ(locate("", "", 1024), RESUME_NOT_NEEDED);
    EXPECT_EQ(locate("", "abc", 1024), 0);
    EXPECT_EQ(locate("abc", "", 1024), 0);
}

TEST_F(DivergenceLocatorTest, TruncatedDestinationResumesAtItsEnd) {
    EXPECT_EQ(locate("0123456789", "0123", 2), 4);
    EXPECT_EQ(locate("0123456789", "0123", 1024), 4);
}

TEST_F(DivergenceLocatorTest, LongerDestinationWithMatchingPrefix) {
    EXPECT_EQ(locate("0123", "0123456789", 2), 4);
    EXPECT_EQ(locate("0123456789", "0123456789ab", 1024), 10);
}

TEST_F(DivergenceLocatorTest, TruncatedAndCorruptedDestinationStartsOver) {
    EXPECT_EQ(locate("0123456789", "01x3", 1024), 0);
}

TEST_F(DivergenceLocatorTest, PrefixOfSourceWithZeroRunsResumesAtItsEnd) {
    const std::string src = zero_run_bytes(64 * 1024, 20000, 30000, 4096);
    for (size_t k : {0u, 1000u, 20000u, 25000u, 30000u, 60000u, 62000u, 65535u}) {
        SCOPED_TRACE("prefix " + std::to_string(k));
        EXPECT_EQ(locate(src, src.substr(0, k), 1024), (i64)k);
    }
}

TEST_F(DivergenceLocatorTest, ZeroBlockSizeIsTreatedAsOne) {
    DivergenceLocator loc(0);
    EXPECT_EQ(loc.block_size(), 1u);
    EXPECT_EQ(locate("0123456789", "01234567xy", 0), 7);
}

TEST_F(DivergenceLocatorTest, MissingFileThrows) {
    DivergenceLocator loc;
    write_file(tmp.str("src"), "abc");
    EXPECT_THROW(loc.find_resume_offset(tmp.str("src"), tmp.str("nope"), 3, 3), IoError);
}

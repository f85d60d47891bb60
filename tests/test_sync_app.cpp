#include <gtest/gtest.h>
#include "app/sync_app.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"

class SyncAppTest : public ::testing::Test {
protected:
    TempDir tmp;

    SyncConfig config(const std::string& src, const std::string& dst) const {
        SyncConfig cfg;
        cfg.src_path    = src;
        cfg.dst_path    = dst;
        cfg.ledger_path = tmp.str("state/ledger");
        return cfg;
    }
};

TEST_F(SyncAppTest, FileIntoExistingDirectoryKeepsItsName) {
    write_file(tmp.str("in/report.csv"), "a,b\n");
    fs::create_directories(tmp.str("out"));

    SyncPlan plan = SyncApp::resolve_paths(tmp.str("in/report.csv"), tmp.str("out"));
    EXPECT_TRUE(plan.single_file);
    EXPECT_EQ(plan.dst, (fs::path(tmp.str("out")) / "report.csv").string());
}

TEST_F(SyncAppTest, FileIntoPathWithTrailingSlash) {
    write_file(tmp.str("in/report.csv"), "a,b\n");

    SyncPlan plan = SyncApp::resolve_paths(tmp.str("in/report.csv"), tmp.str("newdir") + "/");
    EXPECT_TRUE(plan.single_file);
    EXPECT_EQ(fs::path(plan.dst).filename().string(), "report.csv");
}

TEST_F(SyncAppTest, FileToExplicitPath) {
    write_file(tmp.str("in/report.csv"), "a,b\n");

    SyncPlan plan = SyncApp::resolve_paths(tmp.str("in/report.csv"), tmp.str("copy.csv"));
    EXPECT_TRUE(plan.single_file);
    EXPECT_EQ(plan.dst, tmp.str("copy.csv"));
}

TEST_F(SyncAppTest, DirectoryOntoFileIsAConflict) {
    fs::create_directories(tmp.str("in"));
    write_file(tmp.str("blocker"), "x");
    EXPECT_THROW(SyncApp::resolve_paths(tmp.str("in"), tmp.str("blocker")), PathConflictError);
}

TEST_F(SyncAppTest, DirectoryToMissingDestination) {
    fs::create_directories(tmp.str("in"));
    SyncPlan plan = SyncApp::resolve_paths(tmp.str("in"), tmp.str("out"));
    EXPECT_FALSE(plan.single_file);
    EXPECT_EQ(plan.dst, tmp.str("out"));
}

TEST_F(SyncAppTest, MissingSourceIsAUsageError) {
    EXPECT_THROW(SyncApp::resolve_paths(tmp.str("nope"), tmp.str("out")), UsageError);
}

TEST_F(SyncAppTest, RunSynchronizesTree) {
    write_file(tmp.str("in/a"), "alpha");
    write_file(tmp.str("in/sub/b"), pattern_bytes(5000));

    SyncApp app(config(tmp.str("in"), tmp.str("out")));
    EXPECT_EQ(app.run(), 0);
    EXPECT_EQ(app.stats().copied_new, 2u);
    EXPECT_EQ(read_file(tmp.str("out/a")), "alpha");
    EXPECT_EQ(read_file(tmp.str("out/sub/b")), pattern_bytes(5000));
    EXPECT_TRUE(fs::exists(tmp.str("state/ledger")));

    SyncApp again(config(tmp.str("in"), tmp.str("out")));
    EXPECT_EQ(again.run(), 0);
    EXPECT_EQ(again.stats().cached, 2u);
    EXPECT_EQ(again.stats().bytes_copied, 0u);
}

TEST_F(SyncAppTest, RunReportsStructuralErrors) {
    fs::create_directories(tmp.str("in"));
    write_file(tmp.str("blocker"), "x");

    SyncApp conflict(config(tmp.str("in"), tmp.str("blocker")));
    EXPECT_EQ(conflict.run(), 1);

    SyncApp missing(config(tmp.str("nope"), tmp.str("out")));
    EXPECT_EQ(missing.run(), 1);
}

TEST_F(SyncAppTest, StopBeforeRunCopiesNothing) {
    write_file(tmp.str("in/a"), "alpha");

    SyncApp app(config(tmp.str("in"), tmp.str("out")));
    app.stop();
    EXPECT_EQ(app.run(), 0);
    EXPECT_TRUE(app.stats().cancelled);
    EXPECT_FALSE(fs::exists(tmp.str("out/a")));
}

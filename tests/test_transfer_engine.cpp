#include <gtest/gtest.h>
#include "sync/transfer_engine.hpp"
#include "common/errors.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <sys/stat.h>
#include <vector>

class TransferEngineTest : public ::testing::Test {
protected:
    TempDir tmp;
    CancelToken cancel;
    std::unique_ptr<CompletionLedger>  ledger;
    std::unique_ptr<DivergenceLocator> locator;
    std::unique_ptr<TransferEngine>    engine;

    void SetUp() override {
        make_engine(TransferOptions{}, DEFAULT_BLOCK_SIZE);
    }

    void make_engine(TransferOptions opts, u64 block) {
        engine.reset();
        ledger  = std::make_unique<CompletionLedger>(tmp.str("ledger"));
        locator = std::make_unique<DivergenceLocator>(block);
        engine  = std::make_unique<TransferEngine>(*ledger, *locator, cancel, opts);
    }

    static TransferOptions small_chunks(bool dry_run = false) {
        TransferOptions o;
        o.chunk_size = MIN_CHUNK_SIZE;
        o.dry_run    = dry_run;
        return o;
    }

    bool in_ledger(const std::string& dst) {
        u64 mtime = 0;
        return ledger->lookup(dst, mtime);
    }
};

TEST_F(TransferEngineTest, FreshCopyCreatesParentsAndMarksDone) {
    const std::string src = tmp.str("src/data.bin");
    const std::string dst = tmp.str("out/nested/dir/data.bin");
    const std::string data = pattern_bytes(100 * 1024 + 17);
    write_file(src, data);

    CopyResult r = engine->copy_file(src, dst);

    EXPECT_EQ(r.outcome, CopyOutcome::Copied);
    EXPECT_EQ(r.resume_offset, 0);
    EXPECT_EQ(r.bytes_copied, data.size());
    EXPECT_EQ(read_file(dst), data);
    EXPECT_EQ(mtime_of(dst), mtime_of(src));
    EXPECT_TRUE(in_ledger(dst));
}

TEST_F(TransferEngineTest, TruncatedDestinationGetsOnlyTheMissingBytes) {
    const std::string src = tmp.str("B");
    const std::string dst = tmp.str("out/B");
    write_file(src, "0123456789");
    write_file(dst, "0123");

    CopyResult r = engine->copy_file(src, dst);

    EXPECT_EQ(r.outcome, CopyOutcome::Copied);
    EXPECT_EQ(r.resume_offset, 4);
    EXPECT_EQ(r.bytes_copied, 6u);
    EXPECT_EQ(read_file(dst), "0123456789");
    EXPECT_TRUE(in_ledger(dst));
}

TEST_F(TransferEngineTest, EveryTruncationPointEndsIdentical) {
    make_engine(TransferOptions{}, 8);
    const std::string data = pattern_bytes(64);
    const std::string src = tmp.str("src");
    const std::string dst = tmp.str("dst");
    write_file(src, data);

    for (size_t k = 0; k <= data.size(); ++k) {
        SCOPED_TRACE("prefix " + std::to_string(k));
        write_file(dst, data.substr(0, k));
        CopyResult r = engine->copy_file(src, dst);
        EXPECT_EQ(read_file(dst), data);
        EXPECT_LE(r.bytes_copied, data.size());
        if (k == data.size()) EXPECT_EQ(r.outcome, CopyOutcome::AlreadyEqual);
    }
}

TEST_F(TransferEngineTest, EqualDestinationIsMarkedWithoutWriting) {
    const std::string src = tmp.str("A");
    const std::string dst = tmp.str("out/A");
    write_file(src, "0123456789");
    write_file(dst, "0123456789");

    CopyResult r = engine->copy_file(src, dst);

    EXPECT_EQ(r.outcome, CopyOutcome::AlreadyEqual);
    EXPECT_EQ(r.resume_offset, RESUME_NOT_NEEDED);
    EXPECT_EQ(r.bytes_copied, 0u);
    EXPECT_TRUE(in_ledger(dst));
    EXPECT_EQ(mtime_of(dst), mtime_of(src));
}

TEST_F(TransferEngineTest, LongerDestinationIsCutBack) {
    const std::string src = tmp.str("src");
    const std::string dst = tmp.str("dst");
    write_file(src, "0123456789");
    write_file(dst, "0123456789trailing");

    CopyResult r = engine->copy_file(src, dst);

    EXPECT_EQ(r.outcome, CopyOutcome::Copied);
    EXPECT_EQ(r.bytes_copied, 0u);
    EXPECT_EQ(read_file(dst), "0123456789");
}

TEST_F(TransferEngineTest, EmptySourceCreatesEmptyDestination) {
    const std::string src = tmp.str("empty");
    const std::string dst = tmp.str("out/empty");
    write_file(src, "");

    CopyResult r = engine->copy_file(src, dst);

    EXPECT_EQ(r.outcome, CopyOutcome::Copied);
    EXPECT_TRUE(fs::exists(dst));
    EXPECT_EQ(fs::file_size(dst), 0u);
    EXPECT_TRUE(in_ledger(dst));
}

TEST_F(TransferEngineTest, DryRunLeavesDestinationAlone) {
    make_engine(small_chunks(true), DEFAULT_BLOCK_SIZE);
    const std::string src = tmp.str("src");
    write_file(src, "0123456789");

    CopyResult fresh = engine->copy_file(src, tmp.str("out/new"));
    EXPECT_EQ(fresh.outcome, CopyOutcome::DryRun);
    EXPECT_FALSE(fs::exists(tmp.str("out")));

    write_file(tmp.str("partial"), "0123");
    CopyResult partial = engine->copy_file(src, tmp.str("partial"));
    EXPECT_EQ(partial.outcome, CopyOutcome::DryRun);
    EXPECT_EQ(partial.resume_offset, 4);
    EXPECT_EQ(read_file(tmp.str("partial")), "0123");
    EXPECT_EQ(ledger->size(), 0u);
}

TEST_F(TransferEngineTest, ProgressClimbsToOneHundred) {
    make_engine(small_chunks(), DEFAULT_BLOCK_SIZE);
    const std::string src = tmp.str("src");
    const std::string data = pattern_bytes(1024 * 1024);
    write_file(src, data);

    std::vector<ProgressEvent> events;
    engine->set_progress_callback([&](const ProgressEvent& ev) { events.push_back(ev); });
    engine->copy_file(src, tmp.str("dst"));

    ASSERT_FALSE(events.empty());
    // 256 chunks, but one event per percent at most
    EXPECT_LE(events.size(), 101u);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GT(events[i].percent, events[i - 1].percent);
        EXPECT_GE(events[i].copied_bytes, events[i - 1].copied_bytes);
    }
    EXPECT_EQ(events.back().percent, 100u);
    EXPECT_EQ(events.back().copied_bytes, data.size());
    EXPECT_EQ(events.back().total_bytes, data.size());
    for (const auto& ev : events) EXPECT_GE(ev.rate_mbps, 0.0);
}

TEST_F(TransferEngineTest, CancelledCopyResumesOnTheNextRun) {
    make_engine(small_chunks(), DEFAULT_BLOCK_SIZE);
    const std::string src = tmp.str("src");
    const std::string dst = tmp.str("dst");
    const std::string data = pattern_bytes(400 * 1024);
    write_file(src, data);

    engine->set_progress_callback([&](const ProgressEvent&) { cancel.cancel(); });
    CopyResult first = engine->copy_file(src, dst);

    EXPECT_EQ(first.outcome, CopyOutcome::Cancelled);
    EXPECT_LT(first.bytes_copied, data.size());
    // Only the written bytes are on disk
    EXPECT_EQ(fs::file_size(dst), first.bytes_copied);
    EXPECT_FALSE(in_ledger(dst));

    cancel.reset();
    engine->set_progress_callback(nullptr);
    CopyResult second = engine->copy_file(src, dst);

    EXPECT_EQ(second.outcome, CopyOutcome::Copied);
    EXPECT_EQ(second.resume_offset, (i64)first.bytes_copied);
    EXPECT_EQ(second.bytes_copied, data.size() - first.bytes_copied);
    EXPECT_EQ(read_file(dst), data);
    EXPECT_TRUE(in_ledger(dst));
}

TEST_F(TransferEngineTest, CancelledCopyOfZeroTailedSourceIsNotTakenAsEqual) {
    make_engine(small_chunks(), DEFAULT_BLOCK_SIZE);
    const std::string src = tmp.str("image.bin");
    const std::string dst = tmp.str("out/image.bin");
    const std::string data = zero_run_bytes(404 * 1024, 0, 0, 4096);
    write_file(src, data);

    engine->set_progress_callback([&](const ProgressEvent&) { cancel.cancel(); });
    CopyResult first = engine->copy_file(src, dst);
    ASSERT_EQ(first.outcome, CopyOutcome::Cancelled);
    EXPECT_EQ(fs::file_size(dst), first.bytes_copied);

    cancel.reset();
    engine->set_progress_callback(nullptr);
    CopyResult second = engine->copy_file(src, dst);

    EXPECT_EQ(second.outcome, CopyOutcome::Copied);
    EXPECT_EQ(second.resume_offset, (i64)first.bytes_copied);
    EXPECT_EQ(read_file(dst), data);
    EXPECT_TRUE(in_ledger(dst));
}

TEST_F(TransferEngineTest, CancelAroundZeroRunResumesWithoutHoles) {
    make_engine(small_chunks(), DEFAULT_BLOCK_SIZE);
    const std::string src = tmp.str("src");
    const std::string data = zero_run_bytes(1024 * 1024, 200 * 1024, 300 * 1024, 0);
    write_file(src, data);

    // Before the zero run, inside it, and after it
    for (u64 cut : {45056ULL, 250ULL * 1024, 600ULL * 1024}) {
        SCOPED_TRACE("cancel after " + std::to_string(cut));
        const std::string dst = tmp.str("dst_" + std::to_string(cut));

        cancel.reset();
        engine->set_progress_callback([&](const ProgressEvent& ev) {
            if (ev.copied_bytes >= cut) cancel.cancel();
        });
        CopyResult first = engine->copy_file(src, dst);
        ASSERT_EQ(first.outcome, CopyOutcome::Cancelled);
        EXPECT_GE(first.bytes_copied, cut);
        EXPECT_EQ(fs::file_size(dst), first.bytes_copied);
        EXPECT_FALSE(in_ledger(dst));

        cancel.reset();
        engine->set_progress_callback(nullptr);
        CopyResult second = engine->copy_file(src, dst);

        EXPECT_EQ(second.outcome, CopyOutcome::Copied);
        EXPECT_EQ(second.resume_offset, (i64)first.bytes_copied);
        EXPECT_EQ(second.bytes_copied, data.size() - first.bytes_copied);
        EXPECT_EQ(read_file(dst), data);
    }
}

TEST_F(TransferEngineTest, EveryTruncationPointOfZeroRunSourceResumesExactly) {
    make_engine(TransferOptions{}, 8);
    const std::string data = zero_run_bytes(64, 16, 32, 8);
    const std::string src = tmp.str("src");
    const std::string dst = tmp.str("dst");
    write_file(src, data);

    for (size_t k = 0; k < data.size(); ++k) {
        SCOPED_TRACE("prefix " + std::to_string(k));
        write_file(dst, data.substr(0, k));
        CopyResult r = engine->copy_file(src, dst);
        EXPECT_EQ(r.outcome, CopyOutcome::Copied);
        EXPECT_EQ(r.resume_offset, (i64)k);
        EXPECT_EQ(r.bytes_copied, data.size() - k);
        EXPECT_EQ(read_file(dst), data);
    }
}

TEST_F(TransferEngineTest, DirectoryDestinationIsAConflict) {
    write_file(tmp.str("src"), "abc");
    fs::create_directories(tmp.str("dst"));
    EXPECT_THROW(engine->copy_file(tmp.str("src"), tmp.str("dst")), PathConflictError);
}

TEST_F(TransferEngineTest, MissingSourceIsAnIoError) {
    EXPECT_THROW(engine->copy_file(tmp.str("nope"), tmp.str("dst")), IoError);
    fs::create_directories(tmp.str("dir"));
    EXPECT_THROW(engine->copy_file(tmp.str("dir"), tmp.str("dst")), IoError);
    EXPECT_FALSE(fs::exists(tmp.str("dst")));
}

TEST_F(TransferEngineTest, DanglingSymlinkSourceIsAnIoError) {
    fs::create_symlink(tmp.str("gone"), tmp.str("link"));
    EXPECT_THROW(engine->copy_file(tmp.str("link"), tmp.str("dst")), IoError);
    EXPECT_FALSE(fs::exists(tmp.str("dst")));
    EXPECT_EQ(ledger->size(), 0u);
}

TEST_F(TransferEngineTest, FifoSourceIsAnIoError) {
    ASSERT_EQ(::mkfifo(tmp.str("pipe").c_str(), 0600), 0);
    EXPECT_THROW(engine->copy_file(tmp.str("pipe"), tmp.str("dst")), IoError);
    EXPECT_FALSE(fs::exists(tmp.str("dst")));
}

// =============================================================================
// Progress persistence and ProgressTracker state machine tests
// =============================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include "ingest/file_progress_store.hpp"
#include "ingest/progress_tracker.hpp"
#include "ingest/redis_progress_store.hpp"
#include "test_util.hpp"

using namespace mdingest;

namespace {

ChunkProgress entry(const ByteRange& r, ChunkStatus status, int attempts = 0) {
    ChunkProgress p;
    p.chunk_id = r.id();
    p.range = r;
    p.status = status;
    p.attempts = attempts;
    return p;
}

// Every write fails, e.g. a full disk
class FailingProgressStore : public ProgressStore {
public:
    bool load(const std::string&, std::vector<ChunkProgress>& out) override {
        out.clear();
        return true;
    }
    bool reset(const std::string&, const std::vector<ChunkProgress>&) override { return false; }
    bool save(const ChunkProgress&) override { return false; }
    [[nodiscard]] const char* name() const override { return "failing"; }
};

const std::vector<ByteRange> CHUNKS = {{0, 100}, {100, 250}, {250, 400}};

} // namespace

class FileProgressStoreTest : public ::testing::Test {
protected:
    test::TempDir dir_;
};

TEST_F(FileProgressStoreTest, LastEntryPerChunkWins) {
    std::string path = dir_.file("bank.md.progress.jsonl");
    {
        FileProgressStore store(path);
        ASSERT_TRUE(store.reset("run-1", {entry(CHUNKS[0], ChunkStatus::PENDING),
                                          entry(CHUNKS[1], ChunkStatus::PENDING)}));
        ASSERT_TRUE(store.save(entry(CHUNKS[0], ChunkStatus::IN_FLIGHT, 1)));
        ASSERT_TRUE(store.save(entry(CHUNKS[0], ChunkStatus::DONE, 1)));
        ASSERT_TRUE(store.save(entry(CHUNKS[1], ChunkStatus::FAILED, 3)));
    }

    FileProgressStore store(path);
    std::vector<ChunkProgress> loaded;
    ASSERT_TRUE(store.load("run-1", loaded));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].chunk_id, "0-100");
    EXPECT_EQ(loaded[0].status, ChunkStatus::DONE);
    EXPECT_EQ(loaded[1].status, ChunkStatus::FAILED);
    EXPECT_EQ(loaded[1].attempts, 3);
}

TEST_F(FileProgressStoreTest, TornLastLineIsIgnored) {
    std::string path = dir_.file("progress.jsonl");
    {
        FileProgressStore store(path);
        ASSERT_TRUE(store.reset("run-1", {entry(CHUNKS[0], ChunkStatus::PENDING)}));
        ASSERT_TRUE(store.save(entry(CHUNKS[0], ChunkStatus::DONE, 1)));
    }
    {
        std::ofstream f(path, std::ios::app);
        f << R"({"chunk_id": "100-250", "range": {"sta)";
    }

    FileProgressStore store(path);
    std::vector<ChunkProgress> loaded;
    ASSERT_TRUE(store.load("run-1", loaded));
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].status, ChunkStatus::DONE);
}

TEST_F(FileProgressStoreTest, OtherRunIsDiscarded) {
    std::string path = dir_.file("progress.jsonl");
    {
        FileProgressStore store(path);
        ASSERT_TRUE(store.reset("run-1", {entry(CHUNKS[0], ChunkStatus::DONE, 1)}));
    }

    FileProgressStore store(path);
    std::vector<ChunkProgress> loaded;
    ASSERT_TRUE(store.load("run-2", loaded));
    EXPECT_TRUE(loaded.empty());
}

TEST_F(FileProgressStoreTest, MissingFileIsEmpty) {
    FileProgressStore store(dir_.file("nothing.jsonl"));
    std::vector<ChunkProgress> loaded;
    ASSERT_TRUE(store.load("run-1", loaded));
    EXPECT_TRUE(loaded.empty());
}

TEST_F(FileProgressStoreTest, SaveBeforeResetFails) {
    FileProgressStore store(dir_.file("progress.jsonl"));
    EXPECT_FALSE(store.save(entry(CHUNKS[0], ChunkStatus::DONE)));
}

TEST_F(FileProgressStoreTest, ResetCompactsLog) {
    std::string path = dir_.file("progress.jsonl");
    FileProgressStore store(path);
    ASSERT_TRUE(store.reset("run-1", {entry(CHUNKS[0], ChunkStatus::PENDING)}));
    for (int i = 0; i < 20; ++i) store.save(entry(CHUNKS[0], ChunkStatus::IN_FLIGHT, i));
    ASSERT_TRUE(store.reset("run-1", {entry(CHUNKS[0], ChunkStatus::DONE, 20)}));

    std::string content = test::read_file(path);
    EXPECT_EQ(std::count(content.begin(), content.end(), '\n'), 2);
}

class ProgressTrackerTest : public ::testing::Test {
protected:
    test::TempDir dir_;
    std::string path() const { return dir_.file("progress.jsonl"); }
};

TEST_F(ProgressTrackerTest, TransitionsCountAttempts) {
    FileProgressStore store(path());
    ProgressTracker tracker(store);
    EXPECT_EQ(tracker.begin_run("run-1", CHUNKS, true), 0u);

    tracker.mark_in_flight(CHUNKS[0]);
    tracker.mark_failed(CHUNKS[0], "short read");
    tracker.mark_in_flight(CHUNKS[0]);
    tracker.mark_done(CHUNKS[0]);

    EXPECT_EQ(tracker.status("0-100"), ChunkStatus::DONE);
    EXPECT_EQ(tracker.attempts("0-100"), 2);
    EXPECT_EQ(tracker.status("100-250"), ChunkStatus::PENDING);
    EXPECT_EQ(tracker.persist_errors(), 0);
}

TEST_F(ProgressTrackerTest, DoneIsTerminal) {
    NullProgressStore store;
    ProgressTracker tracker(store);
    tracker.begin_run("run-1", CHUNKS, false);

    tracker.mark_in_flight(CHUNKS[1]);
    tracker.mark_done(CHUNKS[1]);
    tracker.mark_failed(CHUNKS[1], "late failure");
    tracker.mark_in_flight(CHUNKS[1]);

    EXPECT_TRUE(tracker.is_done("100-250"));
    EXPECT_EQ(tracker.attempts("100-250"), 1);
}

TEST_F(ProgressTrackerTest, ResumeSkipsDoneAndRetriesTheRest) {
    {
        FileProgressStore store(path());
        ProgressTracker tracker(store);
        tracker.begin_run("run-1", CHUNKS, true);
        tracker.mark_in_flight(CHUNKS[0]);
        tracker.mark_done(CHUNKS[0]);
        tracker.mark_in_flight(CHUNKS[1]);
        tracker.mark_failed(CHUNKS[1], "parse error");
        tracker.mark_in_flight(CHUNKS[2]);      // Interrupted mid-chunk
    }

    FileProgressStore store(path());
    ProgressTracker tracker(store);
    EXPECT_EQ(tracker.begin_run("run-1", CHUNKS, true), 1u);

    EXPECT_TRUE(tracker.is_done("0-100"));
    EXPECT_EQ(tracker.status("100-250"), ChunkStatus::PENDING);
    EXPECT_EQ(tracker.attempts("100-250"), 0);
    EXPECT_EQ(tracker.status("250-400"), ChunkStatus::PENDING);

    // The compacted log reflects the new run
    std::vector<ChunkProgress> saved;
    FileProgressStore reader(path());
    ASSERT_TRUE(reader.load("run-1", saved));
    ASSERT_EQ(saved.size(), 3u);
    EXPECT_EQ(saved[0].status, ChunkStatus::DONE);
    EXPECT_EQ(saved[1].status, ChunkStatus::PENDING);
}

TEST_F(ProgressTrackerTest, NoResumeStartsOver) {
    {
        FileProgressStore store(path());
        ProgressTracker tracker(store);
        tracker.begin_run("run-1", CHUNKS, true);
        tracker.mark_done(CHUNKS[0]);
    }

    FileProgressStore store(path());
    ProgressTracker tracker(store);
    EXPECT_EQ(tracker.begin_run("run-1", CHUNKS, false), 0u);
    EXPECT_FALSE(tracker.is_done("0-100"));
}

TEST_F(ProgressTrackerTest, ChangedChunkingDiscardsProgress) {
    {
        FileProgressStore store(path());
        ProgressTracker tracker(store);
        tracker.begin_run("run-1", CHUNKS, true);
        tracker.mark_done(CHUNKS[0]);
    }

    FileProgressStore store(path());
    ProgressTracker tracker(store);
    EXPECT_EQ(tracker.begin_run("run-2", CHUNKS, true), 0u);
}

TEST_F(ProgressTrackerTest, PersistenceErrorsAreCountedNotFatal) {
    FailingProgressStore store;
    ProgressTracker tracker(store);
    tracker.begin_run("run-1", CHUNKS, true);
    tracker.mark_in_flight(CHUNKS[0]);
    tracker.mark_done(CHUNKS[0]);

    EXPECT_TRUE(tracker.is_done("0-100"));
    EXPECT_EQ(tracker.persist_errors(), 3);
}

TEST(RunKeyTest, BindsFileAndChunking) {
    std::string k = ProgressTracker::make_run_key("/data/bank.md", 1000, 42, 512, 100);
    EXPECT_EQ(k, ProgressTracker::make_run_key("/data/bank.md", 1000, 42, 512, 100));
    EXPECT_NE(k, ProgressTracker::make_run_key("/data/bank.md", 1001, 42, 512, 100));
    EXPECT_NE(k, ProgressTracker::make_run_key("/data/bank.md", 1000, 43, 512, 100));
    EXPECT_NE(k, ProgressTracker::make_run_key("/data/bank.md", 1000, 42, 1024, 100));
    EXPECT_NE(k, ProgressTracker::make_run_key("/data/bank.md", 1000, 42, 512, 200));
}

// Needs a live server: MDINGEST_TEST_REDIS_HOST=localhost
TEST(RedisProgressStoreTest, RoundTripAgainstServer) {
    const char* host = std::getenv("MDINGEST_TEST_REDIS_HOST");
    if (!host) GTEST_SKIP() << "MDINGEST_TEST_REDIS_HOST not set";
#ifndef MDINGEST_HAS_HIREDIS
    GTEST_SKIP() << "built without hiredis";
#endif

    RedisProgressStore store("md-ingest-test:progress:");
    ASSERT_TRUE(store.connect(host, 6379, ""));
    ASSERT_TRUE(store.reset("run-1", {entry(CHUNKS[0], ChunkStatus::PENDING)}));
    ASSERT_TRUE(store.save(entry(CHUNKS[0], ChunkStatus::DONE, 1)));

    std::vector<ChunkProgress> loaded;
    ASSERT_TRUE(store.load("run-1", loaded));
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].status, ChunkStatus::DONE);

    ASSERT_TRUE(store.load("run-2", loaded));
    EXPECT_TRUE(loaded.empty());
}

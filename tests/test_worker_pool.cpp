// =============================================================================
// WorkerPool, BlockingQueue and WorkerParser retry tests
// =============================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include "ingest/errors.hpp"
#include "ingest/worker_parser.hpp"
#include "ingest/worker_pool.hpp"
#include "utils/blocking_queue.hpp"
#include "test_util.hpp"

using namespace mdingest;

TEST(BlockingQueueTest, PopDrainsThenReportsClosed) {
    BlockingQueue<int> q;
    EXPECT_TRUE(q.push(1));
    EXPECT_TRUE(q.push(2));
    q.close();
    EXPECT_FALSE(q.push(3));

    EXPECT_EQ(q.pop(), 1);
    EXPECT_EQ(q.pop(), 2);
    EXPECT_EQ(q.pop(), std::nullopt);
}

TEST(BlockingQueueTest, BoundedPushWaitsForConsumer) {
    BlockingQueue<int> q(1);
    ASSERT_TRUE(q.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        q.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(q.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(q.pop(), 2);
}

TEST(WorkerPoolTest, RunsEveryTaskOnSeveralThreads) {
    std::atomic<int> done{0};
    std::mutex mutex;
    std::set<std::thread::id> threads;

    {
        WorkerPool pool(4, 2);
        EXPECT_EQ(pool.size(), 4u);
        for (int i = 0; i < 200; ++i) {
            ASSERT_TRUE(pool.submit([&] {
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                std::lock_guard<std::mutex> lock(mutex);
                threads.insert(std::this_thread::get_id());
                ++done;
            }));
        }
        pool.shutdown();
    }

    EXPECT_EQ(done.load(), 200);
    EXPECT_GT(threads.size(), 1u);
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotKillWorker) {
    std::atomic<int> done{0};
    WorkerPool pool(1, 4);
    pool.submit([] { throw std::runtime_error("boom"); });
    pool.submit([&] { ++done; });
    pool.shutdown();
    EXPECT_EQ(done.load(), 1);
}

TEST(WorkerPoolTest, SubmitAfterShutdownFails) {
    WorkerPool pool(2, 2);
    pool.shutdown();
    EXPECT_FALSE(pool.submit([] {}));
}

namespace {

// Fails the first `failures` reads, then serves a fixed text
class FlakyReader : public RangeReader {
public:
    FlakyReader(int failures, std::string text) : failures_(failures), text_(std::move(text)) {}

    std::string read(const std::string&, const ByteRange&) const override {
        if (calls_.fetch_add(1) < failures_) throw IoError("transient read failure");
        return text_;
    }

    int calls() const { return calls_.load(); }

private:
    int failures_;
    std::string text_;
    mutable std::atomic<int> calls_{0};
};

} // namespace

TEST(WorkerParserTest, RetriesTransientFailure) {
    FlakyReader reader(1, "1. Question one?\nAnswer: yes\n");
    MarkdownQuestionParser parser;
    WorkerParser worker(reader, parser, 2, 1);

    std::vector<int> attempts;
    ChunkOutcome out = worker.run("bank.md", ByteRange{0, 29},
                                  [&](int n) { attempts.push_back(n); });

    EXPECT_TRUE(out.ok);
    EXPECT_EQ(out.attempts, 2);
    EXPECT_EQ(attempts, (std::vector<int>{1, 2}));
    ASSERT_EQ(out.records.size(), 1u);
    EXPECT_EQ(out.records[0].content, "Question one?");
    EXPECT_TRUE(out.error.empty());
}

TEST(WorkerParserTest, GivesUpAfterRetryLimit) {
    FlakyReader reader(100, "");
    MarkdownQuestionParser parser;
    WorkerParser worker(reader, parser, 2, 1);

    ChunkOutcome out = worker.run("bank.md", ByteRange{0, 10});

    EXPECT_FALSE(out.ok);
    EXPECT_EQ(out.attempts, 3);
    EXPECT_EQ(reader.calls(), 3);
    EXPECT_NE(out.error.find("transient read failure"), std::string::npos);
}

TEST(WorkerParserTest, ParseErrorIsReported) {
    FlakyReader reader(0, "1. bad \xFF byte\n");
    MarkdownQuestionParser parser;
    WorkerParser worker(reader, parser, 0, 1);

    ChunkOutcome out = worker.run("bank.md", ByteRange{0, 16});
    EXPECT_FALSE(out.ok);
    EXPECT_EQ(out.attempts, 1);
    EXPECT_NE(out.error.find("UTF-8"), std::string::npos);
}

TEST(WorkerParserTest, BackoffDoublesAndCaps) {
    EXPECT_EQ(WorkerParser::backoff_ms(100, 1), 100);
    EXPECT_EQ(WorkerParser::backoff_ms(100, 2), 200);
    EXPECT_EQ(WorkerParser::backoff_ms(100, 3), 400);
    EXPECT_EQ(WorkerParser::backoff_ms(100, 20), WorkerParser::MAX_BACKOFF_MS);
    EXPECT_EQ(WorkerParser::backoff_ms(0, 3), 0);
}

TEST(FileRangeReaderTest, ReadsExactRange) {
    test::TempDir dir;
    auto path = dir.write("bank.md", "0123456789");

    FileRangeReader reader;
    EXPECT_EQ(reader.read(path, ByteRange{2, 6}), "2345");
    EXPECT_THROW(reader.read(path, ByteRange{8, 20}), IoError);
    EXPECT_THROW(reader.read(dir.file("missing.md"), ByteRange{0, 1}), IoError);
}

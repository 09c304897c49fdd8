// =============================================================================
// End-to-end ingestion tests: Coordinator over the in-memory store
// =============================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <set>
#include "ingest/bank_generator.hpp"
#include "ingest/coordinator.hpp"
#include "ingest/errors.hpp"
#include "ingest/file_chunker.hpp"
#include "ingest/file_progress_store.hpp"
#include "store/memory_store.hpp"
#include "test_util.hpp"

using namespace mdingest;

namespace {

IngestConfig make_config(uint64_t chunk_size) {
    IngestConfig cfg;
    cfg.chunk_size_bytes = chunk_size;
    cfg.max_boundary_search_bytes = 4096;
    cfg.workers = 3;
    cfg.queue_depth = 2;
    cfg.batch_size = 16;
    cfg.retry_limit = 1;
    cfg.retry_backoff_ms = 1;
    cfg.store.system = StoreSystem::MEMORY;
    cfg.progress.backend = ProgressBackend::NONE;
    return cfg;
}

// Counts reads; fails every read of one chunk
class ScriptedReader : public RangeReader {
public:
    explicit ScriptedReader(uint64_t fail_start = UINT64_MAX) : fail_start_(fail_start) {}

    std::string read(const std::string& path, const ByteRange& range) const override {
        reads_.fetch_add(1);
        if (range.start == fail_start_) throw IoError("injected read failure");
        return file_.read(path, range);
    }

    int reads() const { return reads_.load(); }

private:
    uint64_t fail_start_;
    FileRangeReader file_;
    mutable std::atomic<int> reads_{0};
};

// The first bulk write fails as a whole, e.g. a dropped connection
class FailingFirstBatchStore : public MemoryStore {
public:
    BulkWriteResult insert_questions(const std::vector<FinalizedQuestionRecord>& batch) override {
        if (bulk_calls_++ == 0) {
            BulkWriteResult r;
            r.error = "server closed the connection unexpectedly";
            return r;
        }
        return MemoryStore::insert_questions(batch);
    }

private:
    int bulk_calls_ = 0;
};

// Every entity lookup fails, so no question can be resolved
class EntityOutageStore : public MemoryStore {
public:
    LookupResult find_entity(EntityKind, const std::string&) override {
        LookupResult r;
        r.error = "relation \"options\" does not exist";
        return r;
    }
};

std::string generated_bank(size_t questions) {
    BankConfig cfg;
    cfg.num_questions = questions;
    cfg.rule_every = 25;
    BankGenerator gen(cfg);
    return gen.generate_text();
}

} // namespace

class CoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override { store_.connect(StoreConnection{}); }

    ProcessingResult run(const IngestConfig& cfg, const std::string& path,
                         ProgressStore& progress, const RangeReader& reader) {
        Coordinator coordinator(cfg, store_, store_, progress, parser_, reader);
        return coordinator.process(path);
    }

    test::TempDir dir_;
    MemoryStore store_;
    MarkdownQuestionParser parser_;
    NullProgressStore no_progress_;
    FileRangeReader file_reader_;
};

TEST_F(CoordinatorTest, SmallBankSingleChunk) {
    auto path = dir_.write("bank.md",
        "1. What is 2+2?\nA. 3\nB. 4\nAnswer: B\n\n"
        "2. The earth is flat. True or false?\nAnswer: False\n\n"
        "3. Water is H__O, fill in: ____\nAnswer: 2\n");

    ProcessingResult r = run(make_config(1024 * 1024), path, no_progress_, file_reader_);

    EXPECT_EQ(r.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(r.chunks_total, 1u);
    EXPECT_EQ(r.chunks_processed, 1u);
    EXPECT_EQ(r.questions_parsed, 3);
    EXPECT_EQ(r.questions_written, 3);
    EXPECT_TRUE(r.chunks_failed.empty());
    EXPECT_EQ(store_.count(collection::QUESTIONS), 3);
    EXPECT_EQ(store_.count(collection::OPTIONS), 2);

    auto qs = store_.questions();
    ASSERT_EQ(qs.size(), 3u);
    EXPECT_EQ(qs[0].question_type, question_type::MULTIPLE_CHOICE);
    EXPECT_EQ(qs[1].question_type, question_type::TRUE_FALSE);
    EXPECT_EQ(qs[2].question_type, question_type::FILL_IN_BLANK);
    EXPECT_EQ(qs[0].position, 0u);
    EXPECT_EQ(qs[2].position, 2u);
}

TEST_F(CoordinatorTest, SharedOptionStoredOnce) {
    auto path = dir_.write("bank.md",
        "1. Capital of France?\nA. Paris\nB. Rome\nAnswer: A\n\n"
        "2. City of the Eiffel tower?\nA. Berlin\nB. Paris\nAnswer: B\n");

    ProcessingResult r = run(make_config(1024 * 1024), path, no_progress_, file_reader_);
    ASSERT_EQ(r.questions_written, 2);

    auto options = store_.entities(EntityKind::OPTION);
    EXPECT_EQ(options.size(), 3u);
    std::string paris_id;
    for (const auto& o : options) {
        if (o.payload == "Paris") paris_id = o.id;
    }
    ASSERT_FALSE(paris_id.empty());

    auto qs = store_.questions();
    ASSERT_EQ(qs.size(), 2u);
    EXPECT_EQ(qs[0].option_ids[0], paris_id);
    EXPECT_EQ(qs[1].option_ids[1], paris_id);
    EXPECT_EQ(r.dedup_stats["option"]["cache_hits"], 1);
}

TEST_F(CoordinatorTest, FailedChunkDoesNotStopOthers) {
    std::string content = generated_bank(60);
    auto path = dir_.write("bank.md", content);
    IngestConfig cfg = make_config(1024);

    FileChunker chunker(cfg.max_boundary_search_bytes);
    auto chunks = chunker.create_chunks(path, cfg.chunk_size_bytes);
    ASSERT_GT(chunks.size(), 2u);

    ScriptedReader reader(chunks[1].start);
    ProcessingResult r = run(cfg, path, no_progress_, reader);

    EXPECT_EQ(r.status, RunStatus::SUCCEEDED_WITH_CAVEATS);
    ASSERT_EQ(r.chunks_failed.size(), 1u);
    EXPECT_EQ(r.chunks_failed[0].range, chunks[1]);
    EXPECT_EQ(r.chunks_failed[0].attempts, 2);
    EXPECT_NE(r.chunks_failed[0].error.find("injected"), std::string::npos);

    EXPECT_EQ(r.chunks_processed, chunks.size() - 1);
    EXPECT_GT(r.questions_written, 0);
    EXPECT_LT(r.questions_written, 60);
    EXPECT_EQ(r.questions_written, r.questions_parsed);
}

TEST_F(CoordinatorTest, EveryChunkFailingFailsTheRun) {
    auto path = dir_.write("bank.md", "1. Only question?\nAnswer: yes\n");
    ScriptedReader reader(0);

    ProcessingResult r = run(make_config(1024), path, no_progress_, reader);
    EXPECT_EQ(r.status, RunStatus::FAILED);
    EXPECT_EQ(r.chunks_failed.size(), 1u);
    EXPECT_EQ(store_.count(collection::QUESTIONS), 0);
}

TEST_F(CoordinatorTest, MissingFileFailsTheRun) {
    ProcessingResult r = run(make_config(1024), dir_.file("missing.md"), no_progress_,
                             file_reader_);
    EXPECT_EQ(r.status, RunStatus::FAILED);
    EXPECT_FALSE(r.error.empty());
}

TEST_F(CoordinatorTest, EmptyFileSucceedsWithNothing) {
    auto path = dir_.write("empty.md", "");
    ProcessingResult r = run(make_config(1024), path, no_progress_, file_reader_);
    EXPECT_EQ(r.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(r.chunks_total, 0u);
    EXPECT_EQ(r.questions_written, 0);
}

TEST_F(CoordinatorTest, GeneratedBankIsIngestedCompletely) {
    constexpr size_t QUESTIONS = 1500;
    auto path = dir_.write("bank.md", generated_bank(QUESTIONS));
    IngestConfig cfg = make_config(8192);
    cfg.batch_size = 100;

    ProcessingResult r = run(cfg, path, no_progress_, file_reader_);

    EXPECT_EQ(r.status, RunStatus::SUCCEEDED);
    EXPECT_GT(r.chunks_total, 10u);
    EXPECT_EQ(r.chunks_processed, r.chunks_total);
    EXPECT_EQ(r.questions_parsed, static_cast<int64_t>(QUESTIONS));
    EXPECT_EQ(r.questions_written, static_cast<int64_t>(QUESTIONS));
    EXPECT_TRUE(r.write_failures.empty());
    EXPECT_TRUE(r.chunking_warnings.empty());

    auto qs = store_.questions();
    ASSERT_EQ(qs.size(), QUESTIONS);
    size_t multiple_choice = 0;
    std::set<std::string> ids;
    for (const auto& q : qs) {
        EXPECT_FALSE(q.content.empty());
        ids.insert(q.id);
        if (q.question_type == question_type::MULTIPLE_CHOICE) {
            ++multiple_choice;
            EXPECT_EQ(q.option_ids.size(), 4u);
        }
    }
    EXPECT_EQ(ids.size(), QUESTIONS);
    EXPECT_EQ(multiple_choice, QUESTIONS / 4);

    // Shared pools deduplicate across chunks
    EXPECT_LE(store_.count(collection::OPTIONS), 200);
    EXPECT_LE(store_.count(collection::IMAGES), 20);
    EXPECT_LE(store_.count(collection::FORMULAS), 50 + static_cast<int64_t>(QUESTIONS / 4));
}

TEST_F(CoordinatorTest, ResumeProcessesOnlyUnfinishedChunks) {
    auto path = dir_.write("bank.md", generated_bank(80));
    IngestConfig cfg = make_config(1024);
    cfg.progress.backend = ProgressBackend::FILE;
    const std::string progress_path = cfg.progress_path_for(path);

    FileChunker chunker(cfg.max_boundary_search_bytes);
    auto chunks = chunker.create_chunks(path, cfg.chunk_size_bytes);
    ASSERT_GT(chunks.size(), 3u);

    {
        FileProgressStore progress(progress_path);
        ScriptedReader reader(chunks[2].start);
        ProcessingResult first = run(cfg, path, progress, reader);
        ASSERT_EQ(first.chunks_failed.size(), 1u);
        ASSERT_LT(store_.count(collection::QUESTIONS), 80);
    }

    FileProgressStore progress(progress_path);
    ScriptedReader reader;
    ProcessingResult second = run(cfg, path, progress, reader);

    EXPECT_EQ(second.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(reader.reads(), 1);
    EXPECT_EQ(second.chunks_skipped, chunks.size() - 1);
    EXPECT_EQ(second.chunks_processed, 1u);
    EXPECT_EQ(second.questions_duplicate, 0);
    EXPECT_EQ(store_.count(collection::QUESTIONS), 80);

    // A third run has nothing left to do
    FileProgressStore progress3(progress_path);
    ScriptedReader reader3;
    ProcessingResult third = run(cfg, path, progress3, reader3);
    EXPECT_EQ(reader3.reads(), 0);
    EXPECT_EQ(third.chunks_skipped, chunks.size());
    EXPECT_EQ(third.questions_written, 0);
}

TEST_F(CoordinatorTest, RerunWithoutResumeIsIdempotent) {
    auto path = dir_.write("bank.md", generated_bank(50));
    IngestConfig cfg = make_config(1024);

    ProcessingResult first = run(cfg, path, no_progress_, file_reader_);
    ASSERT_EQ(first.questions_written, 50);

    cfg.resume = false;
    ProcessingResult second = run(cfg, path, no_progress_, file_reader_);
    EXPECT_EQ(second.questions_written, 0);
    EXPECT_EQ(second.questions_duplicate, 50);
    EXPECT_EQ(store_.count(collection::QUESTIONS), 50);
    EXPECT_EQ(second.dedup_stats["option"]["inserts"], 0);
}

TEST_F(CoordinatorTest, EditedQuestionOfSameSizeIsWrittenAgain) {
    const std::string before = "1. Capital of France?\nAnswer: Paris\n";
    const std::string after  = "1. Capital of Franxe?\nAnswer: Paris\n";
    ASSERT_EQ(before.size(), after.size());

    auto path = dir_.write("bank.md", before);
    IngestConfig cfg = make_config(1024);
    cfg.resume = false;

    ProcessingResult first = run(cfg, path, no_progress_, file_reader_);
    ASSERT_EQ(first.questions_written, 1);

    dir_.write("bank.md", after);
    ProcessingResult second = run(cfg, path, no_progress_, file_reader_);
    EXPECT_EQ(second.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(second.questions_parsed, 1);
    EXPECT_EQ(second.questions_written, 1);
    EXPECT_EQ(second.questions_duplicate, 0);

    auto qs = store_.questions();
    ASSERT_EQ(qs.size(), 2u);
    EXPECT_EQ(qs[0].content, "Capital of France?");
    EXPECT_EQ(qs[1].content, "Capital of Franxe?");
    EXPECT_NE(qs[0].id, qs[1].id);
}

TEST_F(CoordinatorTest, ChunkWithFailedBatchIsRetriedOnResume) {
    auto path = dir_.write("bank.md", "1. Q one?\nAnswer: a\n\n2. Q two?\nAnswer: b\n");
    IngestConfig cfg = make_config(1024 * 1024);
    cfg.progress.backend = ProgressBackend::FILE;
    const std::string progress_path = cfg.progress_path_for(path);

    FailingFirstBatchStore store;
    store.connect(StoreConnection{});

    {
        FileProgressStore progress(progress_path);
        Coordinator coordinator(cfg, store, store, progress, parser_, file_reader_);
        ProcessingResult first = coordinator.process(path);

        EXPECT_EQ(first.status, RunStatus::FAILED);
        EXPECT_EQ(first.questions_written, 0);
        EXPECT_EQ(first.write_failures.size(), 2u);
        EXPECT_EQ(first.chunks_processed, 0u);
        ASSERT_EQ(first.chunks_failed.size(), 1u);
        EXPECT_NE(first.chunks_failed[0].error.find("2 question"), std::string::npos);
    }

    FileProgressStore progress(progress_path);
    ScriptedReader reader;
    Coordinator coordinator(cfg, store, store, progress, parser_, reader);
    ProcessingResult second = coordinator.process(path);

    EXPECT_EQ(second.status, RunStatus::SUCCEEDED);
    EXPECT_EQ(second.chunks_skipped, 0u);
    EXPECT_EQ(reader.reads(), 1);
    EXPECT_EQ(second.chunks_processed, 1u);
    EXPECT_EQ(second.questions_written, 2);
    EXPECT_EQ(store.count(collection::QUESTIONS), 2);
}

TEST_F(CoordinatorTest, UnresolvedRecordsKeepChunkOpen) {
    auto path = dir_.write("bank.md", "1. Pick one\nA. left\nB. right\nAnswer: A\n");
    IngestConfig cfg = make_config(1024 * 1024);
    cfg.progress.backend = ProgressBackend::FILE;

    EntityOutageStore store;
    store.connect(StoreConnection{});
    FileProgressStore progress(cfg.progress_path_for(path));
    Coordinator coordinator(cfg, store, store, progress, parser_, file_reader_);
    ProcessingResult r = coordinator.process(path);

    EXPECT_EQ(r.questions_written, 0);
    ASSERT_EQ(r.write_failures.size(), 1u);
    ASSERT_EQ(r.chunks_failed.size(), 1u);
    EXPECT_EQ(r.chunks_processed, 0u);

    // Last entry of the progress log: the chunk is failed, not done
    std::string log = test::read_file(cfg.progress_path_for(path));
    ASSERT_FALSE(log.empty());
    log.pop_back();
    auto last = nlohmann::json::parse(log.substr(log.rfind('\n') + 1));
    EXPECT_EQ(last["status"], "failed");
}

TEST_F(CoordinatorTest, CancelledRunLeavesChunksPending) {
    auto path = dir_.write("bank.md", generated_bank(40));
    IngestConfig cfg = make_config(1024);

    Coordinator coordinator(cfg, store_, store_, no_progress_, parser_, file_reader_);
    coordinator.cancel();
    ProcessingResult r = coordinator.process(path);

    EXPECT_TRUE(r.cancelled);
    EXPECT_EQ(r.status, RunStatus::SUCCEEDED_WITH_CAVEATS);
    EXPECT_EQ(r.chunks_pending, r.chunks_total);
    EXPECT_EQ(r.questions_written, 0);
}

TEST_F(CoordinatorTest, ReportJsonCarriesCounts) {
    auto path = dir_.write("bank.md", "1. Q?\nAnswer: a\n\n2. R?\nAnswer: b\n");
    ProcessingResult r = run(make_config(1024), path, no_progress_, file_reader_);

    auto j = r.to_json();
    EXPECT_EQ(j["status"], "succeeded");
    EXPECT_EQ(j["questions"]["written"], 2);
    EXPECT_EQ(j["chunks"]["total"], 1);
    EXPECT_TRUE(j["failed_chunks"].empty());
    EXPECT_TRUE(j.contains("dedup"));
}

#include "coordinator.hpp"
#include "batch_writer.hpp"
#include "content_key.hpp"
#include "deduplicator.hpp"
#include "errors.hpp"
#include "progress_tracker.hpp"
#include "worker_pool.hpp"
#include "../utils/blocking_queue.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"
#include <chrono>
#include <deque>
#include <filesystem>

namespace mdingest {
namespace fs = std::filesystem;

double ProcessingResult::throughput_mb_s() const {
    double sec = elapsed_sec();
    return sec > 0.0 ? static_cast<double>(file_size) / (1024.0 * 1024.0) / sec : 0.0;
}

double ProcessingResult::questions_per_sec() const {
    double sec = elapsed_sec();
    return sec > 0.0 ? static_cast<double>(questions_written) / sec : 0.0;
}

nlohmann::json ProcessingResult::to_json() const {
    return nlohmann::json{
        {"file", file_path},
        {"file_size", file_size},
        {"status", run_status_str(status)},
        {"error", error},
        {"cancelled", cancelled},
        {"questions", {
            {"parsed", questions_parsed},
            {"written", questions_written},
            {"already_present", questions_duplicate},
            {"write_failures", write_failures.size()}
        }},
        {"chunks", {
            {"total", chunks_total},
            {"processed", chunks_processed},
            {"skipped", chunks_skipped},
            {"pending", chunks_pending},
            {"failed", chunks_failed.size()}
        }},
        {"failed_chunks", chunks_failed},
        {"write_failures", write_failures},
        {"chunking_warnings", chunking_warnings},
        {"dedup", dedup_stats},
        {"progress_errors", progress_errors},
        {"timing", {
            {"elapsed_ms", elapsed_ns / 1000000},
            {"read_ms", read_ns / 1000000},
            {"parse_ms", parse_ns / 1000000},
            {"write_ms", write_ns / 1000000},
            {"write_batches", write_batches},
            {"throughput_mb_s", throughput_mb_s()},
            {"questions_per_sec", questions_per_sec()}
        }}
    };
}

Coordinator::Coordinator(IngestConfig config, DocumentStore& entity_store,
                         DocumentStore& question_store, ProgressStore& progress_store,
                         const QuestionParser& parser, const RangeReader& reader)
    : config_(std::move(config)),
      entity_store_(entity_store),
      question_store_(question_store),
      progress_store_(progress_store),
      parser_(parser),
      reader_(reader) {}

namespace {

// Chunk whose records sit in the BatchWriter until last_seq is durable
struct AwaitingChunk {
    ByteRange range;
    uint64_t last_seq = 0;
    size_t unresolved = 0;      // Records dropped by a StoreError
};

FinalizedQuestionRecord finalize(RawQuestionRecord& raw, const std::string& source,
                                 const ByteRange& range, uint32_t position,
                                 const std::string& record_hash, Deduplicator& dedup) {
    FinalizedQuestionRecord q;
    q.id = question_id(source, range, position, record_hash);
    q.chunk_id = range.id();
    q.position = position;
    q.content_hash = text_digest(raw.content);
    q.question_type = raw.question_type;

    // Resolution may throw StoreError; nothing is moved out of raw before that
    for (const auto& opt : raw.options)
        q.option_ids.push_back(dedup.get_or_create(EntityKind::OPTION, opt));
    for (const auto& img : raw.images)
        q.image_ids.push_back(dedup.get_or_create(EntityKind::IMAGE, img.url, img.alt));
    for (const auto& f : raw.formulas)
        q.formula_ids.push_back(dedup.get_or_create(EntityKind::FORMULA, f));

    q.content = std::move(raw.content);
    q.answer = std::move(raw.answer);
    q.explanation = std::move(raw.explanation);
    return q;
}

} // namespace

ProcessingResult Coordinator::process(const std::string& file_path) {
    ProcessingResult result;
    result.file_path = file_path;

    Timer timer;
    timer.start();

    auto fail = [&](const std::string& error) {
        LOG_ERR("[coordinator] %s", error.c_str());
        result.error = error;
        result.status = RunStatus::FAILED;
        timer.stop();
        result.elapsed_ns = timer.elapsed_ns();
        return result;
    };

    if (!entity_store_.ensure_connected(2, 500) || !question_store_.ensure_connected(2, 500))
        return fail(std::string("store ") + entity_store_.system_name() + " is not reachable");

    // --- Chunking ---
    std::vector<ByteRange> chunks;
    std::string canonical;
    int64_t mtime = 0;
    try {
        FileChunker chunker(config_.max_boundary_search_bytes);
        chunks = chunker.create_chunks(file_path, config_.chunk_size_bytes);
        result.chunking_warnings = chunker.warnings();

        std::error_code ec;
        canonical = fs::weakly_canonical(file_path, ec).string();
        if (ec) canonical = file_path;
        result.file_size = fs::file_size(file_path, ec);
        auto wt = fs::last_write_time(file_path, ec);
        if (!ec) mtime = static_cast<int64_t>(wt.time_since_epoch().count());
    } catch (const IngestError& e) {
        return fail(e.what());
    } catch (const std::invalid_argument& e) {
        return fail(e.what());
    }
    result.chunks_total = chunks.size();

    // --- Resume ---
    ProgressTracker tracker(progress_store_);
    const std::string run_key = ProgressTracker::make_run_key(
        canonical, result.file_size, mtime,
        config_.chunk_size_bytes, config_.max_boundary_search_bytes);
    result.chunks_skipped = tracker.begin_run(run_key, chunks, config_.resume);

    std::vector<ByteRange> todo;
    for (const auto& c : chunks) {
        if (!tracker.is_done(c.id())) todo.push_back(c);
    }

    const std::string source = source_key(canonical, result.file_size);
    const size_t workers = config_.effective_workers();
    const size_t queue_depth = config_.effective_queue_depth();
    const size_t max_in_flight = workers + queue_depth;

    LOG_INF("[coordinator] %s: %zu chunks (%zu to process, %zu done earlier), "
            "%zu workers, queue depth %zu, batch size %zu",
        file_path.c_str(), chunks.size(), todo.size(), result.chunks_skipped,
        workers, queue_depth, config_.batch_size);

    Deduplicator dedup(entity_store_, config_.dedup_cache_entries);
    BatchWriter writer(question_store_, config_.batch_size);
    WorkerParser worker(reader_, parser_, config_.retry_limit, config_.retry_backoff_ms);
    BlockingQueue<ChunkOutcome> outcomes;
    std::deque<AwaitingChunk> awaiting;

    // A chunk with any unwritten record is marked failed so a resumed run
    // reads it again; records already written then count as already present.
    auto finish_chunk = [&](const ByteRange& range, size_t unresolved) {
        size_t lost = unresolved + writer.failures_in(range.id());
        if (lost == 0) {
            tracker.mark_done(range);
            ++result.chunks_processed;
            return;
        }
        std::string reason = std::to_string(lost) + " question(s) not written";
        LOG_WRN("[coordinator] Chunk %s left for a later run: %s",
            range.id().c_str(), reason.c_str());
        tracker.mark_failed(range, reason);
        result.chunks_failed.push_back({range, tracker.attempts(range.id()), reason});
    };

    auto complete_durable = [&] {
        uint64_t durable = writer.durable_sequence();
        while (!awaiting.empty() && awaiting.front().last_seq <= durable) {
            finish_chunk(awaiting.front().range, awaiting.front().unresolved);
            awaiting.pop_front();
        }
    };

    // Declared last: its destructor joins workers that push into `outcomes`
    WorkerPool pool(workers, queue_depth);

    size_t next = 0;
    size_t in_flight = 0;
    size_t dispatched = 0;
    auto last_report = std::chrono::steady_clock::now();

    for (;;) {
        while (!cancelled() && next < todo.size() && in_flight < max_in_flight) {
            ByteRange range = todo[next++];
            bool queued = pool.submit([&, range] {
                outcomes.push(worker.run(file_path, range,
                    [&tracker, range](int) { tracker.mark_in_flight(range); }));
            });
            if (!queued) {
                LOG_ERR("[coordinator] Worker pool closed, chunk %s left pending",
                    range.id().c_str());
                break;
            }
            ++in_flight;
            ++dispatched;
        }
        if (in_flight == 0) break;

        auto outcome = outcomes.pop();
        if (!outcome) break;
        --in_flight;

        result.read_ns += outcome->read_ns;
        result.parse_ns += outcome->parse_ns;

        const ByteRange& range = outcome->range;
        if (!outcome->ok) {
            tracker.mark_failed(range, outcome->error);
            result.chunks_failed.push_back({range, outcome->attempts, outcome->error});
        } else {
            result.questions_parsed += static_cast<int64_t>(outcome->records.size());
            uint64_t last_seq = 0;
            size_t unresolved = 0;
            uint32_t position = 0;
            for (auto& raw : outcome->records) {
                uint32_t pos = position++;
                const std::string record_hash = record_digest(raw);
                try {
                    last_seq = writer.add(finalize(raw, source, range, pos, record_hash, dedup));
                } catch (const StoreError& e) {
                    ++unresolved;
                    WriteFailure f{question_id(source, range, pos, record_hash), range.id(),
                                   text_digest(raw.content), e.what()};
                    LOG_WRN("[coordinator] Question %s (chunk %s) not written: %s",
                        f.record_id.c_str(), f.chunk_id.c_str(), f.reason.c_str());
                    result.write_failures.push_back(std::move(f));
                }
            }
            if (last_seq == 0) {
                finish_chunk(range, unresolved);
            } else {
                awaiting.push_back({range, last_seq, unresolved});
            }
        }
        complete_durable();

        auto now = std::chrono::steady_clock::now();
        if (now - last_report >= std::chrono::seconds(5)) {
            last_report = now;
            LOG_INF("[coordinator] Progress: %zu/%zu chunks done, %zu failed, "
                    "%lld questions parsed, %lld written",
                result.chunks_processed + result.chunks_skipped, chunks.size(),
                result.chunks_failed.size(),
                static_cast<long long>(result.questions_parsed),
                static_cast<long long>(writer.written()));
        }
    }

    writer.flush();
    complete_durable();
    pool.shutdown();

    if (cancelled()) {
        result.cancelled = true;
        result.chunks_pending = todo.size() - dispatched;
        LOG_WRN("[coordinator] Cancelled: %zu chunks left pending for a later run",
            result.chunks_pending);
    }

    result.questions_written = writer.written();
    result.questions_duplicate = writer.duplicates();
    result.write_ns = writer.write_ns();
    result.write_batches = writer.batches();
    for (auto& f : writer.failures()) result.write_failures.push_back(std::move(f));
    result.dedup_stats = dedup.stats_json();
    result.progress_errors = tracker.persist_errors();

    timer.stop();
    result.elapsed_ns = timer.elapsed_ns();

    if (dispatched > 0 && result.chunks_failed.size() == dispatched) {
        result.status = RunStatus::FAILED;
        result.error = "every attempted chunk failed";
    } else if (!result.chunks_failed.empty() || !result.write_failures.empty() ||
               !result.chunking_warnings.empty() || result.progress_errors > 0 ||
               result.cancelled) {
        result.status = RunStatus::SUCCEEDED_WITH_CAVEATS;
    } else {
        result.status = RunStatus::SUCCEEDED;
    }

    LOG_INF("[coordinator] %s: %lld questions written, %lld already present, "
            "%zu chunks failed, %zu write failures (%.1f s, %.1f MB/s)",
        run_status_str(result.status), static_cast<long long>(result.questions_written),
        static_cast<long long>(result.questions_duplicate), result.chunks_failed.size(),
        result.write_failures.size(), result.elapsed_sec(), result.throughput_mb_s());
    return result;
}

} // namespace mdingest

#pragma once
// =============================================================================
// Coordinator -- drives one ingestion run.
//
//   FileChunker -> ProgressTracker (skip done) -> WorkerPool (read + parse)
//     -> outcome queue -> Deduplicator -> BatchWriter -> mark chunks done
//
// The coordinator thread is the only one resolving sub-entities and adding to
// the BatchWriter. A chunk is done once the writer's durable sequence covers
// the last record it produced and none of its records failed; otherwise it is
// failed and a resumed run reads it again.
// =============================================================================

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../config.hpp"
#include "file_chunker.hpp"
#include "progress_store.hpp"
#include "question_parser.hpp"
#include "records.hpp"
#include "worker_parser.hpp"
#include "../store/document_store.hpp"

namespace mdingest {

enum class RunStatus { SUCCEEDED, SUCCEEDED_WITH_CAVEATS, FAILED };

inline const char* run_status_str(RunStatus s) {
    switch (s) {
        case RunStatus::SUCCEEDED:              return "succeeded";
        case RunStatus::SUCCEEDED_WITH_CAVEATS: return "succeeded_with_caveats";
        case RunStatus::FAILED:                 return "failed";
    }
    return "??";
}

struct FailedChunk {
    ByteRange range;
    int attempts = 0;
    std::string error;
};

inline void to_json(nlohmann::json& j, const FailedChunk& f) {
    j = nlohmann::json{
        {"chunk_id", f.range.id()},
        {"range", f.range},
        {"attempts", f.attempts},
        {"error", f.error}
    };
}

struct ProcessingResult {
    std::string file_path;
    uint64_t file_size = 0;

    int64_t questions_parsed = 0;
    int64_t questions_written = 0;
    int64_t questions_duplicate = 0;    // Already present (resumed run)

    size_t chunks_total = 0;
    size_t chunks_processed = 0;        // Done in this run
    size_t chunks_skipped = 0;          // Done in a previous run
    size_t chunks_pending = 0;          // Left for a later run (cancelled)
    std::vector<FailedChunk> chunks_failed;

    std::vector<WriteFailure> write_failures;
    std::vector<ChunkingWarning> chunking_warnings;
    nlohmann::json dedup_stats = nlohmann::json::object();
    int64_t progress_errors = 0;

    bool cancelled = false;
    RunStatus status = RunStatus::SUCCEEDED;
    std::string error;                  // Run-level failure (store, file)

    int64_t elapsed_ns = 0;
    int64_t read_ns = 0;                // Summed over workers
    int64_t parse_ns = 0;               // Summed over workers
    int64_t write_ns = 0;
    int64_t write_batches = 0;

    [[nodiscard]] double elapsed_sec() const { return static_cast<double>(elapsed_ns) / 1e9; }
    [[nodiscard]] double throughput_mb_s() const;
    [[nodiscard]] double questions_per_sec() const;

    nlohmann::json to_json() const;
};

class Coordinator {
public:
    // entity_store is used from the calling thread only, question_store from
    // the BatchWriter thread only. Both must be connected.
    Coordinator(IngestConfig config, DocumentStore& entity_store,
                DocumentStore& question_store, ProgressStore& progress_store,
                const QuestionParser& parser, const RangeReader& reader);

    ProcessingResult process(const std::string& file_path);

    // Stops dispatching; in-flight chunks finish and are flushed.
    // Safe to call from a signal handler or another thread.
    void cancel() { cancelled_.store(true); }
    [[nodiscard]] bool cancelled() const { return cancelled_.load(); }

private:
    IngestConfig config_;
    DocumentStore& entity_store_;
    DocumentStore& question_store_;
    ProgressStore& progress_store_;
    const QuestionParser& parser_;
    const RangeReader& reader_;
    std::atomic<bool> cancelled_{false};
};

} // namespace mdingest

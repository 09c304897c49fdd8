#pragma once
// =============================================================================
// ProgressTracker -- per-chunk state machine used for retry and resume.
//
//   pending -> in_flight -> done
//                  |  ^
//                  v  |  (next attempt)
//                failed
//
// Every transition is written through a ProgressStore. Persistence errors are
// logged and counted but never stop the run. Thread-safe.
// =============================================================================

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "progress_store.hpp"
#include "records.hpp"

namespace mdingest {

class ProgressTracker {
public:
    explicit ProgressTracker(ProgressStore& store) : store_(store) {}

    // Binds saved state to the current file and chunking configuration
    static std::string make_run_key(const std::string& canonical_path, uint64_t file_size,
                                    int64_t mtime, uint64_t chunk_size, uint64_t search_window);

    // Registers the run's chunks. With resume, chunks saved as done stay done;
    // failed or in-flight chunks restart as pending with a fresh attempt budget.
    // Returns the number of chunks already done.
    size_t begin_run(const std::string& run_key, const std::vector<ByteRange>& chunks,
                     bool resume);

    void mark_pending(const ByteRange& chunk);
    void mark_in_flight(const ByteRange& chunk);     // Counts an attempt
    void mark_done(const ByteRange& chunk);
    void mark_failed(const ByteRange& chunk, const std::string& reason);

    [[nodiscard]] std::vector<ChunkProgress> snapshot() const;
    [[nodiscard]] ChunkStatus status(const std::string& chunk_id) const;
    [[nodiscard]] int attempts(const std::string& chunk_id) const;
    [[nodiscard]] bool is_done(const std::string& chunk_id) const;
    [[nodiscard]] int64_t persist_errors() const;

private:
    ProgressStore& store_;
    mutable std::mutex mutex_;
    std::map<uint64_t, ChunkProgress> chunks_;      // By range start
    std::map<std::string, uint64_t> by_id_;
    int64_t persist_errors_ = 0;

    // Requires lock held
    ChunkProgress& entry(const ByteRange& chunk);
    void transition(const ByteRange& chunk, ChunkStatus to, const std::string& reason);
};

} // namespace mdingest

#include "progress_tracker.hpp"
#include "../utils/logger.hpp"
#include "../utils/sha256.hpp"
#include "../utils/timer.hpp"

namespace mdingest {

std::string ProgressTracker::make_run_key(const std::string& canonical_path, uint64_t file_size,
                                          int64_t mtime, uint64_t chunk_size,
                                          uint64_t search_window) {
    std::string material = canonical_path + "|" + std::to_string(file_size) + "|" +
                           std::to_string(mtime) + "|" + std::to_string(chunk_size) + "|" +
                           std::to_string(search_window);
    return SHA256::hash_hex(material);
}

size_t ProgressTracker::begin_run(const std::string& run_key,
                                  const std::vector<ByteRange>& chunks, bool resume) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, ChunkProgress> saved;
    if (resume) {
        std::vector<ChunkProgress> loaded;
        if (!store_.load(run_key, loaded)) {
            ++persist_errors_;
            LOG_WRN("[progress] Could not load saved progress from %s store, starting fresh",
                store_.name());
        }
        for (auto& p : loaded) saved[p.chunk_id] = std::move(p);
    }

    chunks_.clear();
    by_id_.clear();
    size_t done = 0;
    std::vector<ChunkProgress> initial;
    initial.reserve(chunks.size());

    for (const auto& range : chunks) {
        ChunkProgress p;
        p.chunk_id = range.id();
        p.range = range;
        p.updated_at = utc_timestamp();

        auto it = saved.find(p.chunk_id);
        if (it != saved.end() && it->second.status == ChunkStatus::DONE &&
            it->second.range == range) {
            p = it->second;
            ++done;
        } else if (it != saved.end() && it->second.status != ChunkStatus::PENDING) {
            LOG_INF("[progress] Chunk %s was %s (attempts %d), retrying",
                p.chunk_id.c_str(), chunk_status_str(it->second.status), it->second.attempts);
        }

        by_id_[p.chunk_id] = range.start;
        initial.push_back(p);
        chunks_[range.start] = std::move(p);
    }

    if (!store_.reset(run_key, initial)) {
        ++persist_errors_;
        LOG_WRN("[progress] Could not initialize %s progress store, resume will not be possible",
            store_.name());
    }

    LOG_INF("[progress] Run %.12s: %zu chunks, %zu already done", run_key.c_str(),
        chunks.size(), done);
    return done;
}

ChunkProgress& ProgressTracker::entry(const ByteRange& chunk) {
    auto it = chunks_.find(chunk.start);
    if (it == chunks_.end() || it->second.range != chunk) {
        ChunkProgress p;
        p.chunk_id = chunk.id();
        p.range = chunk;
        by_id_[p.chunk_id] = chunk.start;
        it = chunks_.insert_or_assign(chunk.start, std::move(p)).first;
    }
    return it->second;
}

void ProgressTracker::transition(const ByteRange& chunk, ChunkStatus to,
                                 const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChunkProgress& p = entry(chunk);

    if (p.status == ChunkStatus::DONE && to != ChunkStatus::DONE) {
        LOG_WRN("[progress] Ignoring %s for chunk %s, already done",
            chunk_status_str(to), p.chunk_id.c_str());
        return;
    }

    p.status = to;
    if (to == ChunkStatus::IN_FLIGHT) ++p.attempts;
    if (to == ChunkStatus::PENDING) p.attempts = 0;
    p.reason = reason;
    p.updated_at = utc_timestamp();

    if (!store_.save(p)) {
        ++persist_errors_;
        LOG_WRN("[progress] Could not persist %s for chunk %s",
            chunk_status_str(to), p.chunk_id.c_str());
    }
}

void ProgressTracker::mark_pending(const ByteRange& chunk) {
    transition(chunk, ChunkStatus::PENDING, "");
}

void ProgressTracker::mark_in_flight(const ByteRange& chunk) {
    transition(chunk, ChunkStatus::IN_FLIGHT, "");
}

void ProgressTracker::mark_done(const ByteRange& chunk) {
    transition(chunk, ChunkStatus::DONE, "");
}

void ProgressTracker::mark_failed(const ByteRange& chunk, const std::string& reason) {
    transition(chunk, ChunkStatus::FAILED, reason);
}

std::vector<ChunkProgress> ProgressTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkProgress> out;
    out.reserve(chunks_.size());
    for (const auto& [start, p] : chunks_) out.push_back(p);
    return out;
}

ChunkStatus ProgressTracker::status(const std::string& chunk_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(chunk_id);
    if (it == by_id_.end()) return ChunkStatus::PENDING;
    return chunks_.at(it->second).status;
}

int ProgressTracker::attempts(const std::string& chunk_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(chunk_id);
    if (it == by_id_.end()) return 0;
    return chunks_.at(it->second).attempts;
}

bool ProgressTracker::is_done(const std::string& chunk_id) const {
    return status(chunk_id) == ChunkStatus::DONE;
}

int64_t ProgressTracker::persist_errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return persist_errors_;
}

} // namespace mdingest

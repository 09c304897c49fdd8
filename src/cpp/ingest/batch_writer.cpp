#include "batch_writer.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"
#include <exception>

namespace mdingest {

BatchWriter::BatchWriter(DocumentStore& store, size_t batch_size)
    : store_(store), batch_size_(batch_size > 0 ? batch_size : 1) {
    active_.reserve(batch_size_);
    thread_ = std::thread(&BatchWriter::run, this);
}

BatchWriter::~BatchWriter() {
    flush();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

uint64_t BatchWriter::add(FinalizedQuestionRecord record) {
    std::unique_lock<std::mutex> lock(mutex_);
    active_.push_back(std::move(record));
    uint64_t seq = ++next_seq_;
    if (active_.size() >= batch_size_) hand_off(lock);
    return seq;
}

void BatchWriter::hand_off(std::unique_lock<std::mutex>& lock) {
    cv_.wait(lock, [this] { return !busy_; });
    if (active_.empty()) return;
    pending_.swap(active_);
    active_.clear();
    active_.reserve(batch_size_);
    pending_last_seq_ = next_seq_;
    busy_ = true;
    cv_.notify_all();
}

void BatchWriter::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    hand_off(lock);
    cv_.wait(lock, [this] { return !busy_; });
}

void BatchWriter::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !busy_; });
}

void BatchWriter::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        cv_.wait(lock, [this] { return busy_ || stop_; });
        if (!busy_) return;    // stop_ with nothing left to write

        std::vector<FinalizedQuestionRecord> batch;
        batch.swap(pending_);
        uint64_t last_seq = pending_last_seq_;

        lock.unlock();
        write_batch(batch);
        lock.lock();

        durable_seq_ = last_seq;
        busy_ = false;
        cv_.notify_all();
    }
}

void BatchWriter::write_batch(const std::vector<FinalizedQuestionRecord>& batch) {
    Timer timer;
    timer.start();

    BulkWriteResult result;
    try {
        result = store_.insert_questions(batch);
    } catch (const std::exception& e) {
        result = BulkWriteResult{};
        result.error = e.what();
    }
    timer.stop();

    std::vector<WriteFailure> failed;
    if (!result.error.empty()) {
        LOG_ERR("[writer] Batch of %zu questions failed: %s", batch.size(), result.error.c_str());
        result.inserted = 0;
        result.duplicates = 0;
        for (const auto& q : batch)
            failed.push_back({q.id, q.chunk_id, q.content_hash, result.error});
    } else {
        for (const auto& r : result.rejected) {
            if (r.index >= batch.size()) continue;
            const auto& q = batch[r.index];
            LOG_WRN("[writer] Question %s (chunk %s) rejected: %s",
                q.id.c_str(), q.chunk_id.c_str(), r.reason.c_str());
            failed.push_back({q.id, q.chunk_id, q.content_hash, r.reason});
        }
    }

    LOG_DBG("[writer] Batch of %zu: %lld inserted, %lld duplicates, %zu failed, %lld ms",
        batch.size(), static_cast<long long>(result.inserted),
        static_cast<long long>(result.duplicates), failed.size(),
        static_cast<long long>(timer.elapsed_ms()));

    std::lock_guard<std::mutex> lock(mutex_);
    written_ += result.inserted;
    duplicates_ += result.duplicates;
    ++batches_;
    write_ns_ += timer.elapsed_ns();
    for (auto& f : failed) {
        ++failures_by_chunk_[f.chunk_id];
        failures_.push_back(std::move(f));
    }
}

uint64_t BatchWriter::durable_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return durable_seq_;
}

int64_t BatchWriter::written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

int64_t BatchWriter::duplicates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return duplicates_;
}

int64_t BatchWriter::batches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_;
}

int64_t BatchWriter::write_ns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_ns_;
}

std::vector<WriteFailure> BatchWriter::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

size_t BatchWriter::failures_in(const std::string& chunk_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = failures_by_chunk_.find(chunk_id);
    return it == failures_by_chunk_.end() ? 0 : it->second;
}

size_t BatchWriter::buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

} // namespace mdingest

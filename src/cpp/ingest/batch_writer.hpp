#pragma once
// =============================================================================
// BatchWriter -- double-buffered bulk writer for finalized questions.
//
// add() fills the active buffer; a full buffer is handed to the writer thread
// while add() continues into the other one. add() blocks only when both
// buffers are busy, so at most two batches are resident.
//
// Every added record gets a sequence number. durable_sequence() is the highest
// number whose batch has been written (inserted, duplicate or failed); the
// coordinator uses it to decide when a chunk is complete, and failures_in()
// to decide whether it completed cleanly.
// =============================================================================

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "records.hpp"
#include "../store/document_store.hpp"

namespace mdingest {

class BatchWriter {
public:
    BatchWriter(DocumentStore& store, size_t batch_size);
    ~BatchWriter();

    BatchWriter(const BatchWriter&) = delete;
    BatchWriter& operator=(const BatchWriter&) = delete;

    // Buffers record; returns its sequence number (1-based)
    uint64_t add(FinalizedQuestionRecord record);

    // Hands off the partial buffer and waits until everything is written
    void flush();

    // Waits for the in-flight batch, leaving the active buffer alone
    void wait_idle();

    [[nodiscard]] uint64_t durable_sequence() const;
    [[nodiscard]] int64_t written() const;
    [[nodiscard]] int64_t duplicates() const;
    [[nodiscard]] int64_t batches() const;
    [[nodiscard]] int64_t write_ns() const;
    [[nodiscard]] std::vector<WriteFailure> failures() const;
    // Failed records of one chunk written so far
    [[nodiscard]] size_t failures_in(const std::string& chunk_id) const;
    [[nodiscard]] size_t buffered() const;

private:
    DocumentStore& store_;
    const size_t batch_size_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::vector<FinalizedQuestionRecord> active_;
    std::vector<FinalizedQuestionRecord> pending_;   // Owned by writer while busy_
    uint64_t pending_last_seq_ = 0;
    bool busy_ = false;
    bool stop_ = false;

    uint64_t next_seq_ = 0;
    uint64_t durable_seq_ = 0;

    int64_t written_ = 0;
    int64_t duplicates_ = 0;
    int64_t batches_ = 0;
    int64_t write_ns_ = 0;
    std::vector<WriteFailure> failures_;
    std::unordered_map<std::string, size_t> failures_by_chunk_;

    std::thread thread_;

    // Requires lock held; waits for the writer, then swaps buffers
    void hand_off(std::unique_lock<std::mutex>& lock);
    void run();
    void write_batch(const std::vector<FinalizedQuestionRecord>& batch);
};

} // namespace mdingest

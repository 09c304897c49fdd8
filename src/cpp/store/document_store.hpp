#pragma once
// Abstract interface for the document store holding questions and the
// deduplicated option / image / formula collections.
//
// Uniqueness is enforced by the store itself (content_hash per entity
// collection, id for questions); callers rely on CONFLICT results instead of
// cross-process locking.
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>
#include "../config.hpp"
#include "../ingest/records.hpp"
#include "../utils/logger.hpp"

namespace mdingest {

struct LookupResult {
    bool found = false;
    std::string id;
    std::string error;          // Empty on success (found or not)
};

enum class InsertStatus { INSERTED, CONFLICT, FAILED };

struct InsertOutcome {
    InsertStatus status = InsertStatus::FAILED;
    std::string id;             // Set for INSERTED
    std::string error;          // Set for FAILED
};

// Per-record rejection inside a bulk write
struct RecordRejection {
    size_t index = 0;           // Position in the submitted batch
    std::string reason;
};

// Result of an unordered bulk insert
struct BulkWriteResult {
    int64_t inserted = 0;
    int64_t duplicates = 0;     // Id already present (replayed record)
    std::vector<RecordRejection> rejected;
    int64_t duration_ns = 0;
    std::string error;          // Whole-batch failure, nothing written
};

class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual bool connect(const StoreConnection& conn) = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;

    // Collections and their unique indexes
    virtual bool create_collections() = 0;
    virtual bool drop_collections() = 0;
    bool reset_collections() { return drop_collections() && create_collections(); }

    // Entity collections (options, images, formulas)
    virtual LookupResult find_entity(EntityKind kind, const std::string& content_hash) = 0;
    // CONFLICT when another actor already holds the content_hash
    virtual InsertOutcome insert_entity(const CanonicalEntity& entity) = 0;

    // Questions, unordered; one rejected record never blocks the others
    virtual BulkWriteResult insert_questions(const std::vector<FinalizedQuestionRecord>& batch) = 0;

    // Documents in a collection, -1 on error
    virtual int64_t count(const std::string& collection) = 0;

    [[nodiscard]] virtual const char* system_name() const = 0;

    // Re-establishes a dropped connection. The default reconnects from
    // scratch; PostgresStore tries PQreset first.
    virtual bool reconnect(const StoreConnection& conn) {
        disconnect();
        return connect(conn);
    }

    // Called before store work (dedup lookups, question batches). Returns
    // true when the store is usable, retrying a lost connection up to
    // max_attempts times with delays of base_delay_ms, 2x, 4x ... capped at
    // MAX_RECONNECT_DELAY_MS.
    bool ensure_connected(int max_attempts = 5, int base_delay_ms = 1000) {
        if (is_connected()) return true;

        LOG_WRN("[%s] Store connection lost, reconnecting to %s:%u/%s (%d attempts)",
            system_name(), conn_info_.host.c_str(), conn_info_.port,
            conn_info_.database.c_str(), max_attempts);

        int delay = base_delay_ms;
        for (int attempt = 1; attempt <= max_attempts; ++attempt) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            if (reconnect(conn_info_)) {
                LOG_INF("[%s] Store reachable again after %d attempt(s)",
                    system_name(), attempt);
                return true;
            }
            delay = std::min(delay * 2, MAX_RECONNECT_DELAY_MS);
            LOG_WRN("[%s] Reconnect attempt %d/%d failed", system_name(), attempt, max_attempts);
        }

        LOG_ERR("[%s] Store unreachable after %d attempts; pending dedup lookups and "
                "question batches will fail", system_name(), max_attempts);
        return false;
    }

    static constexpr int MAX_RECONNECT_DELAY_MS = 10000;

protected:
    // Parameters of the last connect(), reused by ensure_connected()
    StoreConnection conn_info_;
};

} // namespace mdingest

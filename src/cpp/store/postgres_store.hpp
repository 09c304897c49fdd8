#pragma once
// PostgreSQL document store -- one schema per deployment, one table per
// collection with a JSONB document column.
// Uses libpq (C API). A PostgresStore wraps one PGconn and must be used from
// one thread at a time; the pipeline opens one per writing thread.
//
//   options/images/formulas(id UUID PK, content_hash TEXT UNIQUE, doc JSONB)
//   questions(id TEXT PK, chunk_id TEXT, question_type TEXT, doc JSONB)
#include "document_store.hpp"
#include <libpq-fe.h>

namespace mdingest {

class PostgresStore : public DocumentStore {
public:
    PostgresStore() = default;
    ~PostgresStore() override { disconnect(); }

    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;

    bool connect(const StoreConnection& conn) override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override;

    bool create_collections() override;
    bool drop_collections() override;

    LookupResult find_entity(EntityKind kind, const std::string& content_hash) override;
    InsertOutcome insert_entity(const CanonicalEntity& entity) override;
    BulkWriteResult insert_questions(const std::vector<FinalizedQuestionRecord>& batch) override;

    int64_t count(const std::string& collection) override;

    [[nodiscard]] const char* system_name() const override { return "postgresql"; }

    // Override: use PQreset for faster reconnection (reuses connection params)
    bool reconnect(const StoreConnection& conn) override;

    // key=value conninfo with every value quoted for libpq
    static std::string build_conninfo(const StoreConnection& conn);

    // libpq caps a statement at 65535 bind parameters
    static constexpr int MAX_PARAMS = 65535;
    static constexpr int QUESTION_PARAMS = 4;

private:
    PGconn* conn_ = nullptr;
    std::string schema_;

    // Execute SQL with error checking, returns true on success
    bool exec(const char* sql);

    // PQexecParams with one reconnect-and-retry when the connection dropped.
    // Caller must PQclear the result (may be nullptr when not connected).
    PGresult* exec_params(const std::string& sql, int n, const char* const* values);

    std::string table(const char* collection) const { return schema_ + "." + collection; }

    // Multi-row fast path for rows [begin, end); false if the statement failed
    bool insert_question_rows(const std::vector<FinalizedQuestionRecord>& batch,
                              size_t begin, size_t end, BulkWriteResult& result,
                              std::string& error);
    // Per-row SAVEPOINT fallback so one bad document cannot abort the rest
    void insert_question_rows_isolated(const std::vector<FinalizedQuestionRecord>& batch,
                                       size_t begin, size_t end, BulkWriteResult& result);
};

} // namespace mdingest

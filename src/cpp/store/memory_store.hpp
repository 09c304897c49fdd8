#pragma once
// In-process document store with the same uniqueness semantics as the
// PostgreSQL backend. Used for --dry-run and as the base of test doubles.
// Thread-safe; data survives disconnect() and is cleared by drop_collections().
#include <array>
#include <mutex>
#include <optional>
#include <unordered_map>
#include "document_store.hpp"

namespace mdingest {

class MemoryStore : public DocumentStore {
public:
    bool connect(const StoreConnection& conn) override;
    void disconnect() override;
    [[nodiscard]] bool is_connected() const override;

    bool create_collections() override;
    bool drop_collections() override;

    LookupResult find_entity(EntityKind kind, const std::string& content_hash) override;
    InsertOutcome insert_entity(const CanonicalEntity& entity) override;
    BulkWriteResult insert_questions(const std::vector<FinalizedQuestionRecord>& batch) override;

    int64_t count(const std::string& collection) override;

    [[nodiscard]] const char* system_name() const override { return "memory"; }

    // Inspection
    std::vector<CanonicalEntity> entities(EntityKind kind) const;
    std::optional<FinalizedQuestionRecord> question(const std::string& id) const;
    std::vector<FinalizedQuestionRecord> questions() const;
    [[nodiscard]] int64_t bulk_write_calls() const;

protected:
    // Reason to reject a question document, empty to accept it
    virtual std::string check_question(const FinalizedQuestionRecord& q) const;

private:
    struct EntityCollection {
        std::unordered_map<std::string, CanonicalEntity> by_hash;
        uint64_t next_id = 0;
    };

    mutable std::mutex mutex_;
    bool connected_ = false;
    std::array<EntityCollection, 3> entities_;
    std::unordered_map<std::string, FinalizedQuestionRecord> questions_;
    std::vector<std::string> question_order_;     // Insertion order
    int64_t bulk_write_calls_ = 0;

    EntityCollection& collection_of(EntityKind kind) {
        return entities_[static_cast<size_t>(kind)];
    }
    const EntityCollection& collection_of(EntityKind kind) const {
        return entities_[static_cast<size_t>(kind)];
    }
};

} // namespace mdingest

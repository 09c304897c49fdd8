#pragma once
// =============================================================================
// Deduplicator -- content-addressed get-or-create for options, images and
// formulas.
//
//   digest -> cache -> store lookup -> insert -> on CONFLICT re-lookup
//
// The store's unique index on content_hash is the only synchronization between
// concurrent Deduplicator instances; the cache is a per-instance view of ids
// the store already confirmed. An instance is used from one thread.
// =============================================================================

#include <array>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "records.hpp"
#include "../store/document_store.hpp"

namespace mdingest {

struct DedupKindStats {
    int64_t lookups = 0;        // get_or_create calls
    int64_t cache_hits = 0;
    int64_t store_hits = 0;     // Found by lookup (no insert)
    int64_t inserts = 0;        // Rows created by this instance
    int64_t conflicts = 0;      // Insert lost a race, resolved by re-lookup
};

inline void to_json(nlohmann::json& j, const DedupKindStats& s) {
    j = nlohmann::json{
        {"lookups", s.lookups},
        {"cache_hits", s.cache_hits},
        {"store_hits", s.store_hits},
        {"inserts", s.inserts},
        {"conflicts", s.conflicts}
    };
}

class Deduplicator {
public:
    // cache_entries per kind; 0 disables the cache
    explicit Deduplicator(DocumentStore& store, size_t cache_entries = 100000)
        : store_(store), cache_capacity_(cache_entries) {}

    // Returns the canonical id for payload. alt is stored with images only.
    // Throws StoreError if the store cannot answer.
    std::string get_or_create(EntityKind kind, const std::string& payload,
                              const std::string& alt = "");

    [[nodiscard]] const DedupKindStats& stats(EntityKind kind) const {
        return stats_[index(kind)];
    }

    // {"option": {...}, "image": {...}, "formula": {...}}
    [[nodiscard]] nlohmann::json stats_json() const;

private:
    struct Cache {
        std::unordered_map<std::string, std::string> ids;   // digest -> id
        std::deque<std::string> order;                      // FIFO eviction
    };

    DocumentStore& store_;
    size_t cache_capacity_;
    std::array<Cache, 3> caches_;
    std::array<DedupKindStats, 3> stats_{};

    static size_t index(EntityKind kind) { return static_cast<size_t>(kind); }
    void remember(EntityKind kind, const std::string& digest, const std::string& id);
};

} // namespace mdingest

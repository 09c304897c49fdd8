#include "deduplicator.hpp"
#include "content_key.hpp"
#include "errors.hpp"
#include "../utils/logger.hpp"

namespace mdingest {

std::string Deduplicator::get_or_create(EntityKind kind, const std::string& payload,
                                        const std::string& alt) {
    auto& st = stats_[index(kind)];
    ++st.lookups;

    const std::string digest = content_digest(kind, payload);

    auto& cache = caches_[index(kind)];
    auto cached = cache.ids.find(digest);
    if (cached != cache.ids.end()) {
        ++st.cache_hits;
        return cached->second;
    }

    LookupResult found = store_.find_entity(kind, digest);
    if (!found.error.empty())
        throw StoreError(std::string("lookup of ") + entity_kind_str(kind) + " " +
                         digest + " failed: " + found.error);
    if (found.found) {
        ++st.store_hits;
        remember(kind, digest, found.id);
        return found.id;
    }

    CanonicalEntity entity;
    entity.kind = kind;
    entity.payload = payload;
    if (kind == EntityKind::IMAGE) entity.alt = alt;
    entity.content_hash = digest;

    InsertOutcome ins = store_.insert_entity(entity);
    switch (ins.status) {
        case InsertStatus::INSERTED:
            ++st.inserts;
            remember(kind, digest, ins.id);
            return ins.id;

        case InsertStatus::CONFLICT: {
            // Another writer inserted between our lookup and insert
            ++st.conflicts;
            LookupResult winner = store_.find_entity(kind, digest);
            if (!winner.error.empty())
                throw StoreError(std::string("re-lookup of ") + entity_kind_str(kind) + " " +
                                 digest + " failed: " + winner.error);
            if (!winner.found)
                throw StoreError(std::string("conflicting ") + entity_kind_str(kind) + " " +
                                 digest + " vanished on re-lookup");
            LOG_DBG("[dedup] %s %s: conflict resolved to %s",
                entity_kind_str(kind), digest.c_str(), winner.id.c_str());
            remember(kind, digest, winner.id);
            return winner.id;
        }

        case InsertStatus::FAILED:
            break;
    }
    throw StoreError(std::string("insert of ") + entity_kind_str(kind) + " " +
                     digest + " failed: " + ins.error);
}

void Deduplicator::remember(EntityKind kind, const std::string& digest, const std::string& id) {
    if (cache_capacity_ == 0) return;
    auto& cache = caches_[index(kind)];
    if (cache.ids.size() >= cache_capacity_) {
        cache.ids.erase(cache.order.front());
        cache.order.pop_front();
    }
    if (cache.ids.emplace(digest, id).second) cache.order.push_back(digest);
}

nlohmann::json Deduplicator::stats_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (EntityKind k : ALL_ENTITY_KINDS) j[entity_kind_str(k)] = stats_[index(k)];
    return j;
}

} // namespace mdingest

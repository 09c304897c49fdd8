// =============================================================================
// Deduplicator tests: cache, store lookup, insert races
// =============================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <set>
#include <thread>
#include "ingest/content_key.hpp"
#include "ingest/deduplicator.hpp"
#include "ingest/errors.hpp"
#include "store/memory_store.hpp"

using namespace mdingest;

namespace {

// A rival writer inserts every entity right after our first lookup missed it
class RacingStore : public MemoryStore {
public:
    LookupResult find_entity(EntityKind kind, const std::string& content_hash) override {
        LookupResult r = MemoryStore::find_entity(kind, content_hash);
        if (!r.found && raced_.insert(content_hash).second) {
            CanonicalEntity rival;
            rival.kind = kind;
            rival.payload = "inserted by rival";
            rival.content_hash = content_hash;
            rival_ids_[content_hash] = MemoryStore::insert_entity(rival).id;
        }
        return r;
    }

    std::map<std::string, std::string> rival_ids_;

private:
    std::set<std::string> raced_;
};

// Store that lost its backend
class BrokenStore : public MemoryStore {
public:
    LookupResult find_entity(EntityKind, const std::string&) override {
        LookupResult r;
        r.error = "server closed the connection unexpectedly";
        return r;
    }
};

// Insert reports CONFLICT but the winner never becomes visible
class VanishingStore : public MemoryStore {
public:
    InsertOutcome insert_entity(const CanonicalEntity&) override {
        InsertOutcome out;
        out.status = InsertStatus::CONFLICT;
        return out;
    }
};

} // namespace

class DeduplicatorTest : public ::testing::Test {
protected:
    void SetUp() override { store_.connect(StoreConnection{}); }
    MemoryStore store_;
};

TEST_F(DeduplicatorTest, SamePayloadSameId) {
    Deduplicator dedup(store_);

    std::string a = dedup.get_or_create(EntityKind::OPTION, "Paris");
    std::string b = dedup.get_or_create(EntityKind::OPTION, "London");
    std::string c = dedup.get_or_create(EntityKind::OPTION, "Paris");

    EXPECT_EQ(a, c);
    EXPECT_NE(a, b);
    EXPECT_EQ(store_.count(collection::OPTIONS), 2);

    const auto& st = dedup.stats(EntityKind::OPTION);
    EXPECT_EQ(st.lookups, 3);
    EXPECT_EQ(st.inserts, 2);
    EXPECT_EQ(st.cache_hits, 1);
}

TEST_F(DeduplicatorTest, KindsAreSeparateCollections) {
    Deduplicator dedup(store_);
    dedup.get_or_create(EntityKind::OPTION, "x^2");
    dedup.get_or_create(EntityKind::FORMULA, "x^2");

    EXPECT_EQ(store_.count(collection::OPTIONS), 1);
    EXPECT_EQ(store_.count(collection::FORMULAS), 1);
}

TEST_F(DeduplicatorTest, ImageKeepsAltButHashesUrlOnly) {
    Deduplicator dedup(store_);
    std::string a = dedup.get_or_create(EntityKind::IMAGE, "http://img/a.png", "first alt");
    std::string b = dedup.get_or_create(EntityKind::IMAGE, "http://img/a.png", "other alt");
    EXPECT_EQ(a, b);

    auto images = store_.entities(EntityKind::IMAGE);
    ASSERT_EQ(images.size(), 1u);
    EXPECT_EQ(images[0].alt, "first alt");
    EXPECT_EQ(images[0].content_hash, content_digest(EntityKind::IMAGE, "http://img/a.png"));
}

TEST_F(DeduplicatorTest, FindsEntitiesCreatedByEarlierRun) {
    std::string first;
    {
        Deduplicator earlier(store_);
        first = earlier.get_or_create(EntityKind::FORMULA, "\\frac{a}{b}");
    }

    Deduplicator dedup(store_, 0);     // No cache: every call asks the store
    EXPECT_EQ(dedup.get_or_create(EntityKind::FORMULA, "\\frac{a}{b}"), first);
    EXPECT_EQ(dedup.get_or_create(EntityKind::FORMULA, "\\frac{a}{b}"), first);

    const auto& st = dedup.stats(EntityKind::FORMULA);
    EXPECT_EQ(st.store_hits, 2);
    EXPECT_EQ(st.cache_hits, 0);
    EXPECT_EQ(st.inserts, 0);
}

TEST_F(DeduplicatorTest, CacheEvictsOldestEntries) {
    Deduplicator dedup(store_, 2);
    dedup.get_or_create(EntityKind::OPTION, "a");
    dedup.get_or_create(EntityKind::OPTION, "b");
    dedup.get_or_create(EntityKind::OPTION, "c");     // Evicts "a"

    dedup.get_or_create(EntityKind::OPTION, "c");
    dedup.get_or_create(EntityKind::OPTION, "a");

    const auto& st = dedup.stats(EntityKind::OPTION);
    EXPECT_EQ(st.cache_hits, 1);
    EXPECT_EQ(st.store_hits, 1);
    EXPECT_EQ(store_.count(collection::OPTIONS), 3);
}

TEST_F(DeduplicatorTest, ConcurrentInstancesAgreeOnIds) {
    constexpr int THREADS = 6;
    constexpr int PAYLOADS = 60;
    std::vector<std::vector<std::string>> ids(THREADS);

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            Deduplicator dedup(store_);
            for (int i = 0; i < PAYLOADS; ++i) {
                // Different orders per thread make the races real
                int k = (t % 2 == 0) ? i : PAYLOADS - 1 - i;
                ids[t].push_back(dedup.get_or_create(EntityKind::OPTION,
                                                     "option " + std::to_string(k)));
            }
            if (t % 2 != 0) std::reverse(ids[t].begin(), ids[t].end());
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(store_.count(collection::OPTIONS), PAYLOADS);
    for (int t = 1; t < THREADS; ++t) EXPECT_EQ(ids[t], ids[0]);
}

TEST(DeduplicatorRaceTest, ConflictResolvesToWinner) {
    RacingStore store;
    store.connect(StoreConnection{});
    Deduplicator dedup(store);

    std::string id = dedup.get_or_create(EntityKind::OPTION, "contested");
    std::string digest = content_digest(EntityKind::OPTION, "contested");

    EXPECT_EQ(id, store.rival_ids_.at(digest));
    EXPECT_EQ(store.count(collection::OPTIONS), 1);
    EXPECT_EQ(dedup.stats(EntityKind::OPTION).conflicts, 1);
    EXPECT_EQ(dedup.stats(EntityKind::OPTION).inserts, 0);

    // Resolved id is cached
    EXPECT_EQ(dedup.get_or_create(EntityKind::OPTION, "contested"), id);
    EXPECT_EQ(dedup.stats(EntityKind::OPTION).cache_hits, 1);
}

TEST(DeduplicatorErrorTest, LookupErrorThrows) {
    BrokenStore store;
    store.connect(StoreConnection{});
    Deduplicator dedup(store);
    EXPECT_THROW(dedup.get_or_create(EntityKind::OPTION, "x"), StoreError);
}

TEST(DeduplicatorErrorTest, VanishedWinnerThrows) {
    VanishingStore store;
    store.connect(StoreConnection{});
    Deduplicator dedup(store);
    EXPECT_THROW(dedup.get_or_create(EntityKind::IMAGE, "http://img/a.png"), StoreError);
}

TEST(DeduplicatorErrorTest, DisconnectedStoreThrows) {
    MemoryStore store;
    Deduplicator dedup(store);
    EXPECT_THROW(dedup.get_or_create(EntityKind::FORMULA, "x"), StoreError);
}

TEST(DeduplicatorStatsTest, JsonHasEveryKind) {
    MemoryStore store;
    store.connect(StoreConnection{});
    Deduplicator dedup(store);
    dedup.get_or_create(EntityKind::OPTION, "a");

    auto j = dedup.stats_json();
    EXPECT_EQ(j["option"]["inserts"], 1);
    EXPECT_EQ(j["image"]["lookups"], 0);
    EXPECT_TRUE(j.contains("formula"));
}

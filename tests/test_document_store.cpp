// =============================================================================
// DocumentStore connection recovery tests (ensure_connected over MemoryStore)
// =============================================================================

#include <gtest/gtest.h>
#include "store/memory_store.hpp"

using namespace mdingest;

namespace {

// connect() fails a scripted number of times
class FlakyConnectStore : public MemoryStore {
public:
    bool connect(const StoreConnection& conn) override {
        ++connect_calls_;
        if (failures_left_ > 0) {
            --failures_left_;
            return false;
        }
        return MemoryStore::connect(conn);
    }

    void fail_next(int n) { failures_left_ = n; }
    int connect_calls() const { return connect_calls_; }
    const StoreConnection& last_connection() const { return conn_info_; }

private:
    int failures_left_ = 0;
    int connect_calls_ = 0;
};

StoreConnection named_connection() {
    StoreConnection c;
    c.system = StoreSystem::MEMORY;
    c.host = "bank-db";
    c.database = "questions";
    return c;
}

} // namespace

TEST(EnsureConnectedTest, ConnectedStoreIsUntouched) {
    FlakyConnectStore store;
    ASSERT_TRUE(store.connect(named_connection()));
    EXPECT_TRUE(store.ensure_connected(3, 1));
    EXPECT_EQ(store.connect_calls(), 1);
}

TEST(EnsureConnectedTest, RecoversAfterFailedAttempts) {
    FlakyConnectStore store;
    ASSERT_TRUE(store.connect(named_connection()));
    store.disconnect();
    store.fail_next(2);

    EXPECT_TRUE(store.ensure_connected(3, 1));
    EXPECT_TRUE(store.is_connected());
    EXPECT_EQ(store.connect_calls(), 4);

    // Reconnects with the parameters of the original connect()
    EXPECT_EQ(store.last_connection().host, "bank-db");
    EXPECT_EQ(store.last_connection().database, "questions");
}

TEST(EnsureConnectedTest, GivesUpAfterMaxAttempts) {
    FlakyConnectStore store;
    ASSERT_TRUE(store.connect(named_connection()));
    store.disconnect();
    store.fail_next(10);

    EXPECT_FALSE(store.ensure_connected(2, 1));
    EXPECT_FALSE(store.is_connected());
    EXPECT_EQ(store.connect_calls(), 3);
}

TEST(EnsureConnectedTest, DataSurvivesReconnect) {
    FlakyConnectStore store;
    ASSERT_TRUE(store.connect(named_connection()));

    CanonicalEntity e;
    e.kind = EntityKind::OPTION;
    e.payload = "Paris";
    e.content_hash = "hash-paris";
    InsertOutcome ins = store.insert_entity(e);
    ASSERT_EQ(ins.status, InsertStatus::INSERTED);

    store.disconnect();
    store.fail_next(1);
    ASSERT_TRUE(store.ensure_connected(2, 1));

    LookupResult found = store.find_entity(EntityKind::OPTION, "hash-paris");
    EXPECT_TRUE(found.found);
    EXPECT_EQ(found.id, ins.id);
}

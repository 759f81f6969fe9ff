// test_sync_payload.cpp — payload builder and wire envelope

#include <gtest/gtest.h>
#include "balance/Errors.h"
#include "balance/Sync/MergeEngine.h"
#include "balance/Sync/PayloadBuilder.h"
#include "balance/Sync/SyncPayload.h"
#include "MemoryStore.h"

using namespace Balance;
using BalanceTest::MemoryStore;

class PayloadBuilderTest : public ::testing::Test {
protected:
    MemoryStore store;

    void SetUp() override {
        store.table(EntityType::Contacts).bulkUpsert({
            BalanceTest::contactRecord(1, "Ann", 1000),
            BalanceTest::contactRecord(2, "Bob", 2000),
            BalanceTest::contactRecord(3, "Cat", 3000)
        });
        store.table(EntityType::DateNightIdeas).bulkUpsert({
            BalanceTest::ideaRecord(1, "Picnic", 2500)
        });
        store.table(EntityType::SnoozedItems).bulkUpsert({
            BalanceTest::snoozeRecord(1, 5000)
        });
        BalanceTest::initPreferences(store, "device-a");
    }

    static const EntityPayload* find(const SyncPayload& payload, EntityType type) {
        for (const auto& ep : payload.entities) {
            if (ep.entityType == type) return &ep;
        }
        return nullptr;
    }
};

TEST_F(PayloadBuilderTest, FullPayloadWithoutWatermark) {
    auto payload = buildSyncPayload(store, std::nullopt, "device-a");

    EXPECT_EQ(payload.deviceId, "device-a");
    EXPECT_FALSE(payload.lastSyncTimestamp.has_value());
    EXPECT_EQ(payload.entities.size(), SYNCABLE_ENTITIES.size());
    EXPECT_EQ(payload.totalRecords, 4);
    EXPECT_EQ(find(payload, EntityType::Contacts)->count, 3);
}

TEST_F(PayloadBuilderTest, DeviceLocalTablesNeverSent) {
    auto payload = buildSyncPayload(store, std::nullopt, "device-a");
    EXPECT_EQ(find(payload, EntityType::SnoozedItems), nullptr);
    EXPECT_EQ(find(payload, EntityType::UserPreferences), nullptr);
}

TEST_F(PayloadBuilderTest, DeltaIsInclusiveOfWatermark) {
    auto payload = buildSyncPayload(store, 2000, "device-a");

    ASSERT_TRUE(payload.lastSyncTimestamp.has_value());
    EXPECT_EQ(*payload.lastSyncTimestamp, 2000);
    EXPECT_EQ(find(payload, EntityType::Contacts)->count, 2);
    EXPECT_EQ(find(payload, EntityType::DateNightIdeas)->count, 1);
    EXPECT_EQ(payload.totalRecords, 3);
}

TEST_F(PayloadBuilderTest, TombstonesTravelInDelta) {
    softDelete(store, EntityType::Contacts, 1, "device-a");
    auto payload = buildSyncPayload(store, 4000, "device-a");

    const auto* contacts = find(payload, EntityType::Contacts);
    ASSERT_EQ(contacts->count, 1);
    EXPECT_TRUE(contacts->records[0].contains("deletedAt"));
}

TEST_F(PayloadBuilderTest, BackupIncludesEverything) {
    auto backup = buildBackup(store);
    EXPECT_EQ(backup.entities.size(), BACKUP_ENTITIES.size());
    // 3 contacts + 1 idea + 1 snoozed item + preferences row
    EXPECT_EQ(backup.totalRecords, 6);
}

// ═══════════════════════════════════════════════════════════
// SyncPayload parsing
// ═══════════════════════════════════════════════════════════

TEST_F(PayloadBuilderTest, SerializedPayloadParsesBack) {
    auto payload = buildSyncPayload(store, 1500, "device-a");
    auto parsed = SyncPayload::fromJson(json::parse(payload.toJson().dump()));

    EXPECT_EQ(parsed.deviceId, payload.deviceId);
    EXPECT_EQ(parsed.exportedAt, payload.exportedAt);
    EXPECT_EQ(parsed.lastSyncTimestamp, payload.lastSyncTimestamp);
    EXPECT_EQ(parsed.totalRecords, payload.totalRecords);
    ASSERT_EQ(parsed.entities.size(), payload.entities.size());
}

TEST_F(PayloadBuilderTest, WireRoundTripRebuildsEveryTable) {
    auto bob = store.table(EntityType::Contacts).getById(2);
    ASSERT_TRUE(bob.has_value());
    bob->markDeleted(4000, "device-a");
    store.table(EntityType::Contacts).bulkUpsert({*bob});

    auto payload = buildSyncPayload(store, std::nullopt, "device-a");
    std::string wire = payload.toJson().dump();
    auto received = SyncPayload::fromJson(json::parse(wire));

    MemoryStore empty;
    auto summary = MergeEngine(empty).mergePayload(received);
    EXPECT_TRUE(summary.failures.empty());
    EXPECT_EQ(summary.totalNew, 4);

    for (EntityType type : SYNCABLE_ENTITIES) {
        EXPECT_EQ(empty.table(type).getAll(), store.table(type).getAll()) << entityTypeToString(type);
    }

    auto tombstone = empty.table(EntityType::Contacts).getById(2);
    ASSERT_TRUE(tombstone.has_value());
    EXPECT_EQ(tombstone->deletedAt, 4000);
    EXPECT_EQ(tombstone->body, bob->body);
    EXPECT_TRUE(empty.table(EntityType::SnoozedItems).getAll().empty());
}

TEST(SyncPayloadTest, RejectsNonObject) {
    EXPECT_THROW(SyncPayload::fromJson(json::array()), ValidationError);
}

TEST(SyncPayloadTest, RejectsWrongVersion) {
    json j = {{"version", 2}, {"exportedAt", 1}, {"deviceId", "d"}, {"entities", json::array()}};
    try {
        SyncPayload::fromJson(j);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "Unsupported sync payload version: 2");
    }
}

TEST(SyncPayloadTest, RejectsDeviceLocalEntity) {
    json j = {
        {"version", 1}, {"exportedAt", 1}, {"deviceId", "d"},
        {"entities", json::array({json{{"entityType", "snoozedItems"}, {"count", 0},
                                       {"records", json::array()}}})}
    };
    EXPECT_THROW(SyncPayload::fromJson(j), ValidationError);
}

TEST(SyncPayloadTest, RejectsMalformedEntity) {
    json j = {
        {"version", 1}, {"exportedAt", 1}, {"deviceId", "d"},
        {"entities", json::array({json{{"entityType", "contacts"}, {"records", json::array()}}})}
    };
    try {
        SyncPayload::fromJson(j);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "Invalid sync payload: malformed entity payload for \"contacts\"");
    }
}

TEST(SyncPayloadTest, TotalRecordsFallsBackToCount) {
    json j = {
        {"version", 1}, {"exportedAt", 1}, {"deviceId", "d"}, {"lastSyncTimestamp", nullptr},
        {"entities", json::array({json{{"entityType", "dateNightIdeas"}, {"count", 1},
                                       {"records", json::array({BalanceTest::ideaRecord(1, "x", 5).body})}}})}
    };
    auto payload = SyncPayload::fromJson(j);
    EXPECT_EQ(payload.totalRecords, 1);
    EXPECT_FALSE(payload.lastSyncTimestamp.has_value());
}

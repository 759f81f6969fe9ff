// test_models.cpp — entity schemas and preferences

#include <gtest/gtest.h>
#include "balance/Errors.h"
#include "balance/Models.h"
#include "MemoryStore.h"

using namespace Balance;

// ═══════════════════════════════════════════════════════════
// Entity types
// ═══════════════════════════════════════════════════════════

TEST(EntityTypeTest, WireNamesRoundTrip) {
    for (EntityType type : BACKUP_ENTITIES) {
        auto parsed = entityTypeFromString(entityTypeToString(type));
        ASSERT_TRUE(parsed.has_value()) << entityTypeToString(type);
        EXPECT_EQ(*parsed, type);
    }
    EXPECT_FALSE(entityTypeFromString("Contacts").has_value());
    EXPECT_FALSE(entityTypeFromString("").has_value());
}

TEST(EntityTypeTest, DeviceLocalTablesAreNotSyncable) {
    EXPECT_FALSE(isSyncable(EntityType::SnoozedItems));
    EXPECT_FALSE(isSyncable(EntityType::UserPreferences));
    EXPECT_TRUE(isSyncable(EntityType::Contacts));
    EXPECT_TRUE(hasSyncFields(EntityType::SnoozedItems));
    EXPECT_FALSE(hasSyncFields(EntityType::UserPreferences));
}

// ═══════════════════════════════════════════════════════════
// SyncableRecord
// ═══════════════════════════════════════════════════════════

TEST(SyncableRecordTest, ParsesSyncFields) {
    auto record = BalanceTest::contactRecord(7, "Ann", 1000, "device-x");
    EXPECT_EQ(record.id, 7);
    EXPECT_EQ(record.updatedAt, 1000);
    EXPECT_EQ(record.deviceId, "device-x");
    EXPECT_FALSE(record.isDeleted());
}

TEST(SyncableRecordTest, MissingUpdatedAtIsRejected) {
    json body = {{"id", 1}, {"deviceId", "d"}};
    EXPECT_THROW(SyncableRecord::fromJson(body), ValidationError);
}

TEST(SyncableRecordTest, StampUpdatesBodyToo) {
    auto record = BalanceTest::contactRecord(1, "Ann", 1000);
    record.stamp(2000, "device-b");
    EXPECT_EQ(record.updatedAt, 2000);
    EXPECT_EQ(record.body["updatedAt"], 2000);
    EXPECT_EQ(record.body["deviceId"], "device-b");
}

TEST(SyncableRecordTest, MarkDeletedMakesTombstone) {
    auto record = BalanceTest::contactRecord(1, "Ann", 1000);
    record.markDeleted(3000, "device-b");
    EXPECT_TRUE(record.isDeleted());
    EXPECT_EQ(*record.deletedAt, 3000);
    EXPECT_EQ(record.updatedAt, 3000);
    EXPECT_EQ(record.body["deletedAt"], 3000);
}

// ═══════════════════════════════════════════════════════════
// Entities
// ═══════════════════════════════════════════════════════════

TEST(EntityTest, ContactRejectsUnknownTier) {
    json body = BalanceTest::contactRecord(1, "Ann", 1000).body;
    body["tier"] = "acquaintance";
    try {
        entityFromJson(EntityType::Contacts, body);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("\"tier\""), std::string::npos);
    }
}

TEST(EntityTest, ConvertsToRecord) {
    Contact c;
    c.id = 5;
    c.name = "Bob";
    c.tier = "partner";
    c.updatedAt = 42;
    c.deviceId = "device-a";

    SyncableRecord record = entityToRecord(c);
    EXPECT_EQ(record.id, 5);
    EXPECT_EQ(record.body["name"], "Bob");
    EXPECT_EQ(entityTypeOf(Entity{c}), EntityType::Contacts);
}

TEST(EntityTest, RecordWithoutIdIsRejected) {
    DateNightIdea idea;
    idea.title = "Picnic";
    EXPECT_THROW(entityToRecord(idea), ValidationError);
}

TEST(EntityTest, PreferencesHaveNoRecordSchema) {
    EXPECT_THROW(entityFromJson(EntityType::UserPreferences, json::object()), ValidationError);
}

TEST(EntityTest, GoalMilestonesRoundTrip) {
    json body = {
        {"id", 3}, {"lifeAreaId", 1}, {"title", "Run 10k"}, {"description", ""},
        {"milestones", json::array({json{{"title", "5k"}, {"done", true}}})},
        {"progressPercent", 50}, {"updatedAt", 10}, {"deviceId", "d"}
    };
    auto goal = std::get<Goal>(entityFromJson(EntityType::Goals, body));
    ASSERT_EQ(goal.milestones.size(), 1u);
    EXPECT_TRUE(goal.milestones[0].done);
    EXPECT_EQ(goal.toJson()["milestones"][0]["title"], "5k");
}

// ═══════════════════════════════════════════════════════════
// UserPreferences
// ═══════════════════════════════════════════════════════════

TEST(UserPreferencesTest, DefaultsWhenFieldsMissing) {
    auto prefs = UserPreferences::fromJson(json::object());
    EXPECT_EQ(prefs.id, PREFERENCES_KEY);
    EXPECT_TRUE(prefs.deviceId.empty());
    EXPECT_FALSE(prefs.lastSyncTimestamp.has_value());
    EXPECT_EQ(prefs.weekStartDay, "monday");
}

TEST(UserPreferencesTest, UnknownFieldsSurviveRoundTrip) {
    json j = {{"id", "prefs"}, {"deviceId", "d"}, {"futureFlag", true}};
    auto prefs = UserPreferences::fromJson(j);
    EXPECT_EQ(prefs.toJson()["futureFlag"], true);
}

TEST(UserPreferencesTest, RecordSyncKeepsMostRecentFirst) {
    UserPreferences prefs;
    for (int64_t t = 1; t <= static_cast<int64_t>(SYNC_HISTORY_LIMIT) + 5; ++t) {
        prefs.recordSync(t);
    }
    ASSERT_EQ(prefs.syncHistory.size(), SYNC_HISTORY_LIMIT);
    EXPECT_EQ(prefs.syncHistory.front(), static_cast<int64_t>(SYNC_HISTORY_LIMIT) + 5);
}

TEST(UserPreferencesTest, RemoteConfigParsed) {
    json j = {{"remoteSyncConfig", {{"stunServer", "stun:example.org"}, {"turnServer", ""}}}};
    auto prefs = UserPreferences::fromJson(j);
    ASSERT_TRUE(prefs.remoteSyncConfig.has_value());
    EXPECT_EQ(prefs.remoteSyncConfig->stunServer, "stun:example.org");
}

TEST(UserPreferencesTest, MistypedHistoryIsRejected) {
    json j = {{"syncHistory", "yesterday"}};
    EXPECT_THROW(UserPreferences::fromJson(j), ValidationError);
}

// ═══════════════════════════════════════════════════════════
// Store helpers
// ═══════════════════════════════════════════════════════════

TEST(StoreHelpersTest, SaveEntityAssignsIdAndStamps) {
    BalanceTest::MemoryStore store;
    DateNightIdea idea;
    idea.title = "Picnic";

    int64_t before = nowMillis();
    auto saved = saveEntity(store, idea, "device-a");
    EXPECT_EQ(saved.id, 1);
    EXPECT_GE(saved.updatedAt, before);
    EXPECT_EQ(saved.deviceId, "device-a");

    auto second = saveEntity(store, idea, "device-a");
    EXPECT_EQ(second.id, 2);
}

TEST(StoreHelpersTest, SoftDeleteLeavesTombstone) {
    BalanceTest::MemoryStore store;
    store.table(EntityType::Contacts).bulkUpsert({BalanceTest::contactRecord(1, "Ann", 1000)});

    EXPECT_TRUE(softDelete(store, EntityType::Contacts, 1, "device-b"));
    auto row = store.table(EntityType::Contacts).getById(1);
    ASSERT_TRUE(row.has_value());
    EXPECT_TRUE(row->isDeleted());
    EXPECT_EQ(row->deviceId, "device-b");

    EXPECT_FALSE(softDelete(store, EntityType::Contacts, 99, "device-b"));
}

TEST(StoreHelpersTest, LoadPreferencesDefaultsWhenMissing) {
    BalanceTest::MemoryStore store;
    auto prefs = loadPreferences(store);
    EXPECT_TRUE(prefs.deviceId.empty());

    BalanceTest::initPreferences(store, "device-a");
    EXPECT_EQ(loadPreferences(store).deviceId, "device-a");
}

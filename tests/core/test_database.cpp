// test_database.cpp — SQLite wrapper and migrations

#include <gtest/gtest.h>
#include "balance/Database.h"
#include "balance/Types.h"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;
using namespace Balance;

class DatabaseTest : public ::testing::Test {
protected:
    std::string testDbPath;

    void SetUp() override {
        testDbPath = (fs::temp_directory_path() /
                      ("bl_test_db_" + std::to_string(std::rand()) + ".db")).string();
    }

    void TearDown() override {
        fs::remove(testDbPath);
        fs::remove(testDbPath + "-journal");
    }
};

TEST_F(DatabaseTest, CreateAndOpenDatabase) {
    {
        Database db(testDbPath);
        EXPECT_TRUE(fs::exists(testDbPath));
    }
    // Closed on scope exit, file stays
    EXPECT_TRUE(fs::exists(testDbPath));
}

TEST_F(DatabaseTest, InitializeSetsSchemaVersion) {
    Database db(testDbPath);
    EXPECT_EQ(db.schemaVersion(), 0);
    db.initialize();
    EXPECT_GE(db.schemaVersion(), 1);
}

TEST_F(DatabaseTest, InitializeTwiceIsHarmless) {
    Database db(testDbPath);
    db.initialize();
    int version = db.schemaVersion();
    db.initialize();
    EXPECT_EQ(db.schemaVersion(), version);
}

TEST_F(DatabaseTest, TablesCreated) {
    Database db(testDbPath);
    db.initialize();

    auto tables = db.query<std::string>(
        "SELECT name FROM sqlite_master WHERE type='table' ORDER BY name",
        [](sqlite3_stmt* stmt) { return Database::getString(stmt, 0); }
    );

    auto hasTable = [&tables](const std::string& name) {
        return std::find(tables.begin(), tables.end(), name) != tables.end();
    };

    EXPECT_TRUE(hasTable("schema_version"));
    EXPECT_TRUE(hasTable("user_preferences"));
    for (EntityType type : BACKUP_ENTITIES) {
        EXPECT_TRUE(hasTable(entityTableName(type))) << entityTableName(type);
    }
}

TEST_F(DatabaseTest, TransactionCommit) {
    Database db(testDbPath);
    db.initialize();

    {
        Database::Transaction tx(db);
        db.execute("INSERT INTO user_preferences (id, data) VALUES (?, ?)", "tx_key", "{}");
        tx.commit();
    }

    auto value = db.queryOne<std::string>(
        "SELECT data FROM user_preferences WHERE id = ?",
        [](sqlite3_stmt* stmt) { return Database::getString(stmt, 0); },
        "tx_key"
    );

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "{}");
}

TEST_F(DatabaseTest, TransactionRollsBackOnScopeExit) {
    Database db(testDbPath);
    db.initialize();

    {
        Database::Transaction tx(db);
        db.execute("INSERT INTO user_preferences (id, data) VALUES (?, ?)", "rollback_key", "{}");
    }

    EXPECT_EQ(db.queryScalar("SELECT COUNT(*) FROM user_preferences WHERE id = ?", "rollback_key"), 0);
}

TEST_F(DatabaseTest, NullableColumns) {
    Database db(testDbPath);
    db.initialize();

    std::optional<int64_t> none;
    std::optional<int64_t> deleted = 42;
    db.execute("INSERT INTO contacts (id, updated_at, device_id, deleted_at, data) VALUES (?, ?, ?, ?, ?)",
               int64_t{1}, int64_t{10}, "d", none, "{}");
    db.execute("INSERT INTO contacts (id, updated_at, device_id, deleted_at, data) VALUES (?, ?, ?, ?, ?)",
               int64_t{2}, int64_t{10}, "d", deleted, "{}");

    auto values = db.query<std::optional<int64_t>>(
        "SELECT deleted_at FROM contacts ORDER BY id",
        [](sqlite3_stmt* stmt) { return Database::getInt64Opt(stmt, 0); }
    );

    ASSERT_EQ(values.size(), 2u);
    EXPECT_FALSE(values[0].has_value());
    EXPECT_EQ(values[1], 42);
}

TEST_F(DatabaseTest, BadSqlThrowsStoreError) {
    Database db(testDbPath);
    db.initialize();

    EXPECT_THROW(db.execute("INSERT INTO no_such_table VALUES (1)"), DatabaseException);
    EXPECT_THROW(db.queryScalar("SELECT * FROM no_such_table"), StoreError);
}

TEST(DatabaseOpenTest, UnopenablePathThrows) {
    EXPECT_THROW(Database("/nonexistent-dir/for/sure/db.sqlite"), DatabaseException);
}

TEST_F(DatabaseTest, RecordRowsUpsertAndFilter) {
    Database db(testDbPath);
    db.initialize();

    db.upsertRows("goals", {
        {1, 100, "device-a", std::nullopt, R"({"id":1})"},
        {2, 300, "device-b", int64_t{300}, R"({"id":2})"}
    });
    db.upsertRows("goals", {{1, 200, "device-b", std::nullopt, R"({"id":1,"v":2})"}});

    EXPECT_EQ(db.countRows("goals"), 2);

    auto all = db.selectRows("goals");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].updatedAt, 200);
    EXPECT_EQ(all[0].data, R"({"id":1,"v":2})");
    EXPECT_EQ(all[1].deletedAt, 300);

    auto since = db.selectRows("goals", 300);
    ASSERT_EQ(since.size(), 1u);
    EXPECT_EQ(since[0].id, 2);

    EXPECT_FALSE(db.selectRow("goals", 9).has_value());

    db.clearTable("goals");
    EXPECT_EQ(db.countRows("goals"), 0);
}

TEST_F(DatabaseTest, FailedUpsertWritesNothing) {
    Database db(testDbPath);
    db.initialize();
    db.execute("CREATE TRIGGER reject_big BEFORE INSERT ON goals WHEN NEW.id > 10 "
               "BEGIN SELECT RAISE(ABORT, 'too big'); END");

    EXPECT_THROW(db.upsertRows("goals", {
        {1, 100, "device-a", std::nullopt, "{}"},
        {11, 100, "device-a", std::nullopt, "{}"}
    }), DatabaseException);
    EXPECT_EQ(db.countRows("goals"), 0);
}

TEST_F(DatabaseTest, TableNamesAreChecked) {
    Database db(testDbPath);
    db.initialize();
    EXPECT_THROW(db.selectRows("goals; DROP TABLE goals"), DatabaseException);
    EXPECT_THROW(db.clearTable(""), DatabaseException);
}

TEST_F(DatabaseTest, DocumentsByKey) {
    Database db(testDbPath);
    db.initialize();

    EXPECT_FALSE(db.selectDocument("prefs").has_value());
    db.putDocument("prefs", R"({"id":"prefs"})");
    db.putDocument("prefs", R"({"id":"prefs","theme":"dark"})");

    EXPECT_EQ(db.selectDocument("prefs"), std::string(R"({"id":"prefs","theme":"dark"})"));
    EXPECT_EQ(db.selectDocuments().size(), 1u);

    db.clearDocuments();
    EXPECT_TRUE(db.selectDocuments().empty());
}

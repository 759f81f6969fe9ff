#include "balance/Database.h"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <array>

namespace Balance {

struct Migration {
    int version;
    const char* description;
    const char* sql;
};

// ═══════════════════════════════════════════════════════════
// Schema migrations
// Every syncable table stores the sync fields as columns and the
// full record JSON in `data`.
// ═══════════════════════════════════════════════════════════

#define BL_RECORD_TABLE(name) \
    "CREATE TABLE IF NOT EXISTS " name " (\n" \
    "    id INTEGER PRIMARY KEY,\n" \
    "    updated_at INTEGER NOT NULL,\n" \
    "    device_id TEXT NOT NULL,\n" \
    "    deleted_at INTEGER,\n" \
    "    data TEXT NOT NULL\n" \
    ");\n" \
    "CREATE INDEX IF NOT EXISTS idx_" name "_updated ON " name "(updated_at);\n"

static const std::array MIGRATIONS = {
    Migration{1, "Initial schema",
        "CREATE TABLE IF NOT EXISTS schema_version (\n"
        "    version INTEGER PRIMARY KEY,\n"
        "    applied_at INTEGER DEFAULT (strftime('%s', 'now')),\n"
        "    description TEXT\n"
        ");\n"
        BL_RECORD_TABLE("contacts")
        BL_RECORD_TABLE("check_ins")
        BL_RECORD_TABLE("life_areas")
        BL_RECORD_TABLE("activities")
        BL_RECORD_TABLE("household_tasks")
        BL_RECORD_TABLE("goals")
        BL_RECORD_TABLE("date_nights")
        BL_RECORD_TABLE("date_night_ideas")
        BL_RECORD_TABLE("saved_places")
        BL_RECORD_TABLE("snoozed_items")
        "CREATE TABLE IF NOT EXISTS user_preferences (\n"
        "    id TEXT PRIMARY KEY,\n"
        "    data TEXT NOT NULL\n"
        ");\n"
    },
};

#undef BL_RECORD_TABLE

int Database::getCurrentVersion() {
    auto result = queryOne<int>(
        "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name='schema_version'",
        [](sqlite3_stmt* stmt) { return getInt(stmt, 0); }
    );

    if (!result || *result == 0) {
        return 0;
    }

    auto version = queryOne<int>(
        "SELECT MAX(version) FROM schema_version",
        [](sqlite3_stmt* stmt) {
            if (isNull(stmt, 0)) return 0;
            return getInt(stmt, 0);
        }
    );

    return version.value_or(0);
}

void Database::applyMigrations() {
    int currentVersion = getCurrentVersion();
    spdlog::info("Database version: {}, latest: {}", currentVersion, MIGRATIONS.size());

    for (const auto& migration : MIGRATIONS) {
        if (migration.version <= currentVersion) {
            continue;
        }

        spdlog::info("Applying migration {}: {}", migration.version, migration.description);

        Transaction tx(*this);
        char* errMsg = nullptr;
        int rc = sqlite3_exec(m_db, migration.sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            spdlog::error("Migration {} failed: {}", migration.version, error);
            throw DatabaseException("Migration failed: " + error);
        }

        execute(
            "INSERT INTO schema_version (version, description) VALUES (?, ?)",
            migration.version, migration.description
        );
        tx.commit();

        spdlog::info("Migration {} completed", migration.version);
    }

    spdlog::info("Database schema is up to date (version {})", MIGRATIONS.size());
}

} // namespace Balance

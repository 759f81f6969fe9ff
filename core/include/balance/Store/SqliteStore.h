#pragma once

#include "Store.h"
#include "../Database.h"
#include <map>
#include <memory>

namespace Balance {

/// LocalStore over the SQLite schema in Migrations.cpp
class BL_API SqliteStore : public LocalStore {
public:
    /// Opens (or creates) the database and applies migrations
    explicit SqliteStore(const std::string& dbPath);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    RecordStore& table(EntityType type) override;
    PreferencesStore& preferences() override;

    Database& database() { return *m_db; }

private:
    class Table;
    class Preferences;

    std::unique_ptr<Database> m_db;
    std::map<EntityType, std::unique_ptr<Table>> m_tables;
    std::unique_ptr<Preferences> m_prefs;
};

} // namespace Balance

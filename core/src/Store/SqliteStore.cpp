#include "balance/Store/SqliteStore.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>

namespace Balance {

namespace {

SyncableRecord toRecord(const StoredRow& row, const std::string& table) {
    json body = json::parse(row.data, nullptr, false);
    if (body.is_discarded()) {
        throw StoreError("Corrupt record data in database: " + table + " row " + std::to_string(row.id));
    }
    try {
        return SyncableRecord::fromJson(body);
    } catch (const ValidationError& e) {
        throw StoreError("Corrupt record data in database: " + table + " row " +
                         std::to_string(row.id) + ": " + e.what());
    }
}

StoredRow toRow(const SyncableRecord& record) {
    return {record.id, record.updatedAt, record.deviceId, record.deletedAt, record.body.dump()};
}

json toDocument(const std::string& data) {
    json value = json::parse(data, nullptr, false);
    if (value.is_discarded()) {
        throw StoreError("Corrupt preferences data in database");
    }
    return value;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// Table
// ═══════════════════════════════════════════════════════════

class SqliteStore::Table : public RecordStore {
public:
    Table(Database& db, EntityType type)
        : m_db(db), m_name(entityTableName(type)) {}

    std::vector<SyncableRecord> queryUpdatedSince(int64_t timestamp) override {
        return toRecords(m_db.selectRows(m_name, timestamp));
    }

    std::vector<SyncableRecord> getAll() override {
        return toRecords(m_db.selectRows(m_name));
    }

    std::optional<SyncableRecord> getById(int64_t id) override {
        auto row = m_db.selectRow(m_name, id);
        if (!row) {
            return std::nullopt;
        }
        return toRecord(*row, m_name);
    }

    void bulkUpsert(const std::vector<SyncableRecord>& records) override {
        std::vector<StoredRow> rows;
        rows.reserve(records.size());
        std::transform(records.begin(), records.end(), std::back_inserter(rows), toRow);
        m_db.upsertRows(m_name, rows);

        if (!rows.empty()) {
            spdlog::debug("SqliteStore: upserted {} rows into {}", rows.size(), m_name);
        }
    }

    void clear() override {
        m_db.clearTable(m_name);
    }

private:
    std::vector<SyncableRecord> toRecords(const std::vector<StoredRow>& rows) const {
        std::vector<SyncableRecord> records;
        records.reserve(rows.size());
        for (const auto& row : rows) {
            records.push_back(toRecord(row, m_name));
        }
        return records;
    }

    Database& m_db;
    std::string m_name;
};

// ═══════════════════════════════════════════════════════════
// Preferences
// ═══════════════════════════════════════════════════════════

class SqliteStore::Preferences : public PreferencesStore {
public:
    explicit Preferences(Database& db) : m_db(db) {}

    std::optional<json> get(const std::string& key) override {
        auto data = m_db.selectDocument(key);
        if (!data) {
            return std::nullopt;
        }
        return toDocument(*data);
    }

    void put(const json& record) override {
        if (!record.is_object() || !record.contains("id") || !record["id"].is_string()) {
            throw StoreError("Preferences record requires a string \"id\"");
        }
        m_db.putDocument(record["id"].get<std::string>(), record.dump());
    }

    std::vector<json> getAll() override {
        std::vector<json> documents;
        for (const auto& data : m_db.selectDocuments()) {
            documents.push_back(toDocument(data));
        }
        return documents;
    }

    void clear() override {
        m_db.clearDocuments();
    }

private:
    Database& m_db;
};

// ═══════════════════════════════════════════════════════════
// SqliteStore
// ═══════════════════════════════════════════════════════════

SqliteStore::SqliteStore(const std::string& dbPath)
    : m_db(std::make_unique<Database>(dbPath)) {
    m_db->initialize();

    for (EntityType type : BACKUP_ENTITIES) {
        if (hasSyncFields(type)) {
            m_tables.emplace(type, std::make_unique<Table>(*m_db, type));
        }
    }
    m_prefs = std::make_unique<Preferences>(*m_db);
}

SqliteStore::~SqliteStore() = default;

RecordStore& SqliteStore::table(EntityType type) {
    auto it = m_tables.find(type);
    if (it == m_tables.end()) {
        throw StoreError(std::string("No record table for ") + entityTypeToString(type));
    }
    return *it->second;
}

PreferencesStore& SqliteStore::preferences() {
    return *m_prefs;
}

} // namespace Balance

#include "balance/Database.h"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <utility>

namespace Balance {

namespace {

constexpr const char* kRowColumns = "id, updated_at, device_id, deleted_at, data";

/// Table names are spliced into SQL, so only [a-z_] is accepted
const std::string& checkedTable(const std::string& table) {
    bool valid = !table.empty() && std::all_of(table.begin(), table.end(), [](unsigned char c) {
        return std::islower(c) || c == '_';
    });
    if (!valid) {
        throw DatabaseException("Invalid table name: \"" + table + "\"");
    }
    return table;
}

} // anonymous namespace

Database::Database(const std::string& dbPath) : m_dbPath(dbPath) {
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw DatabaseException("Cannot open store " + dbPath + ": " + reason);
    }

    // No WAL side files next to the store
    execute("PRAGMA journal_mode = DELETE");
    execute("PRAGMA busy_timeout = 5000");
    execute("PRAGMA synchronous = NORMAL");

    spdlog::info("Database: opened {}", dbPath);
}

Database::~Database() {
    if (m_db) {
        sqlite3_close(m_db);
        spdlog::debug("Database: closed {}", m_dbPath);
    }
}

Database::Database(Database&& other) noexcept
    : m_db(other.m_db), m_dbPath(std::move(other.m_dbPath)) {
    other.m_db = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        if (m_db) {
            sqlite3_close(m_db);
        }
        m_db = std::exchange(other.m_db, nullptr);
        m_dbPath = std::move(other.m_dbPath);
    }
    return *this;
}

void Database::initialize() {
    applyMigrations();
}

int Database::schemaVersion() {
    return getCurrentVersion();
}

// ═══════════════════════════════════════════════════════════
// Record tables
// ═══════════════════════════════════════════════════════════

StoredRow Database::readRow(sqlite3_stmt* stmt) {
    StoredRow row;
    row.id = getInt64(stmt, 0);
    row.updatedAt = getInt64(stmt, 1);
    row.deviceId = getString(stmt, 2);
    row.deletedAt = getInt64Opt(stmt, 3);
    row.data = getString(stmt, 4);
    return row;
}

std::vector<StoredRow> Database::selectRows(const std::string& table,
                                            std::optional<int64_t> updatedSince) {
    std::string sql = std::string("SELECT ") + kRowColumns + " FROM " + checkedTable(table);
    if (updatedSince) {
        return query<StoredRow>(sql + " WHERE updated_at >= ? ORDER BY id", readRow, *updatedSince);
    }
    return query<StoredRow>(sql + " ORDER BY id", readRow);
}

std::optional<StoredRow> Database::selectRow(const std::string& table, int64_t id) {
    return queryOne<StoredRow>(
        std::string("SELECT ") + kRowColumns + " FROM " + checkedTable(table) + " WHERE id = ?",
        readRow, id);
}

void Database::upsertRows(const std::string& table, const std::vector<StoredRow>& rows) {
    if (rows.empty()) {
        return;
    }

    Transaction tx(*this);
    Statement stmt(*this, "INSERT OR REPLACE INTO " + checkedTable(table) +
                          " (" + kRowColumns + ") VALUES (?, ?, ?, ?, ?)");
    for (const auto& row : rows) {
        sqlite3_reset(stmt.get());
        sqlite3_clear_bindings(stmt.get());
        bindAll(stmt.get(), 1, row.id, row.updatedAt, row.deviceId, row.deletedAt, row.data);
        step(stmt.get());
    }
    tx.commit();
}

void Database::clearTable(const std::string& table) {
    execute("DELETE FROM " + checkedTable(table));
}

int64_t Database::countRows(const std::string& table) {
    return queryScalar("SELECT COUNT(*) FROM " + checkedTable(table));
}

// ═══════════════════════════════════════════════════════════
// Keyed documents
// ═══════════════════════════════════════════════════════════

std::optional<std::string> Database::selectDocument(const std::string& key) {
    return queryOne<std::string>("SELECT data FROM user_preferences WHERE id = ?",
                                 [](sqlite3_stmt* stmt) { return getString(stmt, 0); }, key);
}

std::vector<std::string> Database::selectDocuments() {
    return query<std::string>("SELECT data FROM user_preferences ORDER BY id",
                              [](sqlite3_stmt* stmt) { return getString(stmt, 0); });
}

void Database::putDocument(const std::string& key, const std::string& data) {
    execute("INSERT OR REPLACE INTO user_preferences (id, data) VALUES (?, ?)", key, data);
}

void Database::clearDocuments() {
    execute("DELETE FROM user_preferences");
}

// ═══════════════════════════════════════════════════════════
// Raw SQL
// ═══════════════════════════════════════════════════════════

void Database::fail(const std::string& what) const {
    throw DatabaseException(what + ": " + sqlite3_errmsg(m_db));
}

void Database::execute(const std::string& sql) {
    char* errorMsg = nullptr;
    if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errorMsg) != SQLITE_OK) {
        std::string reason = errorMsg ? errorMsg : sqlite3_errmsg(m_db);
        sqlite3_free(errorMsg);
        throw DatabaseException("SQL failed: " + reason + " [" + sql + "]");
    }
}

sqlite3_stmt* Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Cannot prepare [" + sql + "]");
    }
    return stmt;
}

void Database::step(sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        fail("Statement failed");
    }
}

bool Database::stepRow(sqlite3_stmt* stmt) {
    switch (sqlite3_step(stmt)) {
        case SQLITE_ROW:  return true;
        case SQLITE_DONE: return false;
        default:          fail("Row step failed");
    }
}

void Database::beginTransaction() {
    execute("BEGIN IMMEDIATE");
}

void Database::commit() {
    execute("COMMIT");
}

void Database::rollback() {
    execute("ROLLBACK");
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, int value) {
    sqlite3_bind_int(stmt, index, value);
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, const char* value) {
    if (value) {
        sqlite3_bind_text(stmt, index, value, -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void Database::bindParameter(sqlite3_stmt* stmt, int index, const std::optional<int64_t>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

int Database::getInt(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int(stmt, col);
}

int64_t Database::getInt64(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_int64(stmt, col);
}

std::string Database::getString(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    if (!text) {
        return {};
    }
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

std::optional<int64_t> Database::getInt64Opt(sqlite3_stmt* stmt, int col) {
    if (isNull(stmt, col)) {
        return std::nullopt;
    }
    return getInt64(stmt, col);
}

bool Database::isNull(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

// ═══════════════════════════════════════════════════════════
// Transaction
// ═══════════════════════════════════════════════════════════

Database::Transaction::Transaction(Database& db) : m_db(&db) {
    m_db->beginTransaction();
}

Database::Transaction::~Transaction() {
    if (m_finished) {
        return;
    }
    try {
        m_db->rollback();
    } catch (const DatabaseException& e) {
        spdlog::warn("Database: rollback on scope exit failed: {}", e.what());
    }
}

void Database::Transaction::commit() {
    if (!m_finished) {
        m_db->commit();
        m_finished = true;
    }
}

void Database::Transaction::rollback() {
    if (!m_finished) {
        m_db->rollback();
        m_finished = true;
    }
}

} // namespace Balance

#pragma once

#include "export.h"
#include "Errors.h"
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <memory>
#include <type_traits>

#include <sqlite3.h>

namespace Balance {

/// SQLite failure. Surfaces to callers as a StoreError.
class BL_API DatabaseException : public StoreError {
public:
    explicit DatabaseException(const std::string& message)
        : StoreError(message) {}
};

/// One row of a record table: sync columns plus the record JSON
struct StoredRow {
    int64_t id = 0;
    int64_t updatedAt = 0;
    std::string deviceId;
    std::optional<int64_t> deletedAt;
    std::string data;
};

/// RAII wrapper around a SQLite connection
class BL_API Database {
public:
    /// @param dbPath file path or ":memory:"
    explicit Database(const std::string& dbPath);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&&) noexcept;
    Database& operator=(Database&&) noexcept;

    /// Apply pending schema migrations
    void initialize();

    /// Current schema version (0 for a fresh file)
    int schemaVersion();

    const std::string& path() const { return m_dbPath; }

    // ═══════════════════════════════════════════════════════════
    // Record tables (id, updated_at, device_id, deleted_at, data)
    // ═══════════════════════════════════════════════════════════

    /// Rows ordered by id; with updatedSince only rows where
    /// updated_at >= updatedSince
    std::vector<StoredRow> selectRows(const std::string& table,
                                      std::optional<int64_t> updatedSince = std::nullopt);

    std::optional<StoredRow> selectRow(const std::string& table, int64_t id);

    /// Insert or replace by id, all rows in one transaction
    void upsertRows(const std::string& table, const std::vector<StoredRow>& rows);

    void clearTable(const std::string& table);

    int64_t countRows(const std::string& table);

    // ═══════════════════════════════════════════════════════════
    // Keyed documents (user_preferences)
    // ═══════════════════════════════════════════════════════════

    std::optional<std::string> selectDocument(const std::string& key);
    std::vector<std::string> selectDocuments();
    void putDocument(const std::string& key, const std::string& data);
    void clearDocuments();

    // ═══════════════════════════════════════════════════════════
    // Raw SQL
    // ═══════════════════════════════════════════════════════════

    /// Execute SQL without results
    void execute(const std::string& sql);

    /// Execute SQL with bound parameters
    template<typename... Args>
    void execute(const std::string& sql, Args&&... args) {
        Statement stmt(*this, sql);
        bindAll(stmt.get(), 1, std::forward<Args>(args)...);
        step(stmt.get());
    }

    /// Query with a row mapper
    template<typename T, typename Mapper, typename... Args>
    std::vector<T> query(const std::string& sql, Mapper mapper, Args&&... args) {
        Statement stmt(*this, sql);
        bindAll(stmt.get(), 1, std::forward<Args>(args)...);

        std::vector<T> results;
        while (stepRow(stmt.get())) {
            results.push_back(mapper(stmt.get()));
        }
        return results;
    }

    /// Query a single row
    template<typename T, typename Mapper, typename... Args>
    std::optional<T> queryOne(const std::string& sql, Mapper mapper, Args&&... args) {
        Statement stmt(*this, sql);
        bindAll(stmt.get(), 1, std::forward<Args>(args)...);

        std::optional<T> result;
        if (stepRow(stmt.get())) {
            result = mapper(stmt.get());
        }
        return result;
    }

    /// Query a scalar (int64)
    template<typename... Args>
    int64_t queryScalar(const std::string& sql, Args&&... args) {
        Statement stmt(*this, sql);
        bindAll(stmt.get(), 1, std::forward<Args>(args)...);
        return stepRow(stmt.get()) ? getInt64(stmt.get(), 0) : 0;
    }

    void beginTransaction();
    void commit();
    void rollback();

    /// RAII transaction, rolls back unless committed
    class BL_API Transaction {
    public:
        explicit Transaction(Database& db);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        void rollback();

    private:
        Database* m_db;
        bool m_finished = false;
    };

    /// Column readers
    static int getInt(sqlite3_stmt* stmt, int col);
    static int64_t getInt64(sqlite3_stmt* stmt, int col);
    static std::string getString(sqlite3_stmt* stmt, int col);
    static std::optional<int64_t> getInt64Opt(sqlite3_stmt* stmt, int col);
    static bool isNull(sqlite3_stmt* stmt, int col);

private:
    sqlite3* m_db = nullptr;
    std::string m_dbPath;

    /// Prepared statement, finalized on scope exit (also when a step throws)
    class Statement {
    public:
        Statement(Database& db, const std::string& sql) : m_stmt(db.prepare(sql)) {}
        ~Statement() { sqlite3_finalize(m_stmt); }
        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;
        sqlite3_stmt* get() const { return m_stmt; }
    private:
        sqlite3_stmt* m_stmt;
    };

    // Migrations
    void applyMigrations();
    int getCurrentVersion();

    /// Throws DatabaseException with the connection's error text
    [[noreturn]] void fail(const std::string& what) const;

    sqlite3_stmt* prepare(const std::string& sql);
    void step(sqlite3_stmt* stmt);
    bool stepRow(sqlite3_stmt* stmt);

    static StoredRow readRow(sqlite3_stmt* stmt);

    // Parameter binding
    void bindParameter(sqlite3_stmt* stmt, int index, int value);
    void bindParameter(sqlite3_stmt* stmt, int index, int64_t value);
    // int64_t is long on LP64 Linux, long long elsewhere
    template<typename T>
    std::enable_if_t<
        std::is_same_v<T, long long> && !std::is_same_v<int64_t, long long>,
        void
    > bindParameter(sqlite3_stmt* stmt, int index, T value) {
        sqlite3_bind_int64(stmt, index, static_cast<int64_t>(value));
    }
    void bindParameter(sqlite3_stmt* stmt, int index, const std::string& value);
    void bindParameter(sqlite3_stmt* stmt, int index, const char* value);
    void bindParameter(sqlite3_stmt* stmt, int index, const std::optional<int64_t>& value);

    template<typename T, typename... Rest>
    void bindAll(sqlite3_stmt* stmt, int index, T&& first, Rest&&... rest) {
        bindParameter(stmt, index, std::forward<T>(first));
        if constexpr (sizeof...(rest) > 0) {
            bindAll(stmt, index + 1, std::forward<Rest>(rest)...);
        }
    }

    void bindAll(sqlite3_stmt*, int) {}
};

} // namespace Balance

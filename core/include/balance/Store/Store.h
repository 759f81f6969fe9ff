#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Balance {

/// One table of syncable records
class BL_API RecordStore {
public:
    virtual ~RecordStore() = default;

    /// Records with updatedAt >= timestamp (inclusive)
    virtual std::vector<SyncableRecord> queryUpdatedSince(int64_t timestamp) = 0;

    virtual std::vector<SyncableRecord> getAll() = 0;

    virtual std::optional<SyncableRecord> getById(int64_t id) = 0;

    /// Insert or replace by id, as a single transaction
    virtual void bulkUpsert(const std::vector<SyncableRecord>& records) = 0;

    /// Remove every row (replace-all import only)
    virtual void clear() = 0;
};

/// Key/value rows without sync fields (the preferences singleton)
class BL_API PreferencesStore {
public:
    virtual ~PreferencesStore() = default;

    virtual std::optional<json> get(const std::string& key) = 0;

    /// Insert or replace by the record's "id" field
    virtual void put(const json& record) = 0;

    virtual std::vector<json> getAll() = 0;

    virtual void clear() = 0;
};

/// Every table of one device
class BL_API LocalStore {
public:
    virtual ~LocalStore() = default;

    /// @throws StoreError for UserPreferences
    virtual RecordStore& table(EntityType type) = 0;

    virtual PreferencesStore& preferences() = 0;
};

// ═══════════════════════════════════════════════════════════
// Typed helpers
// ═══════════════════════════════════════════════════════════

/// Current wall clock in ms since epoch
BL_API int64_t nowMillis();

/// Stamp updatedAt/deviceId and upsert.
/// Assigns the next free id when the entity has none.
/// @return the stored record
BL_API SyncableRecord saveEntity(LocalStore& store, Entity entity, const std::string& deviceId);

/// Turn a row into a tombstone (re-stamped)
/// @return false if no row with that id exists
BL_API bool softDelete(LocalStore& store, EntityType type, int64_t id,
                       const std::string& deviceId);

/// Read the preferences singleton, defaulted when missing
BL_API UserPreferences loadPreferences(LocalStore& store);

BL_API void savePreferences(LocalStore& store, const UserPreferences& prefs);

} // namespace Balance

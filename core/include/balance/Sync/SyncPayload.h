#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Types.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Balance {

constexpr int SYNC_PAYLOAD_VERSION = 1;
constexpr int BACKUP_VERSION = 1;
constexpr const char* BACKUP_FORMAT = "balance-backup";

// ═══════════════════════════════════════════════════════════
// Envelopes
// ═══════════════════════════════════════════════════════════

/// One table's rows. Records stay opaque here and are decoded
/// against their schema by the merge engine.
struct BL_API EntityPayload {
    EntityType entityType = EntityType::Contacts;
    int64_t count = 0;
    std::vector<json> records;

    json toJson() const;
};

/// Delta or full set of syncable tables sent to the partner
struct BL_API SyncPayload {
    int version = SYNC_PAYLOAD_VERSION;
    int64_t exportedAt = 0;
    std::string deviceId;
    std::optional<int64_t> lastSyncTimestamp;
    std::vector<EntityPayload> entities;
    int64_t totalRecords = 0;

    json toJson() const;

    /// @throws ValidationError on a structural problem, an unknown
    ///         entity type or a device-local entity type
    static SyncPayload fromJson(const json& j);
};

/// Complete snapshot written to a backup file
struct BL_API BackupFile {
    int version = BACKUP_VERSION;
    int64_t exportedAt = 0;
    std::vector<EntityPayload> entities;
    int64_t totalRecords = 0;

    json toJson() const;

    /// Validate a parsed backup document
    /// @throws ValidationError with a user-facing message
    static BackupFile fromJson(const json& j);
};

/// Shown to the user before choosing an import mode
struct BL_API BackupSummary {
    int64_t exportedAt = 0;
    int version = BACKUP_VERSION;
    std::map<std::string, int64_t> entities;    // wire name -> count
    int64_t totalRecords = 0;

    json toJson() const;
};

BL_API BackupSummary parseBackupSummary(const BackupFile& backup);

// ═══════════════════════════════════════════════════════════
// Merge results
// ═══════════════════════════════════════════════════════════

struct BL_API EntityMergeCounts {
    int64_t newRecords = 0;
    int64_t remoteWins = 0;
    int64_t localWins = 0;
    int64_t equal = 0;

    json toJson() const;
};

struct MergeFailure {
    EntityType entityType = EntityType::Contacts;
    std::string message;
};

struct BL_API MergeSummary {
    int64_t totalReceived = 0;
    int64_t totalSent = 0;
    int64_t totalUpserted = 0;
    int64_t totalNew = 0;
    int64_t totalRemoteWins = 0;
    int64_t totalLocalWins = 0;
    int64_t totalEqual = 0;
    std::map<EntityType, EntityMergeCounts> perEntity;
    std::vector<MergeFailure> failures;

    bool hasFailures() const { return !failures.empty(); }

    json toJson() const;
};

enum class ImportMode : int32_t {
    Replace = 0,
    Merge = 1
};

BL_API const char* importModeToString(ImportMode mode);

struct BL_API ImportResult {
    ImportMode mode = ImportMode::Merge;
    int64_t totalImported = 0;
    std::map<EntityType, EntityMergeCounts> perEntity;  // Merge mode only
    std::vector<MergeFailure> failures;

    json toJson() const;
};

} // namespace Balance

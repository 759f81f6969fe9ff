#pragma once

#include "../export.h"
#include "../Store/Store.h"
#include "SyncPayload.h"
#include <optional>
#include <vector>

namespace Balance {

// ═══════════════════════════════════════════════════════════
// Last-write-wins primitives
// ═══════════════════════════════════════════════════════════

enum class MergeOutcome : int32_t {
    New = 0,            // No local row with this id
    RemoteWins = 1,     // Remote updatedAt is greater
    LocalWins = 2,      // Local updatedAt is greater
    Equal = 3           // Same updatedAt, nothing to write
};

struct MergeResult {
    SyncableRecord record;      // Winner
    MergeOutcome outcome = MergeOutcome::New;
};

/// Compare one incoming record with the local row of the same id
BL_API MergeResult mergeRecord(const std::optional<SyncableRecord>& local,
                               const SyncableRecord& remote);

struct BatchMergeResult {
    std::vector<SyncableRecord> toUpsert;
    EntityMergeCounts counts;
};

/// Merge a batch of incoming records against the local rows of one table.
/// A later incoming record with a repeated id is compared against the
/// winner of the earlier one.
BL_API BatchMergeResult mergeRecordBatch(const std::vector<SyncableRecord>& localRecords,
                                         const std::vector<SyncableRecord>& remoteRecords);

// ═══════════════════════════════════════════════════════════
// MergeEngine — applies payloads to a LocalStore
// ═══════════════════════════════════════════════════════════

class BL_API MergeEngine {
public:
    explicit MergeEngine(LocalStore& store);

    /// Merge a partner's sync payload.
    /// Every record is validated before the first write. Each entity type
    /// is written as its own transaction; a failing one is reported in
    /// MergeSummary::failures and the rest continue.
    /// @throws ValidationError if any record does not match its schema
    MergeSummary mergePayload(const SyncPayload& payload);

    /// Same policy for backup entities. The preferences row is only
    /// created when none exists locally.
    MergeSummary mergeEntities(const std::vector<EntityPayload>& entities);

    /// Clear every backup table, then insert all rows without comparison
    /// @throws ValidationError before clearing if any record is malformed
    ImportResult replaceAll(const std::vector<EntityPayload>& entities);

private:
    LocalStore& m_store;
};

/// Decode an entity payload's records and check them against the table schema
/// @throws ValidationError naming the entity type and the offending field
BL_API std::vector<SyncableRecord> decodeRecords(const EntityPayload& payload);

} // namespace Balance

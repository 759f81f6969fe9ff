#include "balance/Sync/MergeEngine.h"
#include "balance/Errors.h"
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace Balance {

// ═══════════════════════════════════════════════════════════
// Primitives
// ═══════════════════════════════════════════════════════════

MergeResult mergeRecord(const std::optional<SyncableRecord>& local,
                        const SyncableRecord& remote) {
    if (!local) {
        return {remote, MergeOutcome::New};
    }
    if (local->updatedAt == remote.updatedAt) {
        return {*local, MergeOutcome::Equal};
    }
    if (remote.updatedAt > local->updatedAt) {
        return {remote, MergeOutcome::RemoteWins};
    }
    return {*local, MergeOutcome::LocalWins};
}

BatchMergeResult mergeRecordBatch(const std::vector<SyncableRecord>& localRecords,
                                  const std::vector<SyncableRecord>& remoteRecords) {
    std::unordered_map<int64_t, SyncableRecord> current;
    for (const auto& record : localRecords) {
        current.emplace(record.id, record);
    }

    BatchMergeResult result;
    std::unordered_map<int64_t, size_t> upsertIndex;

    for (const auto& remote : remoteRecords) {
        auto it = current.find(remote.id);
        std::optional<SyncableRecord> local;
        if (it != current.end()) {
            local = it->second;
        }

        MergeResult merged = mergeRecord(local, remote);
        switch (merged.outcome) {
            case MergeOutcome::New:        result.counts.newRecords++; break;
            case MergeOutcome::RemoteWins: result.counts.remoteWins++; break;
            case MergeOutcome::LocalWins:  result.counts.localWins++;  break;
            case MergeOutcome::Equal:      result.counts.equal++;      break;
        }

        if (merged.outcome == MergeOutcome::New || merged.outcome == MergeOutcome::RemoteWins) {
            auto pos = upsertIndex.find(remote.id);
            if (pos != upsertIndex.end()) {
                result.toUpsert[pos->second] = merged.record;
            } else {
                upsertIndex.emplace(remote.id, result.toUpsert.size());
                result.toUpsert.push_back(merged.record);
            }
            current[remote.id] = merged.record;
        }
    }

    return result;
}

std::vector<SyncableRecord> decodeRecords(const EntityPayload& payload) {
    std::vector<SyncableRecord> records;
    records.reserve(payload.records.size());

    const char* name = entityTypeToString(payload.entityType);
    for (const auto& body : payload.records) {
        try {
            entityFromJson(payload.entityType, body);
            records.push_back(SyncableRecord::fromJson(body));
        } catch (const ValidationError& e) {
            throw ValidationError(std::string("Invalid ") + name + " payload: " + e.what());
        }
    }
    return records;
}

// ═══════════════════════════════════════════════════════════
// MergeEngine
// ═══════════════════════════════════════════════════════════

namespace {

struct DecodedEntity {
    EntityType type;
    std::vector<SyncableRecord> records;    // Tables with sync fields
    std::vector<json> preferences;          // UserPreferences rows
};

std::vector<DecodedEntity> decodeAll(const std::vector<EntityPayload>& entities) {
    std::vector<DecodedEntity> decoded;
    decoded.reserve(entities.size());
    for (const auto& ep : entities) {
        DecodedEntity d{ep.entityType, {}, {}};
        if (hasSyncFields(ep.entityType)) {
            d.records = decodeRecords(ep);
        } else {
            for (const auto& row : ep.records) {
                try {
                    UserPreferences::fromJson(row);
                } catch (const ValidationError& e) {
                    throw ValidationError(std::string("Invalid userPreferences payload: ") + e.what());
                }
                json normalized = row;
                if (!normalized.contains("id") || normalized["id"].is_null()) {
                    normalized["id"] = PREFERENCES_KEY;
                }
                d.preferences.push_back(std::move(normalized));
            }
        }
        decoded.push_back(std::move(d));
    }
    return decoded;
}

void addCounts(MergeSummary& summary, EntityType type, const BatchMergeResult& batch) {
    auto& counts = summary.perEntity[type];
    counts.newRecords += batch.counts.newRecords;
    counts.remoteWins += batch.counts.remoteWins;
    counts.localWins += batch.counts.localWins;
    counts.equal += batch.counts.equal;

    summary.totalUpserted += static_cast<int64_t>(batch.toUpsert.size());
    summary.totalNew += batch.counts.newRecords;
    summary.totalRemoteWins += batch.counts.remoteWins;
    summary.totalLocalWins += batch.counts.localWins;
    summary.totalEqual += batch.counts.equal;
}

} // anonymous namespace

MergeEngine::MergeEngine(LocalStore& store) : m_store(store) {}

MergeSummary MergeEngine::mergePayload(const SyncPayload& payload) {
    for (const auto& ep : payload.entities) {
        if (!isSyncable(ep.entityType)) {
            throw ValidationError(std::string("Invalid sync payload: entity type \"") +
                                  entityTypeToString(ep.entityType) + "\" is device-local");
        }
    }

    MergeSummary summary = mergeEntities(payload.entities);
    summary.totalReceived = payload.totalRecords;
    return summary;
}

MergeSummary MergeEngine::mergeEntities(const std::vector<EntityPayload>& entities) {
    auto decoded = decodeAll(entities);

    MergeSummary summary;
    for (const auto& entity : decoded) {
        summary.totalReceived += static_cast<int64_t>(
            hasSyncFields(entity.type) ? entity.records.size() : entity.preferences.size());

        try {
            if (!hasSyncFields(entity.type)) {
                BatchMergeResult batch;
                for (const auto& row : entity.preferences) {
                    const std::string key = row["id"].get<std::string>();
                    if (m_store.preferences().get(key)) {
                        batch.counts.localWins++;
                    } else {
                        m_store.preferences().put(row);
                        batch.counts.newRecords++;
                        summary.totalUpserted++;
                    }
                }
                auto& counts = summary.perEntity[entity.type];
                counts.newRecords += batch.counts.newRecords;
                counts.localWins += batch.counts.localWins;
                summary.totalNew += batch.counts.newRecords;
                summary.totalLocalWins += batch.counts.localWins;
                continue;
            }

            if (entity.records.empty()) {
                continue;
            }

            RecordStore& table = m_store.table(entity.type);
            BatchMergeResult batch = mergeRecordBatch(table.getAll(), entity.records);
            table.bulkUpsert(batch.toUpsert);
            addCounts(summary, entity.type, batch);

            spdlog::info("Merge: {} new={} remote={} local={} equal={}",
                         entityTypeToString(entity.type),
                         batch.counts.newRecords, batch.counts.remoteWins,
                         batch.counts.localWins, batch.counts.equal);
        } catch (const StoreError& e) {
            spdlog::error("Merge: {} failed: {}", entityTypeToString(entity.type), e.what());
            summary.failures.push_back({entity.type, e.what()});
        }
    }

    return summary;
}

ImportResult MergeEngine::replaceAll(const std::vector<EntityPayload>& entities) {
    auto decoded = decodeAll(entities);

    for (EntityType type : BACKUP_ENTITIES) {
        if (hasSyncFields(type)) {
            m_store.table(type).clear();
        } else {
            m_store.preferences().clear();
        }
    }
    spdlog::info("Merge: cleared all tables for replace-all import");

    ImportResult result;
    result.mode = ImportMode::Replace;

    for (const auto& entity : decoded) {
        try {
            if (hasSyncFields(entity.type)) {
                m_store.table(entity.type).bulkUpsert(entity.records);
                result.totalImported += static_cast<int64_t>(entity.records.size());
            } else {
                for (const auto& row : entity.preferences) {
                    m_store.preferences().put(row);
                }
                result.totalImported += static_cast<int64_t>(entity.preferences.size());
            }
        } catch (const StoreError& e) {
            spdlog::error("Merge: replace-all {} failed: {}", entityTypeToString(entity.type), e.what());
            result.failures.push_back({entity.type, e.what()});
        }
    }

    spdlog::info("Merge: replace-all imported {} records", result.totalImported);
    return result;
}

} // namespace Balance

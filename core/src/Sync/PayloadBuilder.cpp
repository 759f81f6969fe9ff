#include "balance/Sync/PayloadBuilder.h"
#include <spdlog/spdlog.h>

namespace Balance {

namespace {

std::vector<json> toJsonRecords(const std::vector<SyncableRecord>& records) {
    std::vector<json> result;
    result.reserve(records.size());
    for (const auto& r : records) {
        result.push_back(r.toJson());
    }
    return result;
}

} // anonymous namespace

SyncPayload buildSyncPayload(LocalStore& store,
                             std::optional<int64_t> since,
                             const std::string& deviceId) {
    SyncPayload payload;
    payload.exportedAt = nowMillis();
    payload.deviceId = deviceId;
    payload.lastSyncTimestamp = since;

    for (EntityType type : SYNCABLE_ENTITIES) {
        RecordStore& table = store.table(type);
        auto records = since ? table.queryUpdatedSince(*since) : table.getAll();

        EntityPayload ep;
        ep.entityType = type;
        ep.count = static_cast<int64_t>(records.size());
        ep.records = toJsonRecords(records);
        payload.totalRecords += ep.count;
        payload.entities.push_back(std::move(ep));
    }

    if (since) {
        spdlog::info("PayloadBuilder: {} records changed since {}", payload.totalRecords, *since);
    } else {
        spdlog::info("PayloadBuilder: full payload with {} records", payload.totalRecords);
    }
    return payload;
}

BackupFile buildBackup(LocalStore& store) {
    BackupFile backup;
    backup.exportedAt = nowMillis();

    for (EntityType type : BACKUP_ENTITIES) {
        EntityPayload ep;
        ep.entityType = type;
        if (hasSyncFields(type)) {
            ep.records = toJsonRecords(store.table(type).getAll());
        } else {
            ep.records = store.preferences().getAll();
        }
        ep.count = static_cast<int64_t>(ep.records.size());
        backup.totalRecords += ep.count;
        backup.entities.push_back(std::move(ep));
    }

    spdlog::info("PayloadBuilder: backup with {} records", backup.totalRecords);
    return backup;
}

} // namespace Balance

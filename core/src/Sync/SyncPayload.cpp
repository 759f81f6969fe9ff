#include "balance/Sync/SyncPayload.h"
#include "balance/Errors.h"

namespace Balance {

namespace {

json entitiesToJson(const std::vector<EntityPayload>& entities) {
    json arr = json::array();
    for (const auto& e : entities) {
        arr.push_back(e.toJson());
    }
    return arr;
}

json failuresToJson(const std::vector<MergeFailure>& failures) {
    json arr = json::array();
    for (const auto& f : failures) {
        arr.push_back({{"entityType", entityTypeToString(f.entityType)}, {"message", f.message}});
    }
    return arr;
}

json perEntityToJson(const std::map<EntityType, EntityMergeCounts>& perEntity) {
    json obj = json::object();
    for (const auto& [type, counts] : perEntity) {
        obj[entityTypeToString(type)] = counts.toJson();
    }
    return obj;
}

std::string versionText(const json& obj) {
    auto it = obj.find("version");
    if (it == obj.end()) {
        return "undefined";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

bool isVersion(const json& obj, int expected) {
    auto it = obj.find("version");
    return it != obj.end() && it->is_number() && it->get<double>() == expected;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// EntityPayload
// ═══════════════════════════════════════════════════════════

json EntityPayload::toJson() const {
    return {
        {"entityType", entityTypeToString(entityType)},
        {"count", count},
        {"records", records}
    };
}

// ═══════════════════════════════════════════════════════════
// SyncPayload
// ═══════════════════════════════════════════════════════════

json SyncPayload::toJson() const {
    json j = {
        {"version", version},
        {"exportedAt", exportedAt},
        {"deviceId", deviceId},
        {"entities", entitiesToJson(entities)},
        {"totalRecords", totalRecords}
    };
    if (lastSyncTimestamp) {
        j["lastSyncTimestamp"] = *lastSyncTimestamp;
    } else {
        j["lastSyncTimestamp"] = nullptr;
    }
    return j;
}

SyncPayload SyncPayload::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Invalid sync payload: not a JSON object");
    }
    if (!isVersion(j, SYNC_PAYLOAD_VERSION)) {
        throw ValidationError("Unsupported sync payload version: " + versionText(j));
    }

    SyncPayload payload;
    auto exportedAt = j.find("exportedAt");
    if (exportedAt == j.end() || !exportedAt->is_number()) {
        throw ValidationError("Invalid sync payload: missing export timestamp");
    }
    payload.exportedAt = exportedAt->get<int64_t>();

    auto deviceId = j.find("deviceId");
    if (deviceId == j.end() || !deviceId->is_string()) {
        throw ValidationError("Invalid sync payload: missing device id");
    }
    payload.deviceId = deviceId->get<std::string>();

    auto lastSync = j.find("lastSyncTimestamp");
    if (lastSync != j.end() && !lastSync->is_null()) {
        if (!lastSync->is_number()) {
            throw ValidationError("Invalid sync payload: lastSyncTimestamp must be a number or null");
        }
        payload.lastSyncTimestamp = lastSync->get<int64_t>();
    }

    auto entities = j.find("entities");
    if (entities == j.end() || !entities->is_array()) {
        throw ValidationError("Invalid sync payload: missing entities array");
    }

    for (const auto& e : *entities) {
        std::string name = (e.is_object() && e.contains("entityType") && e["entityType"].is_string())
                               ? e["entityType"].get<std::string>() : "unknown";
        if (!e.is_object() || !e.contains("count") || !e["count"].is_number() ||
            !e.contains("records") || !e["records"].is_array() || name == "unknown") {
            throw ValidationError("Invalid sync payload: malformed entity payload for \"" + name + "\"");
        }

        auto type = entityTypeFromString(name);
        if (!type) {
            throw ValidationError("Invalid sync payload: unknown entity type \"" + name + "\"");
        }
        if (!isSyncable(*type)) {
            throw ValidationError("Invalid sync payload: entity type \"" + name + "\" is device-local");
        }

        EntityPayload ep;
        ep.entityType = *type;
        ep.count = e["count"].get<int64_t>();
        ep.records = e["records"].get<std::vector<json>>();
        payload.entities.push_back(std::move(ep));
    }

    auto total = j.find("totalRecords");
    if (total != j.end() && total->is_number()) {
        payload.totalRecords = total->get<int64_t>();
    } else {
        for (const auto& ep : payload.entities) {
            payload.totalRecords += static_cast<int64_t>(ep.records.size());
        }
    }
    return payload;
}

// ═══════════════════════════════════════════════════════════
// BackupFile
// ═══════════════════════════════════════════════════════════

json BackupFile::toJson() const {
    return {
        {"format", BACKUP_FORMAT},
        {"version", version},
        {"exportedAt", exportedAt},
        {"entities", entitiesToJson(entities)},
        {"totalRecords", totalRecords}
    };
}

BackupFile BackupFile::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Invalid backup file: not a JSON object");
    }

    auto format = j.find("format");
    if (format == j.end() || !format->is_string() || format->get<std::string>() != BACKUP_FORMAT) {
        throw ValidationError(
            "Invalid backup file: missing or incorrect \"format\" field. "
            "This doesn't appear to be a Balance backup file.");
    }

    if (!isVersion(j, BACKUP_VERSION)) {
        throw ValidationError(
            "Incompatible backup version: " + versionText(j) + ". "
            "This app supports version 1 backups.");
    }

    auto exportedAt = j.find("exportedAt");
    if (exportedAt == j.end() || !exportedAt->is_number()) {
        throw ValidationError("Invalid backup file: missing export timestamp");
    }

    auto entities = j.find("entities");
    if (entities == j.end() || !entities->is_array()) {
        throw ValidationError("Invalid backup file: missing entities array");
    }

    BackupFile backup;
    backup.exportedAt = exportedAt->get<int64_t>();

    for (const auto& e : *entities) {
        bool wellFormed = e.is_object() &&
                          e.contains("entityType") && e["entityType"].is_string() &&
                          e.contains("count") && e["count"].is_number() &&
                          e.contains("records") && e["records"].is_array();
        if (!wellFormed) {
            std::string name = "unknown";
            if (e.is_object() && e.contains("entityType") && !e["entityType"].is_null()) {
                name = e["entityType"].is_string() ? e["entityType"].get<std::string>()
                                                   : e["entityType"].dump();
            }
            throw ValidationError(
                "Invalid backup file: malformed entity payload for \"" + name + "\"");
        }

        const std::string name = e["entityType"].get<std::string>();
        auto type = entityTypeFromString(name);
        if (!type) {
            throw ValidationError("Invalid backup file: unknown entity type \"" + name + "\"");
        }

        EntityPayload ep;
        ep.entityType = *type;
        ep.count = e["count"].get<int64_t>();
        ep.records = e["records"].get<std::vector<json>>();
        backup.entities.push_back(std::move(ep));
    }

    auto total = j.find("totalRecords");
    if (total != j.end() && total->is_number()) {
        backup.totalRecords = total->get<int64_t>();
    } else {
        for (const auto& ep : backup.entities) {
            backup.totalRecords += static_cast<int64_t>(ep.records.size());
        }
    }
    return backup;
}

json BackupSummary::toJson() const {
    return {
        {"exportedAt", exportedAt},
        {"version", version},
        {"entities", entities},
        {"totalRecords", totalRecords}
    };
}

BackupSummary parseBackupSummary(const BackupFile& backup) {
    BackupSummary summary;
    summary.exportedAt = backup.exportedAt;
    summary.version = backup.version;
    summary.totalRecords = backup.totalRecords;
    for (const auto& ep : backup.entities) {
        summary.entities[entityTypeToString(ep.entityType)] = ep.count;
    }
    return summary;
}

// ═══════════════════════════════════════════════════════════
// Results
// ═══════════════════════════════════════════════════════════

json EntityMergeCounts::toJson() const {
    return {
        {"newRecords", newRecords},
        {"remoteWins", remoteWins},
        {"localWins", localWins},
        {"equal", equal}
    };
}

json MergeSummary::toJson() const {
    return {
        {"totalReceived", totalReceived},
        {"totalSent", totalSent},
        {"totalUpserted", totalUpserted},
        {"totalNew", totalNew},
        {"totalRemoteWins", totalRemoteWins},
        {"totalLocalWins", totalLocalWins},
        {"totalEqual", totalEqual},
        {"perEntity", perEntityToJson(perEntity)},
        {"failures", failuresToJson(failures)}
    };
}

const char* importModeToString(ImportMode mode) {
    switch (mode) {
        case ImportMode::Replace: return "replace";
        case ImportMode::Merge:   return "merge";
        default:                  return "merge";
    }
}

json ImportResult::toJson() const {
    return {
        {"mode", importModeToString(mode)},
        {"totalImported", totalImported},
        {"perEntity", perEntityToJson(perEntity)},
        {"failures", failuresToJson(failures)}
    };
}

} // namespace Balance

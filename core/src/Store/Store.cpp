#include "balance/Store/Store.h"
#include "balance/Errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

namespace Balance {

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

SyncableRecord saveEntity(LocalStore& store, Entity entity, const std::string& deviceId) {
    EntityType type = entityTypeOf(entity);
    RecordStore& table = store.table(type);
    int64_t now = nowMillis();

    std::visit([&](auto& e) {
        if (!e.id) {
            int64_t maxId = 0;
            for (const auto& r : table.getAll()) {
                maxId = std::max(maxId, r.id);
            }
            e.id = maxId + 1;
        }
        e.updatedAt = now;
        e.deviceId = deviceId;
    }, entity);

    SyncableRecord record = entityToRecord(entity);
    table.bulkUpsert({record});
    spdlog::debug("Store: saved {} #{}", entityTypeToString(type), record.id);
    return record;
}

bool softDelete(LocalStore& store, EntityType type, int64_t id, const std::string& deviceId) {
    RecordStore& table = store.table(type);
    auto existing = table.getById(id);
    if (!existing) {
        return false;
    }

    existing->markDeleted(nowMillis(), deviceId);
    table.bulkUpsert({*existing});
    spdlog::debug("Store: tombstoned {} #{}", entityTypeToString(type), id);
    return true;
}

UserPreferences loadPreferences(LocalStore& store) {
    auto row = store.preferences().get(PREFERENCES_KEY);
    if (!row) {
        return UserPreferences{};
    }
    return UserPreferences::fromJson(*row);
}

void savePreferences(LocalStore& store, const UserPreferences& prefs) {
    store.preferences().put(prefs.toJson());
}

} // namespace Balance

#pragma once

#include "../export.h"
#include "../Store/Store.h"
#include "SyncPayload.h"
#include <optional>
#include <string>

namespace Balance {

/// Collect syncable tables for the partner.
/// @param since absent: every record; otherwise records with updatedAt >= since
/// @throws StoreError (propagated from the store)
BL_API SyncPayload buildSyncPayload(LocalStore& store,
                                    std::optional<int64_t> since,
                                    const std::string& deviceId);

/// Full snapshot of every table, device-local ones included
BL_API BackupFile buildBackup(LocalStore& store);

} // namespace Balance

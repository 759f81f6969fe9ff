#pragma once

#include "../export.h"
#include "../Store/Store.h"
#include "SyncPayload.h"
#include <filesystem>
#include <string>

namespace Balance {

/// balance-backup-YYYY-MM-DD.json (UTC date of exportedAt)
BL_API std::string backupFileName(int64_t exportedAt);

/// Pretty-printed JSON (2-space indent)
BL_API std::string serializeBackup(const BackupFile& backup);

/// Parse and validate backup text
/// @throws ValidationError
BL_API BackupFile parseBackup(const std::string& text);

/// Build a backup and write it into `directory`
/// @return path of the written file
/// @throws StoreError if the file cannot be written
BL_API std::filesystem::path exportBackup(LocalStore& store,
                                          const std::filesystem::path& directory);

/// @throws StoreError if the file cannot be read, ValidationError if invalid
BL_API BackupFile readBackupFile(const std::filesystem::path& path);

/// Wipe every table and load the backup as-is
BL_API ImportResult importReplaceAll(LocalStore& store, const BackupFile& backup);

/// Last-write-wins merge with local data; local preferences are kept
BL_API ImportResult importMerge(LocalStore& store, const BackupFile& backup);

} // namespace Balance

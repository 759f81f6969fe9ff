#include "balance/Sync/Backup.h"
#include "balance/Sync/MergeEngine.h"
#include "balance/Sync/PayloadBuilder.h"
#include "balance/Errors.h"
#include <spdlog/spdlog.h>
#include <ctime>
#include <fstream>
#include <sstream>

namespace Balance {

std::string backupFileName(int64_t exportedAt) {
    std::time_t seconds = static_cast<std::time_t>(exportedAt / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char date[16];
    std::strftime(date, sizeof(date), "%Y-%m-%d", &utc);
    return std::string("balance-backup-") + date + ".json";
}

std::string serializeBackup(const BackupFile& backup) {
    return backup.toJson().dump(2);
}

BackupFile parseBackup(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        throw ValidationError("Invalid backup file: not a JSON object");
    }
    return BackupFile::fromJson(parsed);
}

std::filesystem::path exportBackup(LocalStore& store, const std::filesystem::path& directory) {
    BackupFile backup = buildBackup(store);
    std::filesystem::path path = directory / backupFileName(backup.exportedAt);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw StoreError("Cannot write backup file: " + path.string());
    }
    out << serializeBackup(backup);
    out.close();
    if (!out) {
        throw StoreError("Failed writing backup file: " + path.string());
    }

    spdlog::info("Backup: exported {} records to {}", backup.totalRecords, path.string());
    return path;
}

BackupFile readBackupFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StoreError("Cannot read backup file: " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parseBackup(buffer.str());
}

ImportResult importReplaceAll(LocalStore& store, const BackupFile& backup) {
    MergeEngine engine(store);
    return engine.replaceAll(backup.entities);
}

ImportResult importMerge(LocalStore& store, const BackupFile& backup) {
    MergeEngine engine(store);
    MergeSummary summary = engine.mergeEntities(backup.entities);

    ImportResult result;
    result.mode = ImportMode::Merge;
    result.totalImported = summary.totalUpserted;
    result.perEntity = std::move(summary.perEntity);
    result.failures = std::move(summary.failures);

    spdlog::info("Backup: merge import upserted {} records", result.totalImported);
    return result;
}

} // namespace Balance

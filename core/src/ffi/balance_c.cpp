// balance_c.cpp — C API implementation

#include "ffi_internal.h"
#include "balance/Crypto.h"
#include "balance/Errors.h"
#include "balance/Network/PeerConfig.h"
#include "balance/Sync/Backup.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <vector>

using json = nlohmann::json;
using namespace Balance;

// ═══════════════════════════════════════════════════════════
// Thread-local error state
// ═══════════════════════════════════════════════════════════

thread_local BLError g_lastError = BL_OK;
thread_local std::string g_lastErrorMessage;
thread_local int32_t g_lastTransportCode = 0;

void setLastError(BLError error, const std::string& message) {
    g_lastError = error;
    g_lastErrorMessage = message;
    if (error != BL_ERROR_NETWORK) {
        g_lastTransportCode = 0;
    }
    if (error != BL_OK) {
        spdlog::error("FFI error (code {}): {}", static_cast<int>(error), message);
    }
}

void setLastErrorFromException(const std::exception& e) {
    if (auto* transport = dynamic_cast<const TransportError*>(&e)) {
        setLastError(transport->code() == TransportErrorCode::InvalidState ? BL_ERROR_BUSY
                                                                            : BL_ERROR_NETWORK,
                     e.what());
        g_lastTransportCode = static_cast<int32_t>(transport->code());
    } else if (dynamic_cast<const ValidationError*>(&e)) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, e.what());
    } else if (dynamic_cast<const StoreError*>(&e)) {
        setLastError(BL_ERROR_DATABASE, e.what());
    } else if (dynamic_cast<const std::invalid_argument*>(&e)) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, e.what());
    } else {
        setLastError(BL_ERROR_INTERNAL, e.what());
    }
}

char* alloc_string(const std::string& str) {
    return bl_strdup(str.c_str());
}

// ═══════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════

namespace {

StoreHolder* toHolder(BLStore store) {
    return reinterpret_cast<StoreHolder*>(store);
}

SyncSessionHolder* toHolder(BLSyncSession session) {
    return reinterpret_cast<SyncSessionHolder*>(session);
}

ChunkAssemblerHolder* toHolder(BLChunkAssembler assembler) {
    return reinterpret_cast<ChunkAssemblerHolder*>(assembler);
}

EntityType requireEntityType(const char* name) {
    if (!name) {
        throw ValidationError("Entity type is required");
    }
    auto type = entityTypeFromString(name);
    if (!type) {
        throw ValidationError(std::string("Unknown entity type: ") + name);
    }
    return *type;
}

json parseJsonArgument(const char* text, const char* what) {
    if (!text) {
        throw ValidationError(std::string(what) + " is required");
    }
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        throw ValidationError(std::string(what) + " is not valid JSON");
    }
    return parsed;
}

/// JSON array of scanned codes
std::vector<std::string> parseCodes(const char* codesJson, const char* what) {
    json parsed = parseJsonArgument(codesJson, what);
    if (!parsed.is_array()) {
        throw ValidationError(std::string(what) + " must be a JSON array of strings");
    }
    std::vector<std::string> codes;
    codes.reserve(parsed.size());
    for (const auto& code : parsed) {
        if (!code.is_string()) {
            throw ValidationError(std::string(what) + " must be a JSON array of strings");
        }
        codes.push_back(code.get<std::string>());
    }
    return codes;
}

SyncProgressCallback wrapProgress(BLSyncProgressCallback callback, void* userData) {
    if (!callback) {
        return nullptr;
    }
    return [callback, userData](const SyncProgress& progress) {
        std::string text = progress.toJson().dump();
        callback(text.c_str(), userData);
    };
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// Common
// ═══════════════════════════════════════════════════════════

extern "C" {

const char* bl_version(void) {
    return Balance::VERSION;
}

const char* bl_error_message(BLError error) {
    switch (error) {
        case BL_OK: return "Success";
        case BL_ERROR_INVALID_ARGUMENT: return "Invalid argument";
        case BL_ERROR_DATABASE: return "Database error";
        case BL_ERROR_IO: return "I/O error";
        case BL_ERROR_NOT_FOUND: return "Not found";
        case BL_ERROR_NETWORK: return "Network error";
        case BL_ERROR_BUSY: return "Resource busy";
        case BL_ERROR_INTERNAL:
        default: return "Internal error";
    }
}

BLError bl_last_error(void) {
    return g_lastError;
}

const char* bl_last_error_message(void) {
    return g_lastErrorMessage.c_str();
}

int32_t bl_last_transport_code(void) {
    return g_lastTransportCode;
}

void bl_clear_error(void) {
    g_lastError = BL_OK;
    g_lastErrorMessage.clear();
    g_lastTransportCode = 0;
}

void bl_free_string(char* str) {
    std::free(str);
}

BLError bl_set_log_level(int32_t level) {
    if (level < spdlog::level::trace || level > spdlog::level::off) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Log level must be between 0 and 6");
        return BL_ERROR_INVALID_ARGUMENT;
    }
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
    clearLastError();
    return BL_OK;
}

// ═══════════════════════════════════════════════════════════
// Store
// ═══════════════════════════════════════════════════════════

BLStore bl_store_open(const char* path, BLError* out_error) {
    if (!path) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null path");
        if (out_error) *out_error = BL_ERROR_INVALID_ARGUMENT;
        return nullptr;
    }
    try {
        auto* holder = new StoreHolder(path);
        clearLastError();
        if (out_error) *out_error = BL_OK;
        return reinterpret_cast<BLStore>(holder);
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        if (out_error) *out_error = g_lastError;
        return nullptr;
    }
}

BLError bl_store_close(BLStore store) {
    if (!store) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null store handle");
        return BL_ERROR_INVALID_ARGUMENT;
    }

    auto* holder = toHolder(store);
    if (holder->refCount() > 1) {
        setLastError(BL_ERROR_BUSY,
            "Cannot close store: " + std::to_string(holder->refCount() - 1) + " sync session(s) still active");
        return BL_ERROR_BUSY;
    }

    delete holder;
    clearLastError();
    return BL_OK;
}

char* bl_store_ensure_preferences(BLStore store) {
    if (!store) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null store handle");
        return nullptr;
    }
    try {
        LocalStore& local = toHolder(store)->store();
        UserPreferences prefs = loadPreferences(local);
        if (prefs.deviceId.empty()) {
            prefs.deviceId = Crypto::generateUUID();
            savePreferences(local, prefs);
            spdlog::info("Store: Assigned device id {}", prefs.deviceId);
        }
        clearLastError();
        return alloc_string(prefs.toJson().dump());
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return nullptr;
    }
}

char* bl_store_get_preferences(BLStore store) {
    if (!store) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null store handle");
        return nullptr;
    }
    try {
        UserPreferences prefs = loadPreferences(toHolder(store)->store());
        clearLastError();
        return alloc_string(prefs.toJson().dump());
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return nullptr;
    }
}

BLError bl_store_set_preferences(BLStore store, const char* prefs_json) {
    if (!store) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null store handle");
        return BL_ERROR_INVALID_ARGUMENT;
    }
    try {
        json parsed = parseJsonArgument(prefs_json, "Preferences");
        savePreferences(toHolder(store)->store(), UserPreferences::fromJson(parsed));
        clearLastError();
        return BL_OK;
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return g_lastError;
    }
}

char* bl_store_save_entity(BLStore store, const char* entity_type, const char* entity_json) {
    if (!store) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null store handle");
        return nullptr;
    }
    try {
        EntityType type = requireEntityType(entity_type);
        json parsed = parseJsonArgument(entity_json, "Entity");
        if (!parsed.is_object()) {
            throw ValidationError("Entity must be a JSON object");
        }
        if (parsed.value("id", json()).is_number_integer() && parsed["id"].get<int64_t>() == 0) {
            parsed.erase("id");
        }
        // Sync fields are stamped on save
        if (!parsed.contains("updatedAt")) parsed["updatedAt"] = 0;
        if (!parsed.contains("deviceId")) parsed["deviceId"] = "";

        LocalStore& local = toHolder(store)->store();
        UserPreferences prefs = loadPreferences(local);
        if (prefs.deviceId.empty()) {
            throw StoreError("User preferences not initialised, cannot save");
        }

        SyncableRecord saved = saveEntity(local, entityFromJson(type, parsed), prefs.deviceId);
        clearLastError();
        return alloc_string(saved.toJson().dump());
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return nullptr;
    }
}

BLError bl_store_delete_entity(BLStore store, const char* entity_type, int64_t id) {
    if (!store) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null store handle");
        return BL_ERROR_INVALID_ARGUMENT;
    }
    try {
        EntityType type = requireEntityType(entity_type);
        LocalStore& local = toHolder(store)->store();
        UserPreferences prefs = loadPreferences(local);
        if (prefs.deviceId.empty()) {
            throw StoreError("User preferences not initialised, cannot delete");
        }

        if (!softDelete(local, type, id, prefs.deviceId)) {
            setLastError(BL_ERROR_NOT_FOUND,
                         std::string("No ") + entityTypeToString(type) + " row with id " + std::to_string(id));
            return BL_ERROR_NOT_FOUND;
        }
        clearLastError();
        return BL_OK;
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return g_lastError;
    }
}

char* bl_store_list_entities(BLStore store, const char* entity_type) {
    if (!store) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null store handle");
        return nullptr;
    }
    try {
        EntityType type = requireEntityType(entity_type);
        json rows = json::array();
        for (const auto& record : toHolder(store)->store().table(type).getAll()) {
            rows.push_back(record.toJson());
        }
        clearLastError();
        return alloc_string(rows.dump());
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return nullptr;
    }
}

// ═══════════════════════════════════════════════════════════
// Backup
// ═══════════════════════════════════════════════════════════

char* bl_backup_export(BLStore store, const char* directory) {
    if (!store || !directory) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null store handle or directory");
        return nullptr;
    }
    try {
        auto path = exportBackup(toHolder(store)->store(), directory);
        clearLastError();
        return alloc_string(path.string());
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return nullptr;
    }
}

char* bl_backup_summary(const char* path) {
    if (!path) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null path");
        return nullptr;
    }
    try {
        BackupFile backup = readBackupFile(path);
        clearLastError();
        return alloc_string(parseBackupSummary(backup).toJson().dump());
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return nullptr;
    }
}

char* bl_backup_import(BLStore store, const char* path, BLImportMode mode) {
    if (!store || !path) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null store handle or path");
        return nullptr;
    }
    if (mode != BL_IMPORT_REPLACE && mode != BL_IMPORT_MERGE) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Unknown import mode");
        return nullptr;
    }
    try {
        BackupFile backup = readBackupFile(path);
        LocalStore& local = toHolder(store)->store();
        ImportResult result = mode == BL_IMPORT_REPLACE ? importReplaceAll(local, backup)
                                                        : importMerge(local, backup);
        clearLastError();
        return alloc_string(result.toJson().dump());
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return nullptr;
    }
}

// ═══════════════════════════════════════════════════════════
// Sync session
// ═══════════════════════════════════════════════════════════

BLSyncSession bl_sync_session_create(BLStore store, BLNetworkMode mode) {
    if (!store) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null store handle");
        return nullptr;
    }
    if (mode != BL_NETWORK_LOCAL && mode != BL_NETWORK_REMOTE) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Unknown network mode");
        return nullptr;
    }
    try {
        SyncSessionOptions options;
        options.mode = mode == BL_NETWORK_REMOTE ? NetworkMode::Remote : NetworkMode::Local;
        auto* holder = new SyncSessionHolder(toHolder(store), options);
        clearLastError();
        return reinterpret_cast<BLSyncSession>(holder);
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return nullptr;
    }
}

void bl_sync_session_destroy(BLSyncSession session) {
    delete toHolder(session);
}

char* bl_sync_start_initiator(BLSyncSession session) {
    if (!session) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null session handle");
        return nullptr;
    }
    try {
        json codes = toHolder(session)->session->startAsInitiator();
        clearLastError();
        return alloc_string(codes.dump());
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return nullptr;
    }
}

char* bl_sync_accept_offer(BLSyncSession session, const char* offer_codes_json) {
    if (!session) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null session handle");
        return nullptr;
    }
    try {
        auto offerCodes = parseCodes(offer_codes_json, "Offer codes");
        json codes = toHolder(session)->session->acceptOfferCodes(offerCodes);
        clearLastError();
        return alloc_string(codes.dump());
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return nullptr;
    }
}

char* bl_sync_complete(BLSyncSession session,
                       const char* answer_codes_json,
                       BLSyncProgressCallback callback,
                       void* user_data) {
    if (!session) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null session handle");
        return nullptr;
    }
    try {
        auto answerCodes = parseCodes(answer_codes_json, "Answer codes");
        MergeSummary summary = toHolder(session)->session->completeWithAnswer(
            answerCodes, wrapProgress(callback, user_data));
        clearLastError();
        return alloc_string(summary.toJson().dump());
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return nullptr;
    }
}

char* bl_sync_wait_for_partner(BLSyncSession session,
                               BLSyncProgressCallback callback,
                               void* user_data) {
    if (!session) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null session handle");
        return nullptr;
    }
    try {
        MergeSummary summary = toHolder(session)->session->waitForPartnerAndSync(
            wrapProgress(callback, user_data));
        clearLastError();
        return alloc_string(summary.toJson().dump());
    } catch (const std::exception& e) {
        setLastErrorFromException(e);
        return nullptr;
    }
}

void bl_sync_cancel(BLSyncSession session) {
    if (!session) return;
    toHolder(session)->session->cancel();
}

const char* bl_sync_state(BLSyncSession session) {
    if (!session) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null session handle");
        return nullptr;
    }
    return PeerConnection::stateName(toHolder(session)->session->connectionState());
}

char* bl_remote_error_message(const char* raw_error) {
    return alloc_string(remoteConnectionErrorMessage(raw_error ? raw_error : ""));
}

// ═══════════════════════════════════════════════════════════
// Chunk assembly
// ═══════════════════════════════════════════════════════════

BLChunkAssembler bl_chunk_assembler_create(void) {
    return reinterpret_cast<BLChunkAssembler>(new ChunkAssemblerHolder());
}

void bl_chunk_assembler_destroy(BLChunkAssembler assembler) {
    delete toHolder(assembler);
}

int32_t bl_chunk_assembler_add(BLChunkAssembler assembler, const char* code) {
    if (!assembler || !code) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null assembler handle or code");
        return -1;
    }
    auto result = toHolder(assembler)->assembler.add(code);
    clearLastError();
    return result ? 1 : 0;
}

char* bl_chunk_assembler_progress(BLChunkAssembler assembler) {
    if (!assembler) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null assembler handle");
        return nullptr;
    }
    const ChunkAssembler& a = toHolder(assembler)->assembler;
    json progress = {
        {"received", a.received()},
        {"total", a.total()},
        {"complete", a.isComplete()}
    };
    return alloc_string(progress.dump());
}

char* bl_chunk_assembler_result(BLChunkAssembler assembler) {
    if (!assembler) {
        setLastError(BL_ERROR_INVALID_ARGUMENT, "Null assembler handle");
        return nullptr;
    }
    const auto& result = toHolder(assembler)->assembler.result();
    return result ? alloc_string(*result) : nullptr;
}

void bl_chunk_assembler_reset(BLChunkAssembler assembler) {
    if (!assembler) return;
    toHolder(assembler)->assembler.reset();
}

} // extern "C"

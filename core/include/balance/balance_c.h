// balance_c.h — C API for the UI layer

#ifndef BALANCE_C_H
#define BALANCE_C_H

#include "export.h"
#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ═══════════════════════════════════════════════════════════
// Opaque handles
// ═══════════════════════════════════════════════════════════

typedef struct BLStore_* BLStore;
typedef struct BLSyncSession_* BLSyncSession;
typedef struct BLChunkAssembler_* BLChunkAssembler;

// ═══════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════

typedef enum {
    BL_OK = 0,
    BL_ERROR_INVALID_ARGUMENT = 1,  // Also malformed payloads and backups
    BL_ERROR_DATABASE = 2,
    BL_ERROR_IO = 3,
    BL_ERROR_NOT_FOUND = 4,
    BL_ERROR_NETWORK = 7,           // TransportError, see bl_last_transport_code()
    BL_ERROR_BUSY = 8,              // Wrong session state, or store still in use
    BL_ERROR_INTERNAL = 99
} BLError;

typedef enum {
    BL_NETWORK_LOCAL = 0,
    BL_NETWORK_REMOTE = 1
} BLNetworkMode;

typedef enum {
    BL_IMPORT_REPLACE = 0,
    BL_IMPORT_MERGE = 1
} BLImportMode;

/// Library version ("0.1.0")
BL_API const char* bl_version(void);

/// Static description of an error code
BL_API const char* bl_error_message(BLError error);

/// Last error on the calling thread
BL_API BLError bl_last_error(void);
BL_API const char* bl_last_error_message(void);

/// TransportErrorCode behind the last BL_ERROR_NETWORK or BL_ERROR_BUSY on this thread, 0 otherwise
BL_API int32_t bl_last_transport_code(void);

BL_API void bl_clear_error(void);

/// Free a string returned by this API (NULL is ignored)
BL_API void bl_free_string(char* str);

/// 0 trace, 1 debug, 2 info, 3 warn, 4 error, 5 critical, 6 off
BL_API BLError bl_set_log_level(int32_t level);

// ═══════════════════════════════════════════════════════════
// Store
// ═══════════════════════════════════════════════════════════

/// Open (or create) the database and apply migrations
BL_API BLStore bl_store_open(const char* path, BLError* out_error);

/// @return BL_ERROR_BUSY while sync sessions created from it still exist
BL_API BLError bl_store_close(BLStore store);

/// Preferences JSON, with a device id generated on first call
/// @return JSON string (caller frees with bl_free_string)
BL_API char* bl_store_ensure_preferences(BLStore store);

BL_API char* bl_store_get_preferences(BLStore store);
BL_API BLError bl_store_set_preferences(BLStore store, const char* prefs_json);

/// Save one entity, stamping updatedAt and deviceId (id 0 or missing = new row)
/// @param entity_type wire name, e.g. "contacts"
/// @return stored record JSON
BL_API char* bl_store_save_entity(BLStore store, const char* entity_type, const char* entity_json);

/// Turn a row into a tombstone
BL_API BLError bl_store_delete_entity(BLStore store, const char* entity_type, int64_t id);

/// Every row of a table, tombstones included
/// @return JSON array
BL_API char* bl_store_list_entities(BLStore store, const char* entity_type);

// ═══════════════════════════════════════════════════════════
// Backup
// ═══════════════════════════════════════════════════════════

/// Write balance-backup-YYYY-MM-DD.json into directory
/// @return path of the written file
BL_API char* bl_backup_export(BLStore store, const char* directory);

/// Validate a backup file and describe its contents
/// @return BackupSummary JSON
BL_API char* bl_backup_summary(const char* path);

/// @return ImportResult JSON
BL_API char* bl_backup_import(BLStore store, const char* path, BLImportMode mode);

// ═══════════════════════════════════════════════════════════
// Sync session
// ═══════════════════════════════════════════════════════════

/// Progress as {"phase","message","recordsSent","recordsReceived"}
typedef void (*BLSyncProgressCallback)(const char* progress_json, void* user_data);

/// The store cannot be closed until the session is destroyed
BL_API BLSyncSession bl_sync_session_create(BLStore store, BLNetworkMode mode);

/// Cancels any running sync, then frees the session
BL_API void bl_sync_session_destroy(BLSyncSession session);

/// Initiator step 1
/// @return JSON array of offer codes
BL_API char* bl_sync_start_initiator(BLSyncSession session);

/// Joiner step 1
/// @param offer_codes_json JSON array of scanned offer codes
/// @return JSON array of answer codes
BL_API char* bl_sync_accept_offer(BLSyncSession session, const char* offer_codes_json);

/// Initiator step 2 (blocking)
/// @return MergeSummary JSON
BL_API char* bl_sync_complete(BLSyncSession session,
                              const char* answer_codes_json,
                              BLSyncProgressCallback callback,
                              void* user_data);

/// Joiner step 2 (blocking)
/// @return MergeSummary JSON
BL_API char* bl_sync_wait_for_partner(BLSyncSession session,
                                      BLSyncProgressCallback callback,
                                      void* user_data);

/// Safe to call from another thread while a blocking step runs
BL_API void bl_sync_cancel(BLSyncSession session);

/// "idle", "offer-created", "answer-created", "connecting", "open", "closed", "failed"
BL_API const char* bl_sync_state(BLSyncSession session);

/// User-facing message for a failed remote connection
/// @return string (caller frees with bl_free_string)
BL_API char* bl_remote_error_message(const char* raw_error);

// ═══════════════════════════════════════════════════════════
// Chunk assembly (for the code scanner)
// ═══════════════════════════════════════════════════════════

BL_API BLChunkAssembler bl_chunk_assembler_create(void);
BL_API void bl_chunk_assembler_destroy(BLChunkAssembler assembler);

/// Feed one scanned code
/// @return 1 when complete, 0 while parts are missing, -1 on error
BL_API int32_t bl_chunk_assembler_add(BLChunkAssembler assembler, const char* code);

/// @return {"received","total","complete"} JSON
BL_API char* bl_chunk_assembler_progress(BLChunkAssembler assembler);

/// @return reassembled data or NULL while incomplete
BL_API char* bl_chunk_assembler_result(BLChunkAssembler assembler);

BL_API void bl_chunk_assembler_reset(BLChunkAssembler assembler);

#ifdef __cplusplus
}
#endif

#endif // BALANCE_C_H

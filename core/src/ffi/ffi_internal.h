// ffi_internal.h — Internal shared declarations for FFI implementation

#ifndef BL_FFI_INTERNAL_H
#define BL_FFI_INTERNAL_H

#include "balance/balance_c.h"
#include "balance/Store/SqliteStore.h"
#include "balance/Sync/ChunkCodec.h"
#include "balance/Sync/SyncSession.h"
#include <atomic>
#include <exception>
#include <memory>
#include <string>
#include <cstring>

#ifdef _WIN32
    #define bl_strdup _strdup
#else
    #define bl_strdup strdup
#endif

// Thread-local error state
extern thread_local BLError g_lastError;
extern thread_local std::string g_lastErrorMessage;
extern thread_local int32_t g_lastTransportCode;

// Note: default argument only in declaration, not in definition
void setLastError(BLError error, const std::string& message = "");
inline void clearLastError() { setLastError(BL_OK); }

/// Map the core exception hierarchy to an error code
void setLastErrorFromException(const std::exception& e);

char* alloc_string(const std::string& str);

// ═══════════════════════════════════════════════════════════
// Handle payloads
// ═══════════════════════════════════════════════════════════

/// Wraps the store with reference counting so sessions keep it alive
class StoreHolder {
public:
    explicit StoreHolder(const std::string& path)
        : m_store(std::make_unique<Balance::SqliteStore>(path))
        , m_refCount(1)
    {}

    Balance::SqliteStore& store() { return *m_store; }

    void addRef() {
        m_refCount.fetch_add(1, std::memory_order_relaxed);
    }

    int release() {
        return m_refCount.fetch_sub(1, std::memory_order_acq_rel) - 1;
    }

    int refCount() const {
        return m_refCount.load(std::memory_order_relaxed);
    }

private:
    std::unique_ptr<Balance::SqliteStore> m_store;
    std::atomic<int> m_refCount;
};

struct SyncSessionHolder {
    SyncSessionHolder(StoreHolder* holder, Balance::SyncSessionOptions options)
        : storeHolder(holder) {
        session = std::make_unique<Balance::SyncSession>(storeHolder->store(), options);
        storeHolder->addRef();
    }

    ~SyncSessionHolder() {
        session.reset();  // Cancel and close before the store goes
        storeHolder->release();
    }

    StoreHolder* storeHolder;  // Not owned, but ref-counted
    std::unique_ptr<Balance::SyncSession> session;
};

struct ChunkAssemblerHolder {
    Balance::ChunkAssembler assembler;
};

#endif // BL_FFI_INTERNAL_H

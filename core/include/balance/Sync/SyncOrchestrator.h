#pragma once

#include "../export.h"
#include "../Store/Store.h"
#include "../Types.h"
#include "ChunkCodec.h"
#include "SyncPayload.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace Balance {

class PeerConnection;

constexpr int SYNC_MESSAGE_TIMEOUT_MS = 60000;
constexpr int SYNC_OPEN_TIMEOUT_MS = 60000;
constexpr int SYNC_COMPLETE_TIMEOUT_MS = 10000;

// ═══════════════════════════════════════════════════════════
// Progress
// ═══════════════════════════════════════════════════════════

struct BL_API SyncProgress {
    SyncPhase phase = SyncPhase::Handshake;
    std::string message;
    int64_t recordsSent = 0;
    int64_t recordsReceived = 0;

    json toJson() const;
};

using SyncProgressCallback = std::function<void(const SyncProgress&)>;

/// Tunables for one sync session
struct SyncSessionOptions {
    NetworkMode mode = NetworkMode::Local;
    int messageTimeoutMs = SYNC_MESSAGE_TIMEOUT_MS;
    int openTimeoutMs = SYNC_OPEN_TIMEOUT_MS;
    int completeTimeoutMs = SYNC_COMPLETE_TIMEOUT_MS;
    size_t codeCapacity = CHUNK_CAPACITY;      // Characters per scannable code

    /// Overrides the profile's connection timeout when > 0
    int connectionTimeoutMs = 0;
};

// ═══════════════════════════════════════════════════════════
// SyncOrchestrator — one two-way exchange over an open channel
//
// handshake → send delta → receive → merge → finalize
// ═══════════════════════════════════════════════════════════

class BL_API SyncOrchestrator {
public:
    explicit SyncOrchestrator(LocalStore& store, SyncSessionOptions options = {});

    SyncOrchestrator(const SyncOrchestrator&) = delete;
    SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

    /// Run the exchange on an Open connection.
    /// The watermark advances to the time captured at the start, unless an
    /// entity batch failed to merge (the summary then lists the failures
    /// and the Error phase is reported).
    /// Only one run may hold a connection, whichever orchestrator starts it.
    /// @throws TransportError InvalidState if a sync is already running,
    ///         TransportError / ValidationError / StoreError on failure
    MergeSummary run(PeerConnection& connection, SyncProgressCallback progress = nullptr);

    bool isRunning() const { return m_running; }

private:
    LocalStore& m_store;
    SyncSessionOptions m_options;
    std::atomic<bool> m_running{false};
};

} // namespace Balance

// SyncOrchestrator.cpp — handshake, exchange, merge and finalize over an open channel

#include "balance/Sync/SyncOrchestrator.h"
#include "balance/Errors.h"
#include "balance/Network/PeerConnection.h"
#include "balance/Sync/MergeEngine.h"
#include "balance/Sync/PayloadBuilder.h"
#include <spdlog/spdlog.h>
#include <atomic>

namespace Balance {

namespace {

class RunningGuard {
public:
    explicit RunningGuard(std::atomic<bool>& flag) : m_flag(flag) {}
    ~RunningGuard() { m_flag = false; }

private:
    std::atomic<bool>& m_flag;
};

class SyncClaim {
public:
    explicit SyncClaim(PeerConnection& connection) : m_connection(connection) {}
    ~SyncClaim() { m_connection.releaseSync(); }

private:
    PeerConnection& m_connection;
};

/// Detaches the chunk progress hook however run() exits
class ChunkProgressHook {
public:
    ChunkProgressHook(PeerConnection& connection, PeerConnection::ChunkProgressCallback callback)
        : m_connection(connection) {
        m_connection.onChunkProgress(std::move(callback));
    }
    ~ChunkProgressHook() { m_connection.onChunkProgress(nullptr); }

private:
    PeerConnection& m_connection;
};

std::string describeFailures(const MergeSummary& summary) {
    std::string text;
    for (const auto& failure : summary.failures) {
        if (!text.empty()) text += "; ";
        text += std::string(entityTypeToString(failure.entityType)) + ": " + failure.message;
    }
    return text;
}

} // anonymous namespace

json SyncProgress::toJson() const {
    return {
        {"phase", syncPhaseToString(phase)},
        {"message", message},
        {"recordsSent", recordsSent},
        {"recordsReceived", recordsReceived}
    };
}

SyncOrchestrator::SyncOrchestrator(LocalStore& store, SyncSessionOptions options)
    : m_store(store), m_options(options) {}

MergeSummary SyncOrchestrator::run(PeerConnection& connection, SyncProgressCallback progress) {
    if (m_running.exchange(true)) {
        throw TransportError(TransportErrorCode::InvalidState, "A sync is already running on this connection");
    }
    RunningGuard guard(m_running);

    if (!connection.tryClaimSync()) {
        throw TransportError(TransportErrorCode::InvalidState, "A sync is already running on this connection");
    }
    SyncClaim claim(connection);

    std::atomic<int64_t> recordsSent{0};
    std::atomic<int64_t> recordsReceived{0};
    auto report = [&](SyncPhase phase, const std::string& message) {
        spdlog::info("Sync: [{}] {}", syncPhaseToString(phase), message);
        if (progress) {
            progress(SyncProgress{phase, message, recordsSent.load(), recordsReceived.load()});
        }
    };

    if (!connection.isOpen()) {
        throw TransportError(TransportErrorCode::ChannelClosed, "Data channel is not open");
    }

    // Records written by this device after this point go out next time
    const int64_t syncStartedAt = nowMillis();

    UserPreferences prefs = loadPreferences(m_store);
    if (prefs.deviceId.empty()) {
        throw StoreError("User preferences not initialised, cannot sync");
    }

    ChunkProgressHook hook(connection, [&](size_t received, size_t total) {
        report(SyncPhase::Receiving,
               "Receiving partner's data (" + std::to_string(received) + "/" + std::to_string(total) + ")");
    });

    try {
        // 1. Handshake
        report(SyncPhase::Handshake, "Exchanging sync state with partner...");
        SyncHandshakePayload ours;
        ours.deviceId = prefs.deviceId;
        ours.lastSyncTimestamp = prefs.lastSyncTimestamp;

        Message handshake(MessageType::SyncHandshake, generateRequestId());
        handshake.setJsonPayload(ours.toJson());
        connection.send(handshake);

        Message reply = connection.waitForMessage(MessageType::SyncHandshake, m_options.messageTimeoutMs);
        auto theirs = SyncHandshakePayload::fromJson(reply.getJsonPayload());
        if (!theirs) {
            throw TransportError(TransportErrorCode::ProtocolViolation, "Malformed sync handshake from partner");
        }
        if (theirs->deviceId == prefs.deviceId) {
            spdlog::warn("Sync: Partner announced this device's own id {}", prefs.deviceId);
        }

        // 2. Delta since the partner's watermark
        SyncPayload outgoing = buildSyncPayload(m_store, theirs->lastSyncTimestamp, prefs.deviceId);
        recordsSent = outgoing.totalRecords;
        report(SyncPhase::Sending, "Sending " + std::to_string(outgoing.totalRecords) + " records...");

        Message payloadMsg(MessageType::SyncPayload, generateRequestId());
        payloadMsg.setJsonPayload(outgoing.toJson().dump());
        connection.send(payloadMsg);

        // 3. Receive and merge
        report(SyncPhase::Receiving, "Waiting for partner's data...");
        Message incomingMsg = connection.waitForMessage(MessageType::SyncPayload, m_options.messageTimeoutMs);

        json incomingJson = json::parse(incomingMsg.getJsonPayload(), nullptr, false);
        if (incomingJson.is_discarded()) {
            throw ValidationError("Invalid sync payload: not a JSON object");
        }
        SyncPayload incoming = SyncPayload::fromJson(incomingJson);
        recordsReceived = incoming.totalRecords;

        report(SyncPhase::Merging, "Merging " + std::to_string(incoming.totalRecords) + " incoming records...");
        MergeEngine engine(m_store);
        MergeSummary summary = engine.mergePayload(incoming);
        summary.totalSent = outgoing.totalRecords;

        // 4. Finalize
        UserPreferences updated = loadPreferences(m_store);
        updated.partnerDeviceId = theirs->deviceId;
        if (!summary.hasFailures()) {
            updated.lastSyncTimestamp = syncStartedAt;
            updated.recordSync(syncStartedAt);
        }
        savePreferences(m_store, updated);

        SyncCompletePayload done;
        done.deviceId = prefs.deviceId;
        done.recordsReceived = incoming.totalRecords;
        done.merged = !summary.hasFailures();
        Message complete(MessageType::SyncComplete, generateRequestId());
        complete.setJsonPayload(done.toJson());
        connection.send(complete);

        try {
            Message ack = connection.waitForMessage(MessageType::SyncComplete, m_options.completeTimeoutMs);
            auto partnerDone = SyncCompletePayload::fromJson(ack.getJsonPayload());
            if (partnerDone && !partnerDone->merged) {
                spdlog::warn("Sync: Partner could not merge every table, it will ask again next time");
            }
        } catch (const TransportError& e) {
            spdlog::warn("Sync: Partner did not acknowledge completion: {}", e.what());
        }

        if (summary.hasFailures()) {
            report(SyncPhase::Error, "Sync finished with errors, some records were not saved: " +
                                     describeFailures(summary));
            return summary;
        }

        report(SyncPhase::Complete,
               "Sync complete: sent " + std::to_string(outgoing.totalRecords) + ", received " +
               std::to_string(incoming.totalRecords) + ", " + std::to_string(summary.totalRemoteWins) +
               " conflicts resolved");
        return summary;

    } catch (const SyncError& e) {
        report(SyncPhase::Error, e.what());

        if (connection.isOpen()) {
            ErrorPayload error;
            error.code = "sync-failed";
            error.message = e.what();
            Message errorMsg(MessageType::Error, generateRequestId());
            errorMsg.setJsonPayload(error.toJson());
            try {
                connection.send(errorMsg);
            } catch (const TransportError& sendError) {
                spdlog::debug("Sync: Could not notify partner: {}", sendError.what());
            }
        }
        throw;
    }
}

} // namespace Balance

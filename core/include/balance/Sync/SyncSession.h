#pragma once

#include "../export.h"
#include "../Network/PeerConnection.h"
#include "../Store/Store.h"
#include "SyncOrchestrator.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Balance {

// ═══════════════════════════════════════════════════════════
// SyncSession — role-specific flow around one PeerConnection
//
// Initiator: startAsInitiator() → show offer codes
//            completeWithAnswer(scanned answer codes) → summary
// Joiner:    acceptOfferCodes(scanned offer codes) → show answer codes
//            waitForPartnerAndSync() → summary
// ═══════════════════════════════════════════════════════════

class BL_API SyncSession {
public:
    explicit SyncSession(LocalStore& store, SyncSessionOptions options = {});
    ~SyncSession();

    SyncSession(const SyncSession&) = delete;
    SyncSession& operator=(const SyncSession&) = delete;

    /// @return offer split into scannable codes
    /// @throws TransportError InvalidState if the session already started,
    ///         StoreError if preferences have no device id
    std::vector<std::string> startAsInitiator();

    /// @param offerCodes every scanned part of the offer, any order
    /// @return answer split into scannable codes
    /// @throws TransportError MalformedDescription if parts are missing
    std::vector<std::string> acceptOfferCodes(const std::vector<std::string>& offerCodes);

    /// Initiator: connect using the scanned answer and run the sync
    MergeSummary completeWithAnswer(const std::vector<std::string>& answerCodes,
                                    SyncProgressCallback progress = nullptr);

    /// Joiner: wait for the initiator to dial in (bounded by openTimeoutMs)
    /// and run the sync
    MergeSummary waitForPartnerAndSync(SyncProgressCallback progress = nullptr);

    /// Close the connection; merges already committed are kept
    void cancel();

    std::optional<SyncRole> role() const;
    PeerConnection::State connectionState() const;
    const SyncSessionOptions& options() const { return m_options; }

private:
    LocalStore& m_store;
    SyncSessionOptions m_options;
    SyncOrchestrator m_orchestrator;

    mutable std::mutex m_mutex;
    std::unique_ptr<PeerConnection> m_connection;
    std::optional<SyncRole> m_role;

    PeerConnection& beginConnection(SyncRole role);
    PeerConnection& requireConnection(SyncRole role) const;
    MergeSummary runSync(PeerConnection& connection, const SyncProgressCallback& progress);
    void reportFailure(const SyncProgressCallback& progress, const std::exception& error) const;
};

/// Feed scanned codes to an assembler
/// @throws TransportError MalformedDescription while any part is missing
BL_API std::string assembleCodes(const std::vector<std::string>& codes, const char* what);

} // namespace Balance

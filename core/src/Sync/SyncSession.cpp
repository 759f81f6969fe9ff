// SyncSession.cpp — initiator and joiner flows around PeerConnection

#include "balance/Sync/SyncSession.h"
#include "balance/Errors.h"
#include "balance/Sync/ChunkCodec.h"
#include <spdlog/spdlog.h>

namespace Balance {

namespace {

/// The connection is single-use; it closes once its sync ends
class CloseOnExit {
public:
    explicit CloseOnExit(PeerConnection& connection) : m_connection(connection) {}
    ~CloseOnExit() { m_connection.close(); }

private:
    PeerConnection& m_connection;
};

} // anonymous namespace

std::string assembleCodes(const std::vector<std::string>& codes, const char* what) {
    ChunkAssembler assembler;
    std::optional<std::string> result;
    for (const auto& code : codes) {
        if (code.empty()) continue;
        result = assembler.add(code);
    }

    if (!result) {
        if (assembler.total() == 0) {
            throw TransportError(TransportErrorCode::MalformedDescription,
                                 std::string("No ") + what + " codes were scanned");
        }
        throw TransportError(TransportErrorCode::MalformedDescription,
                             std::string("Incomplete ") + what + ": scanned " +
                             std::to_string(assembler.received()) + " of " +
                             std::to_string(assembler.total()) + " codes");
    }
    return *result;
}

SyncSession::SyncSession(LocalStore& store, SyncSessionOptions options)
    : m_store(store), m_options(options), m_orchestrator(store, options) {}

SyncSession::~SyncSession() {
    cancel();
}

std::vector<std::string> SyncSession::startAsInitiator() {
    PeerConnection& connection = beginConnection(SyncRole::Initiator);
    std::string offer = connection.createOffer();
    auto codes = splitIntoChunks(offer, m_options.codeCapacity);
    spdlog::info("SyncSession: Offer ready as {} code(s)", codes.size());
    return codes;
}

std::vector<std::string> SyncSession::acceptOfferCodes(const std::vector<std::string>& offerCodes) {
    std::string offer = assembleCodes(offerCodes, "offer");
    PeerConnection& connection = beginConnection(SyncRole::Joiner);
    std::string answer = connection.acceptOffer(offer);
    auto codes = splitIntoChunks(answer, m_options.codeCapacity);
    spdlog::info("SyncSession: Answer ready as {} code(s)", codes.size());
    return codes;
}

MergeSummary SyncSession::completeWithAnswer(const std::vector<std::string>& answerCodes,
                                             SyncProgressCallback progress) {
    PeerConnection& connection = requireConnection(SyncRole::Initiator);
    try {
        connection.completeConnection(assembleCodes(answerCodes, "answer"));
    } catch (const TransportError& e) {
        reportFailure(progress, e);
        throw;
    }
    return runSync(connection, progress);
}

MergeSummary SyncSession::waitForPartnerAndSync(SyncProgressCallback progress) {
    PeerConnection& connection = requireConnection(SyncRole::Joiner);
    try {
        connection.waitForOpen(m_options.openTimeoutMs);
    } catch (const TransportError& e) {
        reportFailure(progress, e);
        connection.close();
        throw;
    }
    return runSync(connection, progress);
}

void SyncSession::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_connection) {
        m_connection->close();
    }
}

std::optional<SyncRole> SyncSession::role() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_role;
}

PeerConnection::State SyncSession::connectionState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connection ? m_connection->getState() : PeerConnection::State::Idle;
}

PeerConnection& SyncSession::beginConnection(SyncRole role) {
    std::lock_guard<std::mutex> lock(m_mutex);

    // A rejected offer leaves the connection Idle and may be retried
    if (m_connection && m_connection->getState() != PeerConnection::State::Idle) {
        throw TransportError(TransportErrorCode::InvalidState, "This sync session has already started");
    }
    if (m_connection && m_role != role) {
        throw TransportError(TransportErrorCode::InvalidState, "This sync session already has a role");
    }

    UserPreferences prefs = loadPreferences(m_store);
    if (prefs.deviceId.empty()) {
        throw StoreError("User preferences not initialised, cannot sync");
    }

    PeerConfig config = m_options.mode == NetworkMode::Remote
                            ? buildRemotePeerConfig(prefs.remoteSyncConfig)
                            : buildLocalPeerConfig();
    if (m_options.connectionTimeoutMs > 0) {
        config.connectionTimeoutMs = m_options.connectionTimeoutMs;
    }

    m_connection = std::make_unique<PeerConnection>(prefs.deviceId, std::move(config));
    m_role = role;
    spdlog::debug("SyncSession: Started as {} in {} mode",
                  role == SyncRole::Initiator ? "initiator" : "joiner",
                  networkModeToString(m_options.mode));
    return *m_connection;
}

PeerConnection& SyncSession::requireConnection(SyncRole role) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_connection || m_role != role) {
        throw TransportError(TransportErrorCode::InvalidState,
                             role == SyncRole::Initiator ? "Call startAsInitiator() first"
                                                         : "Call acceptOfferCodes() first");
    }
    return *m_connection;
}

MergeSummary SyncSession::runSync(PeerConnection& connection, const SyncProgressCallback& progress) {
    CloseOnExit closer(connection);
    return m_orchestrator.run(connection, progress);
}

void SyncSession::reportFailure(const SyncProgressCallback& progress, const std::exception& error) const {
    std::string message = m_options.mode == NetworkMode::Remote
                              ? remoteConnectionErrorMessage(error.what())
                              : std::string(error.what());
    spdlog::error("SyncSession: {}", error.what());
    if (progress) {
        progress(SyncProgress{SyncPhase::Error, message, 0, 0});
    }
}

} // namespace Balance

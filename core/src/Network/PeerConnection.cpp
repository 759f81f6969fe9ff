// PeerConnection.cpp — negotiation state machine and data channel

#include "balance/Network/PeerConnection.h"
#include "balance/Crypto.h"
#include "balance/Network/StunClient.h"
#include "balance/Network/TlsPsk.h"
#include "balance/Sync/ChunkCodec.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>

namespace Balance {

using Clock = std::chrono::steady_clock;
using State = PeerConnection::State;

namespace {

constexpr int ACCEPT_SLICE_MS = 200;
constexpr int RECEIVE_SLICE_MS = 200;
constexpr int DISCONNECT_SEND_TIMEOUT_MS = 1000;
constexpr size_t RECEIVE_BUFFER_SIZE = 64 * 1024;

int64_t epochMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int remainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

/// TLS key bound to one session: HKDF over the secret carried in the offer
PskKey deriveSessionKey(const PskKey& secret, const std::string& sessionId) {
    auto derived = Crypto::hkdf(std::vector<uint8_t>(secret.begin(), secret.end()),
                                sessionId, "balance-sync-psk", TLS_PSK_SIZE);
    PskKey key{};
    std::copy(derived.begin(), derived.end(), key.begin());
    return key;
}

enum class FrameStatus {
    Complete,
    NeedMore,
    Invalid
};

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// State table
// ═══════════════════════════════════════════════════════════

const char* PeerConnection::stateName(State state) {
    switch (state) {
        case State::Idle:          return "idle";
        case State::OfferCreated:  return "offer-created";
        case State::AnswerCreated: return "answer-created";
        case State::Connecting:    return "connecting";
        case State::Open:          return "open";
        case State::Closed:        return "closed";
        case State::Failed:        return "failed";
        default:                   return "unknown";
    }
}

bool PeerConnection::canTransition(State from, State to) {
    switch (from) {
        case State::Idle:
            return to == State::OfferCreated || to == State::AnswerCreated ||
                   to == State::Closed || to == State::Failed;
        case State::OfferCreated:
        case State::AnswerCreated:
            return to == State::Connecting || to == State::Closed || to == State::Failed;
        case State::Connecting:
            return to == State::Open || to == State::Closed || to == State::Failed;
        case State::Open:
            return to == State::Closed || to == State::Failed;
        case State::Closed:
        case State::Failed:
        default:
            return false;
    }
}

// ═══════════════════════════════════════════════════════════
// PeerConnection::Impl
// ═══════════════════════════════════════════════════════════

class PeerConnection::Impl {
public:
    Impl(std::string localDeviceId, PeerConfig config)
        : m_localDeviceId(std::move(localDeviceId)), m_config(std::move(config)) {}

    ~Impl() {
        close();
    }

    // ───────────────────────────────────────────────────────
    // Initiator
    // ───────────────────────────────────────────────────────

    std::string createOffer() {
        requireState(State::Idle, "createOffer");

        auto key = Crypto::randomBytes(TLS_PSK_SIZE);
        std::copy(key.begin(), key.end(), m_psk.begin());

        SessionDescription offer;
        offer.type = DescriptionType::Offer;
        offer.sessionId = Crypto::generateUUID();
        offer.psk = m_psk;
        offer.deviceId = m_localDeviceId;
        offer.expiresAt = epochMillis() + SESSION_DESCRIPTION_TTL_MS;

        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_sessionId = offer.sessionId;
        }

        transition(State::OfferCreated);
        spdlog::info("PeerConnection: Offer created for session {}", offer.sessionId);
        return offer.encode();
    }

    void completeConnection(const std::string& encodedAnswer) {
        requireState(State::OfferCreated, "completeConnection");

        SessionDescription answer;
        try {
            answer = SessionDescription::decode(encodedAnswer, DescriptionType::Answer, epochMillis());
        } catch (const TransportError& e) {
            fail(e.code(), e.what());
            throw;
        }

        const std::string sessionId = getSessionId();
        if (answer.sessionId != sessionId) {
            failAndThrow(TransportErrorCode::MalformedDescription,
                         "The answer belongs to a different sync session");
        }
        m_expectedPeerDeviceId = answer.deviceId;

        transition(State::Connecting);
        m_running = true;

        auto deadline = Clock::now() + std::chrono::milliseconds(m_config.connectionTimeoutMs);
        std::shared_ptr<TlsPskConnection> conn;
        std::string lastError = "no candidates";

        for (const auto& candidate : answer.candidates) {
            if (!m_running || Clock::now() >= deadline) {
                break;
            }
            auto attempt = std::make_shared<TlsPskConnection>();
            attempt->setPsk(deriveSessionKey(m_psk, sessionId), sessionId);

            int timeout = std::max(1, std::min(TLS_CONNECT_TIMEOUT_MS, remainingMs(deadline)));
            spdlog::debug("PeerConnection: Dialing {}:{} ({})", candidate.host, candidate.port, candidate.type);
            if (attempt->connect(candidate.host, candidate.port, timeout)) {
                conn = attempt;
                break;
            }
            lastError = attempt->getLastError();
            spdlog::debug("PeerConnection: Candidate {}:{} failed: {}", candidate.host, candidate.port, lastError);
        }

        if (!conn) {
            if (!m_running) {
                throw TransportError(TransportErrorCode::ChannelClosed, "Connection cancelled");
            }
            if (Clock::now() >= deadline) {
                failAndThrow(TransportErrorCode::Timeout,
                             "Connection timed out before the partner device answered");
            }
            failAndThrow(TransportErrorCode::NegotiationFailed,
                         "Could not reach the partner device: " + lastError);
        }

        {
            std::lock_guard<std::mutex> lock(m_connMutex);
            m_conn = conn;
        }

        std::string error;
        if (!exchangeHello(*conn, true, error)) {
            dropConnection();
            failAndThrow(TransportErrorCode::NegotiationFailed, error);
        }

        if (!transition(State::Open)) {
            throw TransportError(TransportErrorCode::ChannelClosed,
                                 "Connection closed during negotiation");
        }
        {
            std::lock_guard<std::mutex> lock(m_threadMutex);
            if (m_closing) {
                throw TransportError(TransportErrorCode::ChannelClosed,
                                     "Connection closed during negotiation");
            }
            m_ioThread = std::thread([this]() { receiveLoop(); });
        }
        spdlog::info("PeerConnection: Open to {} via {}", getPeerDeviceId(), conn->getRemoteAddress());
    }

    // ───────────────────────────────────────────────────────
    // Joiner
    // ───────────────────────────────────────────────────────

    std::string acceptOffer(const std::string& encodedOffer) {
        requireState(State::Idle, "acceptOffer");

        // Throws before any state change
        SessionDescription offer = SessionDescription::decode(encodedOffer, DescriptionType::Offer, epochMillis());

        m_psk = *offer.psk;
        m_expectedPeerDeviceId = offer.deviceId;
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_sessionId = offer.sessionId;
        }

        const std::string sessionId = offer.sessionId;
        m_server.setPsk(deriveSessionKey(m_psk, sessionId), m_localDeviceId);
        m_server.setIdentityValidator([sessionId](const std::string& identity) {
            return identity == sessionId;
        });

        if (!m_server.start(0)) {
            failAndThrow(TransportErrorCode::PermissionDenied,
                         "Cannot open a local endpoint: " + m_server.getLastError());
        }

        SessionDescription answer;
        answer.type = DescriptionType::Answer;
        answer.sessionId = sessionId;
        answer.deviceId = m_localDeviceId;
        answer.expiresAt = epochMillis() + SESSION_DESCRIPTION_TTL_MS;
        answer.candidates = gatherCandidates(m_server.getPort());

        transition(State::AnswerCreated);

        {
            std::lock_guard<std::mutex> lock(m_threadMutex);
            m_running = true;
            m_ioThread = std::thread([this]() { acceptLoop(); });
        }

        spdlog::info("PeerConnection: Answer created for session {} ({} candidates, port {})",
                     sessionId, answer.candidates.size(), m_server.getPort());
        return answer.encode();
    }

    // ───────────────────────────────────────────────────────
    // State
    // ───────────────────────────────────────────────────────

    void waitForOpen(int timeoutMs) {
        std::unique_lock<std::mutex> lock(m_stateMutex);
        bool settled = m_stateCv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this]() {
            return m_state == State::Open || m_state == State::Closed || m_state == State::Failed;
        });

        if (!settled) {
            throw TransportError(TransportErrorCode::Timeout,
                                 "Timed out waiting for the partner device to connect");
        }
        if (m_state == State::Open) {
            return;
        }
        if (m_state == State::Failed) {
            throw TransportError(m_lastErrorCode, m_lastError);
        }
        throw TransportError(TransportErrorCode::ChannelClosed,
                             "The connection was closed before it opened");
    }

    State getState() const {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_state;
    }

    bool isOpen() const { return getState() == State::Open; }

    bool tryClaimSync() { return !m_syncClaimed.exchange(true); }
    void releaseSync() { m_syncClaimed = false; }
    bool isSyncClaimed() const { return m_syncClaimed; }

    std::string getSessionId() const {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_sessionId;
    }

    std::string getPeerDeviceId() const {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_peerDeviceId;
    }

    const PeerConfig& getConfig() const { return m_config; }

    std::string getLastError() const {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_lastError;
    }

    TransportErrorCode getLastErrorCode() const {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        return m_lastErrorCode;
    }

    void close() {
        bool first = !m_closing.exchange(true);
        m_running = false;

        auto conn = currentConnection();
        if (first && conn && isOpen()) {
            Message bye(MessageType::Disconnect);
            auto data = MessageSerializer::serialize(bye);
            std::lock_guard<std::mutex> lock(m_sendMutex);
            if (!conn->sendAll(data.data(), data.size(), DISCONNECT_SEND_TIMEOUT_MS)) {
                spdlog::debug("PeerConnection: Disconnect notice not delivered: {}", conn->getLastError());
            }
        }
        if (conn) {
            conn->interrupt();
        }

        // Don't join if called from the io thread (e.g. inside a state callback)
        bool onIoThread = false;
        {
            std::lock_guard<std::mutex> lock(m_threadMutex);
            if (m_ioThread.joinable()) {
                if (m_ioThread.get_id() != std::this_thread::get_id()) {
                    m_ioThread.join();
                } else {
                    onIoThread = true;
                    m_ioThread.detach();
                }
            }
        }

        if (!onIoThread) {
            m_server.stop();
        }
        dropConnection();

        transition(State::Closed);
        wakeInbox();

        if (first) {
            spdlog::info("PeerConnection: Closed session {} ({})", getSessionId(), stateName(getState()));
        }
    }

    // ───────────────────────────────────────────────────────
    // Messaging
    // ───────────────────────────────────────────────────────

    void send(const Message& msg) {
        if (!isOpen()) {
            throw TransportError(TransportErrorCode::ChannelClosed, "Data channel is not open");
        }

        if (msg.type == MessageType::SyncPayload && msg.payload.size() > DATA_CHANNEL_CHUNK_SIZE) {
            auto parts = splitIntoChunks(msg.getJsonPayload(), DATA_CHANNEL_CHUNK_SIZE);
            spdlog::debug("PeerConnection: Sending {} bytes as {} parts", msg.payload.size(), parts.size());
            for (const auto& part : parts) {
                Message partMsg(MessageType::SyncPayloadPart, msg.requestId);
                partMsg.setJsonPayload(part);
                writeMessage(partMsg);
            }
            return;
        }

        writeMessage(msg);
    }

    Message waitForMessage(MessageType type, int timeoutMs) {
        auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
        std::unique_lock<std::mutex> lock(m_inboxMutex);

        while (true) {
            for (auto it = m_inbox.begin(); it != m_inbox.end(); ++it) {
                if (it->type == MessageType::Error) {
                    auto error = ErrorPayload::fromJson(it->getJsonPayload());
                    m_inbox.erase(it);
                    throw TransportError(TransportErrorCode::ProtocolViolation,
                                         "Partner reported an error: " +
                                         (error ? error->message : std::string("unknown")));
                }
                if (it->type == type) {
                    Message msg = std::move(*it);
                    m_inbox.erase(it);
                    return msg;
                }
            }

            State state = getState();
            if (state != State::Open) {
                if (state == State::Failed) {
                    throw TransportError(TransportErrorCode::ChannelClosed, getLastError());
                }
                throw TransportError(TransportErrorCode::ChannelClosed,
                                     "The connection to the partner device was closed");
            }

            if (m_inboxCv.wait_until(lock, deadline) == std::cv_status::timeout) {
                bool arrived = std::any_of(m_inbox.begin(), m_inbox.end(), [type](const Message& m) {
                    return m.type == type || m.type == MessageType::Error;
                });
                if (!arrived) {
                    throw TransportError(TransportErrorCode::Timeout,
                                         std::string("Timed out waiting for ") + messageTypeName(type));
                }
            }
        }
    }

    void onStateChanged(StateCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onStateChanged = std::move(callback);
    }

    void onChunkProgress(ChunkProgressCallback callback) {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_onChunkProgress = std::move(callback);
    }

private:
    const std::string m_localDeviceId;
    const PeerConfig m_config;

    mutable std::mutex m_stateMutex;
    std::condition_variable m_stateCv;
    State m_state = State::Idle;
    std::string m_sessionId;
    std::string m_peerDeviceId;
    std::string m_lastError;
    TransportErrorCode m_lastErrorCode = TransportErrorCode::NegotiationFailed;

    PskKey m_psk{};
    std::string m_expectedPeerDeviceId;

    TlsPskServer m_server;
    std::shared_ptr<TlsPskConnection> m_conn;
    mutable std::mutex m_connMutex;
    std::mutex m_sendMutex;

    std::thread m_ioThread;
    std::mutex m_threadMutex;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_closing{false};
    std::atomic<bool> m_syncClaimed{false};

    // Touched only by the thread that owns the read side
    std::vector<uint8_t> m_rxBuffer;
    ChunkAssembler m_assembler;
    std::string m_partRequestId;

    std::mutex m_inboxMutex;
    std::condition_variable m_inboxCv;
    std::deque<Message> m_inbox;

    std::mutex m_callbackMutex;
    StateCallback m_onStateChanged;
    ChunkProgressCallback m_onChunkProgress;

    // ───────────────────────────────────────────────────────
    // State helpers
    // ───────────────────────────────────────────────────────

    bool transition(State to) {
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (m_state == to) {
                return true;
            }
            if (!canTransition(m_state, to)) {
                spdlog::debug("PeerConnection: Ignoring {} -> {}", stateName(m_state), stateName(to));
                return false;
            }
            spdlog::debug("PeerConnection: {} -> {}", stateName(m_state), stateName(to));
            m_state = to;
        }
        m_stateCv.notify_all();
        wakeInbox();

        StateCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callback = m_onStateChanged;
        }
        if (callback) {
            callback(to);
        }
        return true;
    }

    void requireState(State expected, const char* operation) {
        State current = getState();
        if (current != expected) {
            throw TransportError(TransportErrorCode::InvalidState,
                                 std::string(operation) + " is not allowed in state " + stateName(current));
        }
    }

    void fail(TransportErrorCode code, const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (m_state == State::Closed || m_state == State::Failed) {
                return;
            }
            m_lastError = message;
            m_lastErrorCode = code;
        }
        spdlog::error("PeerConnection: {} ({})", message, transportErrorCodeName(code));
        m_running = false;
        transition(State::Failed);
    }

    [[noreturn]] void failAndThrow(TransportErrorCode code, const std::string& message) {
        fail(code, message);
        throw TransportError(code, message);
    }

    void wakeInbox() {
        { std::lock_guard<std::mutex> lock(m_inboxMutex); }
        m_inboxCv.notify_all();
    }

    std::shared_ptr<TlsPskConnection> currentConnection() const {
        std::lock_guard<std::mutex> lock(m_connMutex);
        return m_conn;
    }

    /// Interrupt and release the channel; the TLS session is freed by its last user
    void dropConnection() {
        std::shared_ptr<TlsPskConnection> conn;
        {
            std::lock_guard<std::mutex> lock(m_connMutex);
            conn = std::move(m_conn);
            m_conn.reset();
        }
        if (conn) {
            conn->interrupt();
        }
    }

    // ───────────────────────────────────────────────────────
    // Candidates
    // ───────────────────────────────────────────────────────

    std::vector<Candidate> gatherCandidates(uint16_t port) {
        std::vector<Candidate> candidates;
        for (const auto& ip : localHostAddresses()) {
            candidates.push_back({ip, port, "host"});
        }

        if (m_config.mode != NetworkMode::Remote) {
            return candidates;
        }

        for (const auto& server : m_config.iceServers) {
            std::string lower = server.url;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower.rfind("turn", 0) == 0) {
                spdlog::warn("PeerConnection: Relay server {} ignored, relaying is not supported", server.url);
            }
        }

        auto stun = m_config.stunServer();
        if (!stun) {
            spdlog::warn("PeerConnection: Remote profile without a usable STUN server");
            return candidates;
        }

        auto mapped = Stun::queryMappedAddress(stun->first, stun->second);
        if (mapped) {
            // The TCP listener is assumed to keep its port across the NAT
            Candidate srflx{mapped->host, port, "srflx"};
            if (std::find(candidates.begin(), candidates.end(), srflx) == candidates.end()) {
                candidates.insert(candidates.begin(), srflx);
            }
        }
        return candidates;
    }

    // ───────────────────────────────────────────────────────
    // I/O
    // ───────────────────────────────────────────────────────

    void writeMessage(const Message& msg) {
        auto conn = currentConnection();
        if (!conn) {
            throw TransportError(TransportErrorCode::ChannelClosed, "Data channel is not open");
        }

        auto data = MessageSerializer::serialize(msg);
        bool sent = false;
        {
            std::lock_guard<std::mutex> lock(m_sendMutex);
            sent = conn->sendAll(data.data(), data.size(), SEND_TIMEOUT_MS);
        }
        if (!sent) {
            std::string error = "Send failed: " + conn->getLastError();
            fail(TransportErrorCode::ChannelClosed, error);
            throw TransportError(TransportErrorCode::ChannelClosed, error);
        }
        spdlog::debug("PeerConnection: Sent {} ({} bytes)", messageTypeName(msg.type), data.size());
    }

    FrameStatus extractFrame(std::optional<Message>& out) {
        if (!MessageSerializer::hasValidHeader(m_rxBuffer.data(), m_rxBuffer.size())) {
            return FrameStatus::Invalid;
        }
        size_t size = MessageSerializer::getMessageSize(m_rxBuffer.data(), m_rxBuffer.size());
        if (size == 0 || size > m_rxBuffer.size()) {
            return FrameStatus::NeedMore;
        }

        auto msg = MessageSerializer::deserialize(m_rxBuffer.data(), size);
        m_rxBuffer.erase(m_rxBuffer.begin(), m_rxBuffer.begin() + static_cast<std::ptrdiff_t>(size));
        if (!msg) {
            return FrameStatus::Invalid;
        }
        out = std::move(msg);
        return FrameStatus::Complete;
    }

    /// Blocking read used during the hello exchange
    std::optional<Message> readMessage(TlsPskConnection& conn, Clock::time_point deadline,
                                       std::string& error) {
        std::vector<uint8_t> buffer(RECEIVE_BUFFER_SIZE);
        while (true) {
            std::optional<Message> msg;
            FrameStatus status = extractFrame(msg);
            if (status == FrameStatus::Complete) {
                return msg;
            }
            if (status == FrameStatus::Invalid) {
                error = "Malformed frame from partner";
                return std::nullopt;
            }

            int left = remainingMs(deadline);
            if (left == 0 || !m_running) {
                error = m_running ? "Timed out waiting for the partner's hello" : "Connection cancelled";
                return std::nullopt;
            }

            int n = conn.receive(buffer.data(), buffer.size(), std::min(left, RECEIVE_SLICE_MS));
            if (n == TLS_IO_TIMEOUT) {
                continue;
            }
            if (n <= 0) {
                error = n == 0 ? "Partner closed the connection during negotiation"
                               : "Connection lost during negotiation: " + conn.getLastError();
                return std::nullopt;
            }
            m_rxBuffer.insert(m_rxBuffer.end(), buffer.begin(), buffer.begin() + n);
        }
    }

    /// The initiator speaks first; the joiner answers after checking the session
    bool exchangeHello(TlsPskConnection& conn, bool initiator, std::string& error) {
        HelloPayload ours;
        ours.sessionId = getSessionId();
        ours.deviceId = m_localDeviceId;

        Message hello(MessageType::Hello, generateRequestId());
        hello.setJsonPayload(ours.toJson());
        auto helloBytes = MessageSerializer::serialize(hello);

        if (initiator && !conn.sendAll(helloBytes.data(), helloBytes.size(), HELLO_TIMEOUT_MS)) {
            error = "Failed to send hello: " + conn.getLastError();
            return false;
        }

        auto deadline = Clock::now() + std::chrono::milliseconds(HELLO_TIMEOUT_MS);
        auto response = readMessage(conn, deadline, error);
        if (!response) {
            return false;
        }
        if (response->type != MessageType::Hello) {
            error = std::string("Expected hello, got ") + messageTypeName(response->type);
            return false;
        }

        auto theirs = HelloPayload::fromJson(response->getJsonPayload());
        if (!theirs) {
            error = "Malformed hello from partner";
            return false;
        }
        if (theirs->sessionId != ours.sessionId) {
            error = "Partner hello belongs to a different session";
            return false;
        }
        if (theirs->protocolVersion != static_cast<int>(MESSAGE_PROTOCOL_VERSION)) {
            error = "Unsupported protocol version " + std::to_string(theirs->protocolVersion);
            return false;
        }
        if (!m_expectedPeerDeviceId.empty() && theirs->deviceId != m_expectedPeerDeviceId) {
            spdlog::error("PeerConnection: Device mismatch, expected '{}', announced '{}'",
                          m_expectedPeerDeviceId, theirs->deviceId);
            error = "Partner device does not match the negotiated session";
            return false;
        }

        if (!initiator && !conn.sendAll(helloBytes.data(), helloBytes.size(), HELLO_TIMEOUT_MS)) {
            error = "Failed to send hello: " + conn.getLastError();
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_peerDeviceId = theirs->deviceId;
        }
        spdlog::debug("PeerConnection: Hello exchanged with {}", theirs->deviceId);
        return true;
    }

    void acceptLoop() {
        auto deadline = Clock::now() + std::chrono::milliseconds(m_config.connectionTimeoutMs);
        std::unique_ptr<TlsPskConnection> accepted;

        while (m_running && Clock::now() < deadline) {
            accepted = m_server.accept(std::min(ACCEPT_SLICE_MS, std::max(1, remainingMs(deadline))));
            if (accepted) {
                break;
            }
        }
        // One partner per session
        m_server.stop();

        if (!accepted) {
            if (m_running) {
                fail(TransportErrorCode::Timeout, "Timed out waiting for the partner device to connect");
            }
            return;
        }

        std::shared_ptr<TlsPskConnection> conn(std::move(accepted));
        {
            std::lock_guard<std::mutex> lock(m_connMutex);
            m_conn = conn;
        }
        if (!m_running || !transition(State::Connecting)) {
            return;
        }

        std::string error;
        if (!exchangeHello(*conn, false, error)) {
            if (m_running) {
                dropConnection();
                fail(TransportErrorCode::NegotiationFailed, error);
            }
            return;
        }

        if (!m_running || !transition(State::Open)) {
            return;
        }
        spdlog::info("PeerConnection: Open to {} via {}", getPeerDeviceId(), conn->getRemoteAddress());
        receiveLoop();
    }

    void receiveLoop() {
        auto conn = currentConnection();
        if (!conn) {
            return;
        }

        std::vector<uint8_t> buffer(RECEIVE_BUFFER_SIZE);
        while (m_running) {
            std::optional<Message> msg;
            FrameStatus status;
            while ((status = extractFrame(msg)) == FrameStatus::Complete) {
                handleMessage(*msg);
                if (!m_running) {
                    return;
                }
            }
            if (status == FrameStatus::Invalid) {
                fail(TransportErrorCode::ProtocolViolation, "Malformed frame from partner");
                conn->interrupt();
                return;
            }

            int n = conn->receive(buffer.data(), buffer.size(), RECEIVE_SLICE_MS);
            if (n == TLS_IO_TIMEOUT) {
                continue;
            }
            if (n == 0) {
                if (m_running) {
                    spdlog::info("PeerConnection: Channel closed by partner");
                    m_running = false;
                    transition(State::Closed);
                }
                return;
            }
            if (n < 0) {
                if (m_running) {
                    fail(TransportErrorCode::ChannelClosed, "Connection lost: " + conn->getLastError());
                }
                return;
            }
            m_rxBuffer.insert(m_rxBuffer.end(), buffer.begin(), buffer.begin() + n);
        }
    }

    void handleMessage(const Message& msg) {
        spdlog::debug("PeerConnection: Received {} ({} bytes)", messageTypeName(msg.type), msg.payload.size());

        switch (msg.type) {
            case MessageType::Disconnect:
                spdlog::info("PeerConnection: Partner {} disconnected", getPeerDeviceId());
                m_running = false;
                transition(State::Closed);
                break;

            case MessageType::SyncPayloadPart:
                handlePart(msg);
                break;

            default:
                pushInbox(msg);
                break;
        }
    }

    void handlePart(const Message& msg) {
        std::string raw = msg.getJsonPayload();
        auto chunk = parseChunk(raw);
        if (!chunk) {
            fail(TransportErrorCode::ProtocolViolation, "Malformed payload part from partner");
            return;
        }

        if (m_assembler.total() != 0 && msg.requestId != m_partRequestId) {
            m_assembler.reset();
        }
        m_partRequestId = msg.requestId;

        auto assembled = m_assembler.add(raw);
        size_t received = assembled ? chunk->total : m_assembler.received();
        ChunkProgressCallback progress;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            progress = m_onChunkProgress;
        }
        if (progress) {
            progress(received, chunk->total);
        }

        if (assembled) {
            Message full(MessageType::SyncPayload, msg.requestId);
            full.setJsonPayload(*assembled);
            m_assembler.reset();
            spdlog::debug("PeerConnection: Reassembled {} parts ({} bytes)", chunk->total, full.payload.size());
            pushInbox(std::move(full));
        }
    }

    void pushInbox(Message msg) {
        {
            std::lock_guard<std::mutex> lock(m_inboxMutex);
            m_inbox.push_back(std::move(msg));
        }
        m_inboxCv.notify_all();
    }
};

// ═══════════════════════════════════════════════════════════
// Host addresses
// ═══════════════════════════════════════════════════════════

std::vector<std::string> localHostAddresses() {
    std::vector<std::string> addresses;

    struct ifaddrs* ifap = nullptr;
    if (getifaddrs(&ifap) == 0) {
        for (auto* ifa = ifap; ifa; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr) continue;
            if (ifa->ifa_addr->sa_family != AF_INET) continue;
            if (!(ifa->ifa_flags & IFF_UP)) continue;
            if (ifa->ifa_flags & IFF_LOOPBACK) continue;

            auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
            char ip[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip));
            if (std::find(addresses.begin(), addresses.end(), ip) == addresses.end()) {
                addresses.push_back(ip);
            }
        }
        freeifaddrs(ifap);
    } else {
        spdlog::warn("PeerConnection: getifaddrs failed, offering loopback only");
    }

    addresses.push_back("127.0.0.1");
    return addresses;
}

// ═══════════════════════════════════════════════════════════
// PeerConnection public interface
// ═══════════════════════════════════════════════════════════

PeerConnection::PeerConnection(std::string localDeviceId, PeerConfig config)
    : m_impl(std::make_unique<Impl>(std::move(localDeviceId), std::move(config))) {}

PeerConnection::~PeerConnection() = default;

std::string PeerConnection::createOffer() {
    return m_impl->createOffer();
}

std::string PeerConnection::acceptOffer(const std::string& encodedOffer) {
    return m_impl->acceptOffer(encodedOffer);
}

void PeerConnection::completeConnection(const std::string& encodedAnswer) {
    m_impl->completeConnection(encodedAnswer);
}

void PeerConnection::waitForOpen(int timeoutMs) {
    m_impl->waitForOpen(timeoutMs);
}

PeerConnection::State PeerConnection::getState() const {
    return m_impl->getState();
}

bool PeerConnection::isOpen() const {
    return m_impl->isOpen();
}

bool PeerConnection::tryClaimSync() {
    return m_impl->tryClaimSync();
}

void PeerConnection::releaseSync() {
    m_impl->releaseSync();
}

bool PeerConnection::isSyncClaimed() const {
    return m_impl->isSyncClaimed();
}

std::string PeerConnection::getSessionId() const {
    return m_impl->getSessionId();
}

std::string PeerConnection::getPeerDeviceId() const {
    return m_impl->getPeerDeviceId();
}

const PeerConfig& PeerConnection::getConfig() const {
    return m_impl->getConfig();
}

void PeerConnection::close() {
    m_impl->close();
}

void PeerConnection::send(const Message& msg) {
    m_impl->send(msg);
}

Message PeerConnection::waitForMessage(MessageType type, int timeoutMs) {
    return m_impl->waitForMessage(type, timeoutMs);
}

void PeerConnection::onStateChanged(StateCallback callback) {
    m_impl->onStateChanged(std::move(callback));
}

void PeerConnection::onChunkProgress(ChunkProgressCallback callback) {
    m_impl->onChunkProgress(std::move(callback));
}

std::string PeerConnection::getLastError() const {
    return m_impl->getLastError();
}

TransportErrorCode PeerConnection::getLastErrorCode() const {
    return m_impl->getLastErrorCode();
}

} // namespace Balance

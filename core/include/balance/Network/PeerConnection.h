// PeerConnection.h — offer/answer negotiation and the sync data channel

#pragma once

#include "../export.h"
#include "../Errors.h"
#include "NetworkProtocol.h"
#include "PeerConfig.h"
#include "SessionDescription.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Balance {

constexpr int HELLO_TIMEOUT_MS = 10000;
constexpr int SEND_TIMEOUT_MS = 30000;

// ═══════════════════════════════════════════════════════════
// PeerConnection — one ephemeral channel to the partner device
//
// Initiator: createOffer() → completeConnection(answer)
// Joiner:    acceptOffer(offer) → partner dials in → Open
// ═══════════════════════════════════════════════════════════

class BL_API PeerConnection {
public:
    enum class State {
        Idle,
        OfferCreated,
        AnswerCreated,
        Connecting,
        Open,
        Closed,
        Failed
    };

    static const char* stateName(State state);

    /// Transition table; Closed and Failed are terminal
    static bool canTransition(State from, State to);

    explicit PeerConnection(std::string localDeviceId,
                            PeerConfig config = buildLocalPeerConfig());
    ~PeerConnection();

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Negotiation
    // ═══════════════════════════════════════════════════════════

    /// Initiator: new session with a fresh key
    /// @return encoded offer
    /// @throws TransportError InvalidState unless Idle
    std::string createOffer();

    /// Joiner: validate the offer, open a listening endpoint and describe it.
    /// The partner is accepted in the background.
    /// @return encoded answer
    /// @throws TransportError; a malformed or expired offer leaves the state Idle
    std::string acceptOffer(const std::string& encodedOffer);

    /// Initiator: dial the answer's candidates in order and authenticate.
    /// Returns once the channel is Open.
    /// @throws TransportError, state is Failed afterwards
    void completeConnection(const std::string& encodedAnswer);

    /// Block until Open
    /// @throws TransportError Timeout, or the recorded failure if the
    ///         connection fails or closes first
    void waitForOpen(int timeoutMs);

    // ═══════════════════════════════════════════════════════════
    // State
    // ═══════════════════════════════════════════════════════════

    State getState() const;
    bool isOpen() const;

    std::string getSessionId() const;

    /// Device id announced by the partner in its hello
    std::string getPeerDeviceId() const;

    const PeerConfig& getConfig() const;

    /// Claim the channel for one sync run.
    /// @return false if another run already holds it
    bool tryClaimSync();
    void releaseSync();
    bool isSyncClaimed() const;

    /// Close the channel from any state; repeated calls are no-ops.
    /// A Failed connection stays Failed.
    void close();

    // ═══════════════════════════════════════════════════════════
    // Messaging
    // ═══════════════════════════════════════════════════════════

    /// SyncPayload messages larger than DATA_CHANNEL_CHUNK_SIZE go out
    /// as SyncPayloadPart chunks and are reassembled by the receiver.
    /// @throws TransportError ChannelClosed / InvalidState
    void send(const Message& msg);

    /// Take the next inbox message of the given type
    /// @throws TransportError Timeout, ChannelClosed, or ProtocolViolation
    ///         when the partner sent an Error message
    Message waitForMessage(MessageType type, int timeoutMs);

    // ═══════════════════════════════════════════════════════════
    // Callbacks
    // ═══════════════════════════════════════════════════════════

    using StateCallback = std::function<void(State)>;
    using ChunkProgressCallback = std::function<void(size_t received, size_t total)>;

    void onStateChanged(StateCallback callback);

    /// Called for every SyncPayloadPart, before reassembly completes
    void onChunkProgress(ChunkProgressCallback callback);

    // ═══════════════════════════════════════════════════════════
    // Error info
    // ═══════════════════════════════════════════════════════════

    std::string getLastError() const;
    TransportErrorCode getLastErrorCode() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

/// Non-loopback IPv4 addresses of this device, loopback last
BL_API std::vector<std::string> localHostAddresses();

} // namespace Balance

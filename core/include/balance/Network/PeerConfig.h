// PeerConfig.h — network profile injected into PeerConnection

#pragma once

#include "../export.h"
#include "../Models.h"
#include "../Types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Balance {

constexpr const char* DEFAULT_STUN_SERVER = "stun:stun.l.google.com:19302";
constexpr uint16_t DEFAULT_STUN_PORT = 3478;

constexpr int LOCAL_CONNECTION_TIMEOUT_MS = 30000;
constexpr int REMOTE_CONNECTION_TIMEOUT_MS = 45000;    // Extra time for NAT traversal

struct IceServer {
    std::string url;            // "stun:host[:port]" or "turn:host[:port]"
    std::string username;
    std::string credential;
};

struct BL_API PeerConfig {
    NetworkMode mode = NetworkMode::Local;
    std::vector<IceServer> iceServers;
    int connectionTimeoutMs = LOCAL_CONNECTION_TIMEOUT_MS;

    /// Host and port of the first STUN entry, if any
    std::optional<std::pair<std::string, uint16_t>> stunServer() const;
};

/// Same network: host candidates only, no external servers
BL_API PeerConfig buildLocalPeerConfig();

/// Different networks: STUN server from the user's settings (or the default
/// public one) plus an optional TURN entry
BL_API PeerConfig buildRemotePeerConfig(const std::optional<RemoteSyncConfig>& custom);

/// Split "stun:host:port" / "turn:host" into host and port
BL_API std::optional<std::pair<std::string, uint16_t>> parseServerUrl(const std::string& url);

/// User-facing guidance for a failed remote connection
BL_API std::string remoteConnectionErrorMessage(const std::string& error);

} // namespace Balance

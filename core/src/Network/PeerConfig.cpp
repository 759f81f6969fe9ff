// PeerConfig.cpp — local and remote network profiles

#include "balance/Network/PeerConfig.h"
#include <algorithm>
#include <cctype>

namespace Balance {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

std::optional<std::pair<std::string, uint16_t>> PeerConfig::stunServer() const {
    for (const auto& server : iceServers) {
        if (startsWith(toLower(server.url), "stun:")) {
            return parseServerUrl(server.url);
        }
    }
    return std::nullopt;
}

PeerConfig buildLocalPeerConfig() {
    PeerConfig config;
    config.mode = NetworkMode::Local;
    config.connectionTimeoutMs = LOCAL_CONNECTION_TIMEOUT_MS;
    return config;
}

PeerConfig buildRemotePeerConfig(const std::optional<RemoteSyncConfig>& custom) {
    PeerConfig config;
    config.mode = NetworkMode::Remote;
    config.connectionTimeoutMs = REMOTE_CONNECTION_TIMEOUT_MS;

    std::string stun = custom ? trim(custom->stunServer) : std::string();
    config.iceServers.push_back({stun.empty() ? DEFAULT_STUN_SERVER : stun, "", ""});

    if (custom) {
        std::string turn = trim(custom->turnServer);
        if (!turn.empty()) {
            config.iceServers.push_back({turn, trim(custom->turnUsername), trim(custom->turnCredential)});
        }
    }
    return config;
}

std::optional<std::pair<std::string, uint16_t>> parseServerUrl(const std::string& url) {
    std::string rest = trim(url);
    std::string lower = toLower(rest);
    for (const char* scheme : {"stun:", "stuns:", "turn:", "turns:"}) {
        if (startsWith(lower, scheme)) {
            rest = rest.substr(std::char_traits<char>::length(scheme));
            break;
        }
    }

    // Drop "?transport=udp" style suffixes
    auto query = rest.find('?');
    if (query != std::string::npos) {
        rest.erase(query);
    }
    if (rest.empty()) {
        return std::nullopt;
    }

    auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
        return std::make_pair(rest, DEFAULT_STUN_PORT);
    }

    std::string host = rest.substr(0, colon);
    std::string portText = rest.substr(colon + 1);
    if (host.empty() || portText.empty() || portText.size() > 5 ||
        !std::all_of(portText.begin(), portText.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    int port = std::stoi(portText);
    if (port <= 0 || port > 65535) {
        return std::nullopt;
    }
    return std::make_pair(host, static_cast<uint16_t>(port));
}

std::string remoteConnectionErrorMessage(const std::string& error) {
    const std::string lower = toLower(error);

    if (lower.find("timeout") != std::string::npos || lower.find("timed out") != std::string::npos) {
        return "Remote connection timed out. This can happen when:\n"
               "• The STUN server is unreachable (check your internet connection)\n"
               "• Your network's firewall is blocking the sync connection\n"
               "• Both devices are behind symmetric NATs (a relay server is needed)\n\n"
               "Try: Use \"Local network\" mode if you're on the same Wi-Fi, "
               "or use File Export/Import to transfer data manually.";
    }

    if (lower.find("failed") != std::string::npos || lower.find("disconnected") != std::string::npos) {
        return "Remote connection failed. NAT traversal was unsuccessful.\n\n"
               "This often happens behind strict or symmetric NATs where STUN alone "
               "cannot establish a direct connection.\n\n"
               "Try: Use \"Local network\" mode on the same Wi-Fi, "
               "or use File Export/Import to transfer data manually.";
    }

    return "Remote connection error: " + error + "\n\n"
           "Try: Use \"Local network\" mode if you're on the same Wi-Fi, "
           "or use File Export/Import to transfer data manually.";
}

} // namespace Balance

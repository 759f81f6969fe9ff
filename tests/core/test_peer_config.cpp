// test_peer_config.cpp — network profiles and STUN parsing

#include <gtest/gtest.h>
#include "balance/Network/PeerConfig.h"
#include "balance/Network/StunClient.h"

using namespace Balance;

// ═══════════════════════════════════════════════════════════
// PeerConfig
// ═══════════════════════════════════════════════════════════

TEST(PeerConfigTest, LocalUsesNoServers) {
    auto config = buildLocalPeerConfig();
    EXPECT_EQ(config.mode, NetworkMode::Local);
    EXPECT_TRUE(config.iceServers.empty());
    EXPECT_EQ(config.connectionTimeoutMs, LOCAL_CONNECTION_TIMEOUT_MS);
    EXPECT_FALSE(config.stunServer().has_value());
}

TEST(PeerConfigTest, RemoteDefaultsToPublicStun) {
    auto config = buildRemotePeerConfig(std::nullopt);
    EXPECT_EQ(config.mode, NetworkMode::Remote);
    EXPECT_EQ(config.connectionTimeoutMs, REMOTE_CONNECTION_TIMEOUT_MS);
    ASSERT_EQ(config.iceServers.size(), 1u);
    EXPECT_EQ(config.iceServers[0].url, DEFAULT_STUN_SERVER);

    auto stun = config.stunServer();
    ASSERT_TRUE(stun.has_value());
    EXPECT_EQ(stun->first, "stun.l.google.com");
    EXPECT_EQ(stun->second, 19302);
}

TEST(PeerConfigTest, RemoteUsesCustomServers) {
    RemoteSyncConfig custom;
    custom.stunServer = "  stun:stun.example.org:3479 ";
    custom.turnServer = "turn:relay.example.org";
    custom.turnUsername = "user";
    custom.turnCredential = "secret";

    auto config = buildRemotePeerConfig(custom);
    ASSERT_EQ(config.iceServers.size(), 2u);
    EXPECT_EQ(config.iceServers[0].url, "stun:stun.example.org:3479");
    EXPECT_EQ(config.iceServers[1].url, "turn:relay.example.org");
    EXPECT_EQ(config.iceServers[1].username, "user");
    EXPECT_EQ(config.iceServers[1].credential, "secret");
}

TEST(PeerConfigTest, BlankCustomStunFallsBackToDefault) {
    RemoteSyncConfig custom;
    custom.stunServer = "   ";
    auto config = buildRemotePeerConfig(custom);
    ASSERT_EQ(config.iceServers.size(), 1u);
    EXPECT_EQ(config.iceServers[0].url, DEFAULT_STUN_SERVER);
}

TEST(PeerConfigTest, ParseServerUrl) {
    auto full = parseServerUrl("stun:host.example:1234");
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->first, "host.example");
    EXPECT_EQ(full->second, 1234);

    auto noPort = parseServerUrl("turn:relay.example?transport=udp");
    ASSERT_TRUE(noPort.has_value());
    EXPECT_EQ(noPort->first, "relay.example");
    EXPECT_EQ(noPort->second, DEFAULT_STUN_PORT);

    EXPECT_FALSE(parseServerUrl("stun:").has_value());
    EXPECT_FALSE(parseServerUrl("stun:host:0").has_value());
    EXPECT_FALSE(parseServerUrl("stun:host:99999").has_value());
    EXPECT_FALSE(parseServerUrl("stun:host:abc").has_value());
}

TEST(PeerConfigTest, RemoteErrorGuidance) {
    EXPECT_EQ(remoteConnectionErrorMessage("Connection timed out").rfind("Remote connection timed out", 0), 0u);
    EXPECT_EQ(remoteConnectionErrorMessage("ICE failed").rfind("Remote connection failed", 0), 0u);

    std::string other = remoteConnectionErrorMessage("weird");
    EXPECT_EQ(other.rfind("Remote connection error: weird", 0), 0u);
    EXPECT_NE(other.find("File Export/Import"), std::string::npos);
}

// ═══════════════════════════════════════════════════════════
// STUN
// ═══════════════════════════════════════════════════════════

namespace {

StunTransactionId testTransaction() {
    StunTransactionId id{};
    for (size_t i = 0; i < id.size(); ++i) {
        id[i] = static_cast<uint8_t>(0xA0 + i);
    }
    return id;
}

// Success response carrying one address attribute for 192.0.2.1:32853
std::vector<uint8_t> bindingResponse(const StunTransactionId& id, uint16_t attrType) {
    std::vector<uint8_t> out = {0x01, 0x01, 0x00, 0x0C, 0x21, 0x12, 0xA4, 0x42};
    out.insert(out.end(), id.begin(), id.end());

    uint16_t port = 32853;
    uint32_t addr = 0xC0000201;
    if (attrType == STUN_ATTR_XOR_MAPPED_ADDRESS) {
        port ^= static_cast<uint16_t>(STUN_MAGIC_COOKIE >> 16);
        addr ^= STUN_MAGIC_COOKIE;
    }
    out.push_back(static_cast<uint8_t>(attrType >> 8));
    out.push_back(static_cast<uint8_t>(attrType & 0xFF));
    out.push_back(0x00);
    out.push_back(0x08);
    out.push_back(0x00);
    out.push_back(0x01);  // IPv4
    out.push_back(static_cast<uint8_t>(port >> 8));
    out.push_back(static_cast<uint8_t>(port & 0xFF));
    out.push_back(static_cast<uint8_t>(addr >> 24));
    out.push_back(static_cast<uint8_t>((addr >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((addr >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(addr & 0xFF));
    return out;
}

} // anonymous namespace

TEST(StunTest, BindingRequestLayout) {
    auto id = testTransaction();
    auto request = Stun::buildBindingRequest(id);
    ASSERT_EQ(request.size(), STUN_HEADER_SIZE);
    EXPECT_EQ(request[0], 0x00);
    EXPECT_EQ(request[1], 0x01);
    EXPECT_EQ(request[4], 0x21);
    EXPECT_EQ(request[7], 0x42);
    EXPECT_EQ(request[8], 0xA0);
}

TEST(StunTest, ParsesXorMappedAddress) {
    auto id = testTransaction();
    auto response = bindingResponse(id, STUN_ATTR_XOR_MAPPED_ADDRESS);
    auto mapped = Stun::parseBindingResponse(response.data(), response.size(), id);
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(mapped->host, "192.0.2.1");
    EXPECT_EQ(mapped->port, 32853);
}

TEST(StunTest, ParsesPlainMappedAddress) {
    auto id = testTransaction();
    auto response = bindingResponse(id, STUN_ATTR_MAPPED_ADDRESS);
    auto mapped = Stun::parseBindingResponse(response.data(), response.size(), id);
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(mapped->host, "192.0.2.1");
    EXPECT_EQ(mapped->port, 32853);
}

TEST(StunTest, RejectsForeignTransaction) {
    auto id = testTransaction();
    auto response = bindingResponse(id, STUN_ATTR_XOR_MAPPED_ADDRESS);
    StunTransactionId other = id;
    other[0] ^= 0xFF;
    EXPECT_FALSE(Stun::parseBindingResponse(response.data(), response.size(), other).has_value());
}

TEST(StunTest, RejectsTruncatedResponse) {
    auto id = testTransaction();
    auto response = bindingResponse(id, STUN_ATTR_XOR_MAPPED_ADDRESS);
    EXPECT_FALSE(Stun::parseBindingResponse(response.data(), response.size() - 4, id).has_value());
    EXPECT_FALSE(Stun::parseBindingResponse(response.data(), 10, id).has_value());
    EXPECT_FALSE(Stun::parseBindingResponse(nullptr, 0, id).has_value());
}

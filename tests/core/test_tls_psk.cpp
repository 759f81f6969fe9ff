// test_tls_psk.cpp — TLS 1.3 PSK stream

#include <gtest/gtest.h>
#include "balance/Network/TlsPsk.h"
#include <atomic>
#include <cstring>
#include <thread>

using namespace Balance;

namespace {

PskKey getTestPsk() {
    PskKey psk;
    for (size_t i = 0; i < TLS_PSK_SIZE; ++i) {
        psk[i] = static_cast<uint8_t>(i + 1);
    }
    return psk;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// TlsPskConnection Tests
// ═══════════════════════════════════════════════════════════

TEST(TlsPskConnectionTest, CreateAndDestroy) {
    TlsPskConnection conn;
    EXPECT_FALSE(conn.isConnected());
}

TEST(TlsPskConnectionTest, ConnectWithoutServer) {
    // Grab a free port, then release it so nothing listens there
    uint16_t port = 0;
    {
        TlsPskServer scout;
        scout.setPsk(getTestPsk(), "scout");
        ASSERT_TRUE(scout.start(0));
        port = scout.getPort();
        scout.stop();
    }

    TlsPskConnection conn;
    conn.setPsk(getTestPsk(), "test-client");
    EXPECT_FALSE(conn.connect("127.0.0.1", port, 1000));
    EXPECT_FALSE(conn.isConnected());
    EXPECT_FALSE(conn.getLastError().empty());
}

TEST(TlsPskConnectionTest, SendWithoutConnectionFails) {
    TlsPskConnection conn;
    const uint8_t byte = 1;
    EXPECT_FALSE(conn.sendAll(&byte, 1, 100));
}

// ═══════════════════════════════════════════════════════════
// TlsPskServer Tests
// ═══════════════════════════════════════════════════════════

TEST(TlsPskServerTest, CreateAndDestroy) {
    TlsPskServer server;
    EXPECT_FALSE(server.isRunning());
}

TEST(TlsPskServerTest, StartOnEphemeralPort) {
    TlsPskServer server;
    server.setPsk(getTestPsk(), "test-server");

    ASSERT_TRUE(server.start(0));
    EXPECT_TRUE(server.isRunning());
    EXPECT_NE(server.getPort(), 0);

    server.stop();
    EXPECT_FALSE(server.isRunning());
}

TEST(TlsPskServerTest, DoubleStartIsIdempotent) {
    TlsPskServer server;
    server.setPsk(getTestPsk(), "test-server");

    ASSERT_TRUE(server.start(0));
    uint16_t port = server.getPort();
    EXPECT_TRUE(server.start(0));
    EXPECT_EQ(server.getPort(), port);

    server.stop();
}

TEST(TlsPskServerTest, AcceptTimesOut) {
    TlsPskServer server;
    server.setPsk(getTestPsk(), "test-server");
    ASSERT_TRUE(server.start(0));

    EXPECT_EQ(server.accept(100), nullptr);
    server.stop();
}

// ═══════════════════════════════════════════════════════════
// Client-Server Integration Tests
// ═══════════════════════════════════════════════════════════

TEST(TlsPskIntegrationTest, ConnectAndExchangeData) {
    auto psk = getTestPsk();

    TlsPskServer server;
    server.setPsk(psk, "server-device-id");
    ASSERT_TRUE(server.start(0));
    const uint16_t port = server.getPort();

    std::string serverReceivedMsg;
    std::string serverIdentity;
    std::string serverError;

    std::thread serverThread([&]() {
        auto conn = server.accept(5000);
        if (!conn) {
            serverError = server.getLastError();
            return;
        }
        serverIdentity = conn->getPeerIdentity();

        uint8_t buffer[256];
        int received = conn->receive(buffer, sizeof(buffer), 5000);
        if (received > 0) {
            serverReceivedMsg.assign(reinterpret_cast<char*>(buffer), static_cast<size_t>(received));
        }

        const char* response = "Hello from server!";
        conn->sendAll(reinterpret_cast<const uint8_t*>(response), strlen(response), 5000);
        conn->close();
    });

    TlsPskConnection client;
    client.setPsk(psk, "session-42");

    ASSERT_TRUE(client.connect("127.0.0.1", port, 5000)) << "Client failed to connect: " << client.getLastError();
    EXPECT_TRUE(client.isConnected());

    const char* clientMsg = "Hello from client!";
    EXPECT_TRUE(client.sendAll(reinterpret_cast<const uint8_t*>(clientMsg), strlen(clientMsg), 5000));

    uint8_t buffer[256];
    int received = client.receive(buffer, sizeof(buffer), 5000);
    ASSERT_GT(received, 0);
    EXPECT_EQ(std::string(reinterpret_cast<char*>(buffer), static_cast<size_t>(received)), "Hello from server!");

    serverThread.join();
    client.close();

    EXPECT_TRUE(serverError.empty()) << "Server error: " << serverError;
    EXPECT_EQ(serverReceivedMsg, "Hello from client!");
    EXPECT_EQ(serverIdentity, "session-42");

    server.stop();
}

TEST(TlsPskIntegrationTest, ReceiveTimesOutWithoutData) {
    auto psk = getTestPsk();

    TlsPskServer server;
    server.setPsk(psk, "server");
    ASSERT_TRUE(server.start(0));

    std::unique_ptr<TlsPskConnection> serverConn;
    std::thread serverThread([&]() {
        serverConn = server.accept(5000);
    });

    TlsPskConnection client;
    client.setPsk(psk, "client");
    ASSERT_TRUE(client.connect("127.0.0.1", server.getPort(), 5000)) << client.getLastError();
    serverThread.join();
    ASSERT_NE(serverConn, nullptr);

    uint8_t buffer[16];
    EXPECT_EQ(client.receive(buffer, sizeof(buffer), 100), TLS_IO_TIMEOUT);

    serverConn->close();
    client.close();
    server.stop();
}

TEST(TlsPskIntegrationTest, WrongPskRejected) {
    auto serverPsk = getTestPsk();
    auto clientPsk = getTestPsk();
    clientPsk[0] = 0xFF;

    TlsPskServer server;
    server.setPsk(serverPsk, "server");
    ASSERT_TRUE(server.start(0));

    std::unique_ptr<TlsPskConnection> serverConn;
    std::thread serverThread([&]() {
        serverConn = server.accept(3000);
    });

    TlsPskConnection client;
    client.setPsk(clientPsk, "client");
    bool connected = client.connect("127.0.0.1", server.getPort(), 3000);

    serverThread.join();

    // A different key never yields a working session on both ends
    EXPECT_FALSE(connected && serverConn);
    EXPECT_EQ(serverConn, nullptr);

    server.stop();
}

TEST(TlsPskIntegrationTest, IdentityValidation) {
    auto psk = getTestPsk();

    TlsPskServer server;
    server.setPsk(psk, "server");
    server.setIdentityValidator([](const std::string& identity) {
        return identity == "allowed-session";
    });
    ASSERT_TRUE(server.start(0));

    std::unique_ptr<TlsPskConnection> serverConn;
    std::thread serverThread([&]() {
        serverConn = server.accept(3000);
    });

    TlsPskConnection client;
    client.setPsk(psk, "other-session");
    client.connect("127.0.0.1", server.getPort(), 3000);

    serverThread.join();
    EXPECT_EQ(serverConn, nullptr) << "Server should have rejected the identity";

    server.stop();
}

// TlsPsk.h — TLS 1.3 PSK stream carrying the sync data channel

#pragma once

#include "../export.h"
#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Balance {

// ═══════════════════════════════════════════════════════════
// Constants
// ═══════════════════════════════════════════════════════════

constexpr size_t TLS_PSK_SIZE = 32;             // 256-bit PSK
constexpr int TLS_HANDSHAKE_TIMEOUT_MS = 5000;
constexpr int TLS_CONNECT_TIMEOUT_MS = 3000;    // Per candidate

/// Returned by receive() when nothing arrived within the timeout
constexpr int TLS_IO_TIMEOUT = -2;

using PskKey = std::array<uint8_t, TLS_PSK_SIZE>;

// ═══════════════════════════════════════════════════════════
// TlsPskConnection — one authenticated stream
// After the handshake the socket is non-blocking, so a send and a
// receive from different threads interleave instead of blocking each other.
// ═══════════════════════════════════════════════════════════

class BL_API TlsPskConnection {
public:
    TlsPskConnection();
    ~TlsPskConnection();

    TlsPskConnection(const TlsPskConnection&) = delete;
    TlsPskConnection& operator=(const TlsPskConnection&) = delete;

    TlsPskConnection(TlsPskConnection&& other) noexcept;
    TlsPskConnection& operator=(TlsPskConnection&& other) noexcept;

    /// PSK and the identity presented to the server
    void setPsk(const PskKey& psk, const std::string& identity);

    /// Dial and perform the client handshake
    /// @return false on refusal, timeout or handshake failure (see getLastError)
    bool connect(const std::string& host, uint16_t port,
                 int timeoutMs = TLS_CONNECT_TIMEOUT_MS);

    /// Server handshake on an accepted socket (ownership is taken)
    bool accept(int socket);

    /// Wake any thread blocked in send/receive; the connection stays allocated
    void interrupt();

    void close();

    bool isConnected() const;

    /// Write everything or fail
    /// @return false on error, peer close or interrupt
    bool sendAll(const uint8_t* data, size_t size, int timeoutMs);

    /// @return bytes read, 0 when the peer closed, -1 on error, TLS_IO_TIMEOUT
    int receive(uint8_t* buffer, size_t maxSize, int timeoutMs);

    /// Identity the client presented (server side)
    std::string getPeerIdentity() const;
    std::string getRemoteAddress() const;
    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ═══════════════════════════════════════════════════════════
// TlsPskServer — listening endpoint for one session
// ═══════════════════════════════════════════════════════════

class BL_API TlsPskServer {
public:
    TlsPskServer();
    ~TlsPskServer();

    TlsPskServer(const TlsPskServer&) = delete;
    TlsPskServer& operator=(const TlsPskServer&) = delete;

    void setPsk(const PskKey& psk, const std::string& localIdentity);

    /// Reject clients whose identity does not match
    using IdentityValidator = std::function<bool(const std::string& identity)>;
    void setIdentityValidator(IdentityValidator validator);

    /// @param port 0 picks a free port
    bool start(uint16_t port = 0);

    void stop();

    bool isRunning() const;

    /// Wait up to timeoutMs for a client and run the handshake
    /// @return nullptr on timeout, failed handshake or stop
    std::unique_ptr<TlsPskConnection> accept(int timeoutMs);

    uint16_t getPort() const;

    std::string getLastError() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Balance

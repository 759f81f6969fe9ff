// TlsPsk.cpp — TLS 1.3 PSK implementation using OpenSSL

#include "balance/Network/TlsPsk.h"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstring>
#include <mutex>

#include <sys/socket.h>
#include <sys/types.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>

namespace Balance {

using Clock = std::chrono::steady_clock;

namespace {

constexpr int SOCKET_INVALID = -1;
constexpr int POLL_SLICE_MS = 100;

class OpenSslInit {
public:
    OpenSslInit() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
        // A write to a socket the peer already closed must fail, not kill the process
        std::signal(SIGPIPE, SIG_IGN);
    }
};

static OpenSslInit g_openSslInit;

std::string getOpenSslError() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "Unknown SSL error";
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return buf;
}

bool setNonBlocking(int fd, bool enabled) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

void setIoTimeout(int fd, int timeoutMs) {
    timeval tv{};
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

std::string peerAddressOf(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return "";
    }
    char ip[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

int remainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// TlsPskConnection::Impl
// ═══════════════════════════════════════════════════════════

class TlsPskConnection::Impl {
public:
    Impl() = default;

    ~Impl() {
        close();
    }

    void setPsk(const PskKey& psk, const std::string& identity) {
        m_psk = psk;
        m_identity = identity;
    }

    bool connect(const std::string& host, uint16_t port, int timeoutMs) {
        if (m_connected) {
            m_lastError = "Already connected";
            return false;
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
            addrinfo hints{};
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_STREAM;
            addrinfo* result = nullptr;
            if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result) {
                m_lastError = "Failed to resolve host: " + host;
                return false;
            }
            addr.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
            freeaddrinfo(result);
        }

        m_socket = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (m_socket == SOCKET_INVALID) {
            m_lastError = "Failed to create socket: " + std::string(strerror(errno));
            return false;
        }

        // Non-blocking connect bounded by poll
        setNonBlocking(m_socket, true);
        int rc = ::connect(m_socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        if (rc < 0 && errno != EINPROGRESS) {
            m_lastError = "Failed to connect: " + std::string(strerror(errno));
            closeSocket();
            return false;
        }
        if (rc < 0) {
            pollfd pfd{m_socket, POLLOUT, 0};
            int ready = ::poll(&pfd, 1, timeoutMs);
            if (ready <= 0) {
                m_lastError = ready == 0 ? "Connect timed out" : "poll failed: " + std::string(strerror(errno));
                closeSocket();
                return false;
            }
            int soError = 0;
            socklen_t len = sizeof(soError);
            getsockopt(m_socket, SOL_SOCKET, SO_ERROR, &soError, &len);
            if (soError != 0) {
                m_lastError = "Failed to connect: " + std::string(strerror(soError));
                closeSocket();
                return false;
            }
        }
        setNonBlocking(m_socket, false);

        m_remoteAddress = host + ":" + std::to_string(port);

        if (!setupTls(false)) {
            freeTls();
            closeSocket();
            return false;
        }

        m_connected = true;
        spdlog::info("TLS PSK: Connected to {}", m_remoteAddress);
        return true;
    }

    bool accept(int socket) {
        if (m_connected) {
            m_lastError = "Already connected";
            ::close(socket);
            return false;
        }

        m_socket = socket;
        m_remoteAddress = peerAddressOf(socket);

        if (!setupTls(true)) {
            freeTls();
            closeSocket();
            return false;
        }

        m_connected = true;
        spdlog::info("TLS PSK: Accepted connection from {}", m_remoteAddress);
        return true;
    }

    void interrupt() {
        m_interrupted = true;
        if (m_socket != SOCKET_INVALID) {
            ::shutdown(m_socket, SHUT_RDWR);
        }
    }

    void close() {
        if (m_ssl && m_connected && !m_interrupted) {
            std::lock_guard<std::mutex> lock(m_sslMutex);
            SSL_shutdown(m_ssl);
        }
        freeTls();
        closeSocket();
        m_connected = false;
    }

    bool isConnected() const {
        return m_connected && m_ssl != nullptr;
    }

    bool sendAll(const uint8_t* data, size_t size, int timeoutMs) {
        if (!isConnected()) {
            m_lastError = "Not connected";
            return false;
        }

        auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
        size_t sent = 0;
        while (sent < size) {
            int n = 0;
            int err = SSL_ERROR_NONE;
            {
                std::lock_guard<std::mutex> lock(m_sslMutex);
                size_t chunk = std::min(size - sent, static_cast<size_t>(INT_MAX));
                n = SSL_write(m_ssl, data + sent, static_cast<int>(chunk));
                if (n <= 0) {
                    err = SSL_get_error(m_ssl, n);
                }
            }

            if (n > 0) {
                sent += static_cast<size_t>(n);
                continue;
            }

            if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) {
                if (remainingMs(deadline) == 0) {
                    m_lastError = "Send timed out";
                    return false;
                }
                if (waitSocket(err == SSL_ERROR_WANT_WRITE ? POLLOUT : POLLIN, deadline) < 0) {
                    return false;
                }
                continue;
            }

            m_connected = false;
            m_lastError = err == SSL_ERROR_ZERO_RETURN
                              ? "Connection closed by peer"
                              : "SSL_write error: " + std::to_string(err);
            return false;
        }
        return true;
    }

    int receive(uint8_t* buffer, size_t maxSize, int timeoutMs) {
        if (!isConnected()) {
            m_lastError = "Not connected";
            return -1;
        }

        auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
        while (true) {
            int n = 0;
            int err = SSL_ERROR_NONE;
            {
                std::lock_guard<std::mutex> lock(m_sslMutex);
                size_t chunk = std::min(maxSize, static_cast<size_t>(INT_MAX));
                n = SSL_read(m_ssl, buffer, static_cast<int>(chunk));
                if (n <= 0) {
                    err = SSL_get_error(m_ssl, n);
                }
            }

            if (n > 0) {
                return n;
            }

            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                if (m_interrupted) {
                    return 0;
                }
                if (remainingMs(deadline) == 0) {
                    return TLS_IO_TIMEOUT;
                }
                int ready = waitSocket(err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline);
                if (ready < 0) {
                    return m_interrupted ? 0 : -1;
                }
                continue;
            }

            m_connected = false;
            if (err == SSL_ERROR_ZERO_RETURN || (err == SSL_ERROR_SYSCALL && errno == 0) ||
                m_interrupted) {
                return 0;
            }
            m_lastError = "SSL_read error: " + std::to_string(err);
            return -1;
        }
    }

    std::string getPeerIdentity() const { return m_peerIdentity; }
    std::string getRemoteAddress() const { return m_remoteAddress; }
    std::string getLastError() const { return m_lastError; }

private:
    int m_socket = SOCKET_INVALID;
    SSL_CTX* m_ctx = nullptr;
    SSL* m_ssl = nullptr;
    std::atomic<bool> m_connected{false};
    std::atomic<bool> m_interrupted{false};
    std::mutex m_sslMutex;

    PskKey m_psk{};
    std::string m_identity;
    std::string m_peerIdentity;
    std::string m_remoteAddress;
    std::string m_lastError;

    void closeSocket() {
        if (m_socket != SOCKET_INVALID) {
            ::close(m_socket);
            m_socket = SOCKET_INVALID;
        }
    }

    void freeTls() {
        if (m_ssl) {
            SSL_free(m_ssl);
            m_ssl = nullptr;
        }
        if (m_ctx) {
            SSL_CTX_free(m_ctx);
            m_ctx = nullptr;
        }
    }

    /// @return 1 ready, 0 sliced timeout, -1 error or interrupted
    int waitSocket(short events, Clock::time_point deadline) {
        if (m_interrupted) {
            m_lastError = "Interrupted";
            return -1;
        }
        pollfd pfd{m_socket, events, 0};
        int ready = ::poll(&pfd, 1, std::min(POLL_SLICE_MS, std::max(remainingMs(deadline), 1)));
        if (ready < 0 && errno != EINTR) {
            m_lastError = "poll failed: " + std::string(strerror(errno));
            return -1;
        }
        if (m_interrupted) {
            m_lastError = "Interrupted";
            return -1;
        }
        return ready > 0 ? 1 : 0;
    }

    bool setupTls(bool server) {
        m_ctx = SSL_CTX_new(server ? TLS_server_method() : TLS_client_method());
        if (!m_ctx) {
            m_lastError = "Failed to create SSL context: " + getOpenSslError();
            return false;
        }

        SSL_CTX_set_min_proto_version(m_ctx, TLS1_3_VERSION);
        SSL_CTX_set_max_proto_version(m_ctx, TLS1_3_VERSION);
        SSL_CTX_set_ciphersuites(m_ctx, "TLS_AES_256_GCM_SHA384:TLS_CHACHA20_POLY1305_SHA256");
        SSL_CTX_set_mode(m_ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

        if (server) {
            SSL_CTX_set_psk_find_session_callback(m_ctx, pskServerCallback);
            // One-shot session, no resumption tickets
            SSL_CTX_set_num_tickets(m_ctx, 0);
        } else {
            SSL_CTX_set_psk_use_session_callback(m_ctx, pskClientCallback);
        }

        m_ssl = SSL_new(m_ctx);
        if (!m_ssl) {
            m_lastError = "Failed to create SSL object: " + getOpenSslError();
            return false;
        }

        SSL_set_app_data(m_ssl, this);
        SSL_set_fd(m_ssl, m_socket);

        setIoTimeout(m_socket, TLS_HANDSHAKE_TIMEOUT_MS);
        int result = server ? SSL_accept(m_ssl) : SSL_connect(m_ssl);
        setIoTimeout(m_socket, 0);

        if (result != 1) {
            int err = SSL_get_error(m_ssl, result);
            m_lastError = "TLS handshake failed: " + std::to_string(err) + " - " + getOpenSslError();
            return false;
        }

        int noDelay = 1;
        setsockopt(m_socket, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));
        setNonBlocking(m_socket, true);

        spdlog::debug("TLS PSK: {} handshake complete", server ? "Server" : "Client");
        return true;
    }

    static SSL_SESSION* makePskSession(SSL* ssl, const PskKey& psk) {
        SSL_SESSION* session = SSL_SESSION_new();
        if (!session) return nullptr;

        const SSL_CIPHER* cipher = SSL_CIPHER_find(ssl, reinterpret_cast<const unsigned char*>("\x13\x02")); // TLS_AES_256_GCM_SHA384
        if (!cipher || SSL_SESSION_set_cipher(session, cipher) != 1 ||
            SSL_SESSION_set_protocol_version(session, TLS1_3_VERSION) != 1 ||
            SSL_SESSION_set1_master_key(session, psk.data(), psk.size()) != 1) {
            SSL_SESSION_free(session);
            return nullptr;
        }
        return session;
    }

    static int pskClientCallback(SSL* ssl, const EVP_MD* /*md*/,
                                 const unsigned char** id, size_t* idlen,
                                 SSL_SESSION** sess) {
        auto* self = static_cast<Impl*>(SSL_get_app_data(ssl));
        if (!self) return 0;

        SSL_SESSION* session = makePskSession(ssl, self->m_psk);
        if (!session) return 0;

        *id = reinterpret_cast<const unsigned char*>(self->m_identity.c_str());
        *idlen = self->m_identity.size();
        *sess = session;
        return 1;
    }

    static int pskServerCallback(SSL* ssl, const unsigned char* identity,
                                 size_t identity_len, SSL_SESSION** sess) {
        auto* self = static_cast<Impl*>(SSL_get_app_data(ssl));
        if (!self) return 0;

        self->m_peerIdentity = std::string(reinterpret_cast<const char*>(identity), identity_len);
        spdlog::debug("TLS PSK: Server received identity: {}", self->m_peerIdentity);

        SSL_SESSION* session = makePskSession(ssl, self->m_psk);
        if (!session) return 0;

        *sess = session;
        return 1;
    }
};

// ═══════════════════════════════════════════════════════════
// TlsPskConnection public interface
// ═══════════════════════════════════════════════════════════

TlsPskConnection::TlsPskConnection() : m_impl(std::make_unique<Impl>()) {}
TlsPskConnection::~TlsPskConnection() = default;

TlsPskConnection::TlsPskConnection(TlsPskConnection&& other) noexcept = default;
TlsPskConnection& TlsPskConnection::operator=(TlsPskConnection&& other) noexcept = default;

void TlsPskConnection::setPsk(const PskKey& psk, const std::string& identity) {
    m_impl->setPsk(psk, identity);
}

bool TlsPskConnection::connect(const std::string& host, uint16_t port, int timeoutMs) {
    return m_impl->connect(host, port, timeoutMs);
}

bool TlsPskConnection::accept(int socket) {
    return m_impl->accept(socket);
}

void TlsPskConnection::interrupt() {
    m_impl->interrupt();
}

void TlsPskConnection::close() {
    m_impl->close();
}

bool TlsPskConnection::isConnected() const {
    return m_impl->isConnected();
}

bool TlsPskConnection::sendAll(const uint8_t* data, size_t size, int timeoutMs) {
    return m_impl->sendAll(data, size, timeoutMs);
}

int TlsPskConnection::receive(uint8_t* buffer, size_t maxSize, int timeoutMs) {
    return m_impl->receive(buffer, maxSize, timeoutMs);
}

std::string TlsPskConnection::getPeerIdentity() const { return m_impl->getPeerIdentity(); }
std::string TlsPskConnection::getRemoteAddress() const { return m_impl->getRemoteAddress(); }
std::string TlsPskConnection::getLastError() const { return m_impl->getLastError(); }

// ═══════════════════════════════════════════════════════════
// TlsPskServer::Impl
// ═══════════════════════════════════════════════════════════

class TlsPskServer::Impl {
public:
    Impl() = default;

    ~Impl() {
        stop();
    }

    void setPsk(const PskKey& psk, const std::string& localIdentity) {
        m_psk = psk;
        m_localIdentity = localIdentity;
    }

    void setIdentityValidator(IdentityValidator validator) {
        m_identityValidator = std::move(validator);
    }

    bool start(uint16_t port) {
        if (m_running) return true;

        m_listenSocket = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (m_listenSocket == SOCKET_INVALID) {
            m_lastError = "Failed to create socket: " + std::string(strerror(errno));
            return false;
        }

        int reuseAddr = 1;
        setsockopt(m_listenSocket, SOL_SOCKET, SO_REUSEADDR, &reuseAddr, sizeof(reuseAddr));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = INADDR_ANY;

        if (bind(m_listenSocket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            m_lastError = "Failed to bind: " + std::string(strerror(errno));
            closeListen();
            return false;
        }

        if (listen(m_listenSocket, 4) < 0) {
            m_lastError = "Failed to listen: " + std::string(strerror(errno));
            closeListen();
            return false;
        }

        sockaddr_in boundAddr{};
        socklen_t addrLen = sizeof(boundAddr);
        if (getsockname(m_listenSocket, reinterpret_cast<sockaddr*>(&boundAddr), &addrLen) != 0) {
            m_lastError = "Failed to get bound port";
            closeListen();
            return false;
        }
        m_port = ntohs(boundAddr.sin_port);

        m_running = true;
        spdlog::info("TLS PSK Server: Started on port {}", m_port);
        return true;
    }

    void stop() {
        bool wasRunning = m_running.exchange(false);
        closeListen();
        if (wasRunning) {
            spdlog::info("TLS PSK Server: Stopped");
        }
    }

    bool isRunning() const { return m_running; }

    std::unique_ptr<TlsPskConnection> accept(int timeoutMs) {
        if (!m_running) return nullptr;

        pollfd pfd{m_listenSocket, POLLIN, 0};
        int ready = ::poll(&pfd, 1, timeoutMs);
        if (ready <= 0 || !m_running) {
            if (ready < 0 && errno != EINTR) {
                m_lastError = "poll failed: " + std::string(strerror(errno));
            }
            return nullptr;
        }

        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientSocket = ::accept(m_listenSocket,
                                    reinterpret_cast<sockaddr*>(&clientAddr),
                                    &clientLen);
        if (clientSocket == SOCKET_INVALID) {
            if (m_running) {
                m_lastError = "Accept failed: " + std::string(strerror(errno));
            }
            return nullptr;
        }

        char clientIp[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &clientAddr.sin_addr, clientIp, sizeof(clientIp));
        spdlog::debug("TLS PSK Server: Incoming connection from {}", clientIp);

        auto conn = std::make_unique<TlsPskConnection>();
        conn->setPsk(m_psk, m_localIdentity);

        if (!conn->accept(clientSocket)) {
            m_lastError = conn->getLastError();
            spdlog::warn("TLS PSK Server: Handshake failed from {}: {}", clientIp, m_lastError);
            return nullptr;
        }

        if (m_identityValidator) {
            std::string peerIdentity = conn->getPeerIdentity();
            if (!m_identityValidator(peerIdentity)) {
                spdlog::warn("TLS PSK Server: Identity rejected: {}", peerIdentity);
                m_lastError = "Identity rejected";
                conn->close();
                return nullptr;
            }
        }

        return conn;
    }

    uint16_t getPort() const { return m_port; }
    std::string getLastError() const { return m_lastError; }

private:
    int m_listenSocket = SOCKET_INVALID;
    uint16_t m_port = 0;
    std::atomic<bool> m_running{false};

    PskKey m_psk{};
    std::string m_localIdentity;
    IdentityValidator m_identityValidator;
    std::string m_lastError;

    void closeListen() {
        if (m_listenSocket != SOCKET_INVALID) {
            ::close(m_listenSocket);
            m_listenSocket = SOCKET_INVALID;
        }
    }
};

// ═══════════════════════════════════════════════════════════
// TlsPskServer public interface
// ═══════════════════════════════════════════════════════════

TlsPskServer::TlsPskServer() : m_impl(std::make_unique<Impl>()) {}
TlsPskServer::~TlsPskServer() = default;

void TlsPskServer::setPsk(const PskKey& psk, const std::string& localIdentity) {
    m_impl->setPsk(psk, localIdentity);
}

void TlsPskServer::setIdentityValidator(IdentityValidator validator) {
    m_impl->setIdentityValidator(std::move(validator));
}

bool TlsPskServer::start(uint16_t port) {
    return m_impl->start(port);
}

void TlsPskServer::stop() {
    m_impl->stop();
}

bool TlsPskServer::isRunning() const {
    return m_impl->isRunning();
}

std::unique_ptr<TlsPskConnection> TlsPskServer::accept(int timeoutMs) {
    return m_impl->accept(timeoutMs);
}

uint16_t TlsPskServer::getPort() const {
    return m_impl->getPort();
}

std::string TlsPskServer::getLastError() const {
    return m_impl->getLastError();
}

} // namespace Balance

// StunClient.cpp — STUN binding over UDP

#include "balance/Network/StunClient.h"
#include "balance/Crypto.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>

namespace Balance {
namespace Stun {

namespace {

void writeU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void writeU32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t readU32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

std::optional<MappedAddress> decodeAddress(const uint8_t* value, uint16_t length, bool xored) {
    // Reserved(1) Family(1) Port(2) Address(4)
    if (length < 8 || value[1] != 0x01) {
        return std::nullopt;
    }
    uint16_t port = readU16(value + 2);
    uint32_t addr = readU32(value + 4);
    if (xored) {
        port ^= static_cast<uint16_t>(STUN_MAGIC_COOKIE >> 16);
        addr ^= STUN_MAGIC_COOKIE;
    }

    in_addr in{};
    in.s_addr = htonl(addr);
    char ip[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &in, ip, sizeof(ip))) {
        return std::nullopt;
    }
    return MappedAddress{ip, port};
}

} // anonymous namespace

std::vector<uint8_t> buildBindingRequest(const StunTransactionId& transactionId) {
    std::vector<uint8_t> out;
    out.reserve(STUN_HEADER_SIZE);
    writeU16(out, STUN_BINDING_REQUEST);
    writeU16(out, 0);   // No attributes
    writeU32(out, STUN_MAGIC_COOKIE);
    out.insert(out.end(), transactionId.begin(), transactionId.end());
    return out;
}

std::optional<MappedAddress> parseBindingResponse(const uint8_t* data, size_t size,
                                                  const StunTransactionId& transactionId) {
    if (!data || size < STUN_HEADER_SIZE) {
        return std::nullopt;
    }
    if (readU16(data) != STUN_BINDING_SUCCESS || readU32(data + 4) != STUN_MAGIC_COOKIE) {
        return std::nullopt;
    }
    if (!std::equal(transactionId.begin(), transactionId.end(), data + 8)) {
        return std::nullopt;
    }

    size_t bodyLength = readU16(data + 2);
    if (STUN_HEADER_SIZE + bodyLength > size) {
        return std::nullopt;
    }

    std::optional<MappedAddress> mapped;
    size_t offset = STUN_HEADER_SIZE;
    const size_t end = STUN_HEADER_SIZE + bodyLength;
    while (offset + 4 <= end) {
        uint16_t type = readU16(data + offset);
        uint16_t length = readU16(data + offset + 2);
        const uint8_t* value = data + offset + 4;
        if (offset + 4 + length > end) {
            return std::nullopt;
        }

        if (type == STUN_ATTR_XOR_MAPPED_ADDRESS) {
            auto addr = decodeAddress(value, length, true);
            if (addr) return addr;
        } else if (type == STUN_ATTR_MAPPED_ADDRESS && !mapped) {
            mapped = decodeAddress(value, length, false);
        }

        // Attributes are padded to 4 bytes
        offset += 4 + ((length + 3u) & ~3u);
    }
    return mapped;
}

std::optional<MappedAddress> queryMappedAddress(const std::string& host, uint16_t port, int timeoutMs) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
    if (rc != 0 || !result) {
        spdlog::warn("Stun: Cannot resolve {}: {}", host, gai_strerror(rc));
        return std::nullopt;
    }

    int sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock < 0) {
        spdlog::warn("Stun: Failed to create socket: {}", std::strerror(errno));
        freeaddrinfo(result);
        return std::nullopt;
    }

    StunTransactionId transactionId{};
    auto random = Crypto::randomBytes(transactionId.size());
    std::copy(random.begin(), random.end(), transactionId.begin());
    auto request = buildBindingRequest(transactionId);

    ssize_t sent = sendto(sock, request.data(), request.size(), 0, result->ai_addr, result->ai_addrlen);
    freeaddrinfo(result);
    if (sent != static_cast<ssize_t>(request.size())) {
        spdlog::warn("Stun: Failed to send binding request to {}:{}", host, port);
        close(sock);
        return std::nullopt;
    }

    std::optional<MappedAddress> mapped;
    pollfd pfd{sock, POLLIN, 0};
    if (poll(&pfd, 1, timeoutMs) > 0 && (pfd.revents & POLLIN)) {
        uint8_t buffer[512];
        ssize_t received = recv(sock, buffer, sizeof(buffer), 0);
        if (received > 0) {
            mapped = parseBindingResponse(buffer, static_cast<size_t>(received), transactionId);
        }
    }
    close(sock);

    if (mapped) {
        spdlog::info("Stun: Server-reflexive address {}:{}", mapped->host, mapped->port);
    } else {
        spdlog::warn("Stun: No usable response from {}:{}", host, port);
    }
    return mapped;
}

} // namespace Stun
} // namespace Balance

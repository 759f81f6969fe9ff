// StunClient.h — RFC 5389 binding request for server-reflexive addresses

#pragma once

#include "../export.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Balance {

constexpr uint32_t STUN_MAGIC_COOKIE = 0x2112A442;
constexpr uint16_t STUN_BINDING_REQUEST = 0x0001;
constexpr uint16_t STUN_BINDING_SUCCESS = 0x0101;
constexpr uint16_t STUN_ATTR_MAPPED_ADDRESS = 0x0001;
constexpr uint16_t STUN_ATTR_XOR_MAPPED_ADDRESS = 0x0020;
constexpr size_t STUN_HEADER_SIZE = 20;
constexpr int STUN_TIMEOUT_MS = 3000;

using StunTransactionId = std::array<uint8_t, 12>;

struct MappedAddress {
    std::string host;
    uint16_t port = 0;
};

namespace Stun {

BL_API std::vector<uint8_t> buildBindingRequest(const StunTransactionId& transactionId);

/// Extract the mapped address from a binding success response.
/// XOR-MAPPED-ADDRESS is preferred over MAPPED-ADDRESS. IPv4 only.
/// @return nullopt for anything else, including a transaction id mismatch
BL_API std::optional<MappedAddress> parseBindingResponse(const uint8_t* data, size_t size,
                                                        const StunTransactionId& transactionId);

/// Send one binding request over UDP and wait for the answer
/// @return nullopt on DNS failure, timeout or an unusable response
BL_API std::optional<MappedAddress> queryMappedAddress(const std::string& host, uint16_t port,
                                                      int timeoutMs = STUN_TIMEOUT_MS);

} // namespace Stun
} // namespace Balance

// SessionDescription.h — offer/answer exchanged through scannable codes

#pragma once

#include "../export.h"
#include "TlsPsk.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Balance {

constexpr int SESSION_DESCRIPTION_VERSION = 1;

/// Offers and answers are refused after this long
constexpr int64_t SESSION_DESCRIPTION_TTL_MS = 5 * 60 * 1000;

enum class DescriptionType : int32_t {
    Offer = 0,
    Answer = 1
};

BL_API const char* descriptionTypeToString(DescriptionType type);

/// Address the initiator may dial
struct Candidate {
    std::string host;
    uint16_t port = 0;
    std::string type = "host";      // "host" or "srflx"

    bool operator==(const Candidate& other) const {
        return host == other.host && port == other.port && type == other.type;
    }
};

struct BL_API SessionDescription {
    int version = SESSION_DESCRIPTION_VERSION;
    DescriptionType type = DescriptionType::Offer;
    std::string sessionId;
    std::optional<PskKey> psk;              // Offer only
    std::string deviceId;
    int64_t expiresAt = 0;
    std::vector<Candidate> candidates;      // Answer only

    /// JSON document wrapped in base64, ready for the chunk codec
    std::string encode() const;

    /// Parse and validate an encoded description
    /// @param expected Offer or Answer
    /// @param nowMs current time in epoch ms, compared to expiresAt
    /// @throws TransportError MalformedDescription or Expired
    static SessionDescription decode(const std::string& encoded,
                                     DescriptionType expected,
                                     int64_t nowMs);
};

} // namespace Balance

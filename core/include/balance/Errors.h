#pragma once

#include "export.h"
#include <stdexcept>
#include <string>

namespace Balance {

// ═══════════════════════════════════════════════════════════
// Error taxonomy
// ═══════════════════════════════════════════════════════════

/// Base class for every error raised by the sync core
class BL_API SyncError : public std::runtime_error {
public:
    explicit SyncError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Malformed sync/backup payload. Raised before any table write.
class BL_API ValidationError : public SyncError {
public:
    explicit ValidationError(const std::string& message)
        : SyncError(message) {}
};

/// The table store rejected a read or write
class BL_API StoreError : public SyncError {
public:
    explicit StoreError(const std::string& message)
        : SyncError(message) {}
};

enum class TransportErrorCode : int32_t {
    MalformedDescription = 1,   // Offer/answer string could not be parsed
    Expired = 2,                // Offer/answer is past its expiry
    PermissionDenied = 3,       // Local endpoint could not be opened
    NegotiationFailed = 4,      // No candidate reachable / handshake rejected
    Timeout = 5,
    InvalidState = 6,           // Operation not allowed in the current state
    ChannelClosed = 7,
    ProtocolViolation = 8
};

BL_API const char* transportErrorCodeName(TransportErrorCode code);

/// Negotiation, connection or channel failure
class BL_API TransportError : public SyncError {
public:
    TransportError(TransportErrorCode code, const std::string& message)
        : SyncError(message), m_code(code) {}

    TransportErrorCode code() const { return m_code; }

private:
    TransportErrorCode m_code;
};

} // namespace Balance

#include "balance/Errors.h"

namespace Balance {

const char* transportErrorCodeName(TransportErrorCode code) {
    switch (code) {
        case TransportErrorCode::MalformedDescription: return "malformed-description";
        case TransportErrorCode::Expired:              return "expired";
        case TransportErrorCode::PermissionDenied:     return "permission-denied";
        case TransportErrorCode::NegotiationFailed:    return "negotiation-failed";
        case TransportErrorCode::Timeout:              return "timeout";
        case TransportErrorCode::InvalidState:         return "invalid-state";
        case TransportErrorCode::ChannelClosed:        return "channel-closed";
        case TransportErrorCode::ProtocolViolation:    return "protocol-violation";
        default:                                       return "unknown";
    }
}

} // namespace Balance

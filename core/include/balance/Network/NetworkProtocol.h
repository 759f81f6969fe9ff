// NetworkProtocol.h — framing of data channel messages

#pragma once

#include "../export.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Balance {

// ═══════════════════════════════════════════════════════════
// Protocol constants
// ═══════════════════════════════════════════════════════════

constexpr uint32_t PROTOCOL_MAGIC = 0x424C4E43;         // "BLNC" big-endian
constexpr uint32_t MESSAGE_PROTOCOL_VERSION = 1;
constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024 * 1024;   // 16 MB max
constexpr size_t MESSAGE_HEADER_SIZE = 10;              // Magic + Length + Type + ReqIdLen

/// Payloads larger than this travel as SyncPayloadPart messages
constexpr size_t DATA_CHANNEL_CHUNK_SIZE = 256 * 1024;

// ═══════════════════════════════════════════════════════════
// MessageType
// ═══════════════════════════════════════════════════════════

enum class MessageType : uint8_t {
    // Control
    Disconnect = 0x02,
    Error = 0x0F,

    // Session binding
    Hello = 0x10,

    // Sync
    SyncHandshake = 0x20,
    SyncPayload = 0x21,
    SyncPayloadPart = 0x22,
    SyncComplete = 0x23,
};

BL_API const char* messageTypeName(MessageType type);
BL_API bool isKnownMessageType(uint8_t value);

// ═══════════════════════════════════════════════════════════
// Message
// ═══════════════════════════════════════════════════════════

struct BL_API Message {
    MessageType type;
    std::string requestId;
    std::vector<uint8_t> payload;     // UTF-8 JSON or chunk text

    Message(MessageType t) : type(t) {}
    Message(MessageType t, const std::string& reqId) : type(t), requestId(reqId) {}

    void setJsonPayload(const std::string& json);
    std::string getJsonPayload() const;
};

// ═══════════════════════════════════════════════════════════
// MessageSerializer
// ═══════════════════════════════════════════════════════════

class BL_API MessageSerializer {
public:
    /// Format: [Magic:4][Length:4][Type:1][ReqIdLen:1][ReqId:N][Payload:M]
    static std::vector<uint8_t> serialize(const Message& msg);

    /// @return Message or nullopt when the frame is invalid
    static std::optional<Message> deserialize(const uint8_t* data, size_t size);
    static std::optional<Message> deserialize(const std::vector<uint8_t>& data);

    /// @return declared frame size, or 0 if fewer than 8 bytes are available
    static size_t getMessageSize(const uint8_t* data, size_t available);

    /// false when the first bytes cannot start a valid frame
    /// (bad magic, or length outside [MESSAGE_HEADER_SIZE, MAX_MESSAGE_SIZE])
    static bool hasValidHeader(const uint8_t* data, size_t available);
};

// ═══════════════════════════════════════════════════════════
// Message payloads (JSON)
// ═══════════════════════════════════════════════════════════

/// First message on a fresh channel, binds it to the negotiated session
struct HelloPayload {
    std::string sessionId;
    std::string deviceId;
    int protocolVersion = static_cast<int>(MESSAGE_PROTOCOL_VERSION);

    std::string toJson() const;
    static std::optional<HelloPayload> fromJson(const std::string& json);
};

/// Watermark exchange that opens a sync
struct SyncHandshakePayload {
    std::string deviceId;
    std::optional<int64_t> lastSyncTimestamp;

    std::string toJson() const;
    static std::optional<SyncHandshakePayload> fromJson(const std::string& json);
};

/// Acknowledges that the sender has merged and finalized
struct SyncCompletePayload {
    std::string deviceId;
    int64_t recordsReceived = 0;
    bool merged = true;             // false when an entity batch failed

    std::string toJson() const;
    static std::optional<SyncCompletePayload> fromJson(const std::string& json);
};

/// Sent before closing when one side gives up
struct ErrorPayload {
    std::string code;
    std::string message;

    std::string toJson() const;
    static std::optional<ErrorPayload> fromJson(const std::string& json);
};

BL_API std::string generateRequestId();

} // namespace Balance

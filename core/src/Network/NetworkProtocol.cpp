// NetworkProtocol.cpp — data channel framing

#include "balance/Network/NetworkProtocol.h"
#include "balance/Crypto.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>

namespace Balance {

using json = nlohmann::json;

namespace {

uint32_t readBigEndian32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void writeBigEndian32(uint8_t* p, uint32_t value) {
    p[0] = (value >> 24) & 0xFF;
    p[1] = (value >> 16) & 0xFF;
    p[2] = (value >> 8) & 0xFF;
    p[3] = value & 0xFF;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// MessageType names
// ═══════════════════════════════════════════════════════════

const char* messageTypeName(MessageType type) {
    switch (type) {
        case MessageType::Disconnect: return "Disconnect";
        case MessageType::Error: return "Error";
        case MessageType::Hello: return "Hello";
        case MessageType::SyncHandshake: return "SyncHandshake";
        case MessageType::SyncPayload: return "SyncPayload";
        case MessageType::SyncPayloadPart: return "SyncPayloadPart";
        case MessageType::SyncComplete: return "SyncComplete";
        default: return "Unknown";
    }
}

bool isKnownMessageType(uint8_t value) {
    switch (static_cast<MessageType>(value)) {
        case MessageType::Disconnect:
        case MessageType::Error:
        case MessageType::Hello:
        case MessageType::SyncHandshake:
        case MessageType::SyncPayload:
        case MessageType::SyncPayloadPart:
        case MessageType::SyncComplete:
            return true;
    }
    return false;
}

// ═══════════════════════════════════════════════════════════
// Message
// ═══════════════════════════════════════════════════════════

void Message::setJsonPayload(const std::string& json) {
    payload.assign(json.begin(), json.end());
}

std::string Message::getJsonPayload() const {
    return std::string(payload.begin(), payload.end());
}

// ═══════════════════════════════════════════════════════════
// MessageSerializer
// ═══════════════════════════════════════════════════════════

std::vector<uint8_t> MessageSerializer::serialize(const Message& msg) {
    size_t reqIdLen = std::min(msg.requestId.size(), size_t(255));
    size_t totalSize = MESSAGE_HEADER_SIZE + reqIdLen + msg.payload.size();

    std::vector<uint8_t> result(totalSize);
    uint8_t* ptr = result.data();

    writeBigEndian32(ptr, PROTOCOL_MAGIC);
    ptr += 4;
    writeBigEndian32(ptr, static_cast<uint32_t>(totalSize));
    ptr += 4;

    *ptr++ = static_cast<uint8_t>(msg.type);

    *ptr++ = static_cast<uint8_t>(reqIdLen);
    if (reqIdLen > 0) {
        memcpy(ptr, msg.requestId.data(), reqIdLen);
        ptr += reqIdLen;
    }

    if (!msg.payload.empty()) {
        memcpy(ptr, msg.payload.data(), msg.payload.size());
    }

    return result;
}

std::optional<Message> MessageSerializer::deserialize(const uint8_t* data, size_t size) {
    if (size < MESSAGE_HEADER_SIZE) {
        return std::nullopt;
    }

    uint32_t magic = readBigEndian32(data);
    if (magic != PROTOCOL_MAGIC) {
        spdlog::debug("Protocol: Invalid magic 0x{:08X}", magic);
        return std::nullopt;
    }

    uint32_t len = readBigEndian32(data + 4);
    if (len < MESSAGE_HEADER_SIZE || len > MAX_MESSAGE_SIZE || len > size) {
        spdlog::debug("Protocol: Invalid length {}", len);
        return std::nullopt;
    }

    const uint8_t* ptr = data + 8;
    if (!isKnownMessageType(*ptr)) {
        spdlog::debug("Protocol: Unknown message type 0x{:02X}", *ptr);
        return std::nullopt;
    }
    Message msg(static_cast<MessageType>(*ptr++));

    uint8_t reqIdLen = *ptr++;
    if (reqIdLen > 0) {
        if (ptr + reqIdLen > data + len) {
            return std::nullopt;
        }
        msg.requestId.assign(reinterpret_cast<const char*>(ptr), reqIdLen);
        ptr += reqIdLen;
    }

    size_t payloadSize = static_cast<size_t>((data + len) - ptr);
    if (payloadSize > 0) {
        msg.payload.assign(ptr, ptr + payloadSize);
    }

    return msg;
}

std::optional<Message> MessageSerializer::deserialize(const std::vector<uint8_t>& data) {
    return deserialize(data.data(), data.size());
}

size_t MessageSerializer::getMessageSize(const uint8_t* data, size_t available) {
    if (available < 8) {
        return 0;
    }
    return readBigEndian32(data + 4);
}

bool MessageSerializer::hasValidHeader(const uint8_t* data, size_t available) {
    if (available < 4) {
        return true;
    }
    if (readBigEndian32(data) != PROTOCOL_MAGIC) {
        return false;
    }
    if (available < 8) {
        return true;
    }
    uint32_t len = readBigEndian32(data + 4);
    return len >= MESSAGE_HEADER_SIZE && len <= MAX_MESSAGE_SIZE;
}

// ═══════════════════════════════════════════════════════════
// HelloPayload
// ═══════════════════════════════════════════════════════════

std::string HelloPayload::toJson() const {
    json j = {
        {"sessionId", sessionId},
        {"deviceId", deviceId},
        {"protocolVersion", protocolVersion}
    };
    return j.dump();
}

std::optional<HelloPayload> HelloPayload::fromJson(const std::string& jsonStr) {
    json j = json::parse(jsonStr, nullptr, false);
    if (!j.is_object() || !j.contains("sessionId") || !j["sessionId"].is_string() ||
        !j.contains("deviceId") || !j["deviceId"].is_string()) {
        spdlog::warn("Protocol: malformed Hello payload");
        return std::nullopt;
    }
    HelloPayload p;
    p.sessionId = j["sessionId"].get<std::string>();
    p.deviceId = j["deviceId"].get<std::string>();
    if (j.contains("protocolVersion") && j["protocolVersion"].is_number_integer()) {
        p.protocolVersion = j["protocolVersion"].get<int>();
    }
    return p;
}

// ═══════════════════════════════════════════════════════════
// SyncHandshakePayload
// ═══════════════════════════════════════════════════════════

std::string SyncHandshakePayload::toJson() const {
    json j = {{"deviceId", deviceId}};
    if (lastSyncTimestamp) {
        j["lastSyncTimestamp"] = *lastSyncTimestamp;
    } else {
        j["lastSyncTimestamp"] = nullptr;
    }
    return j.dump();
}

std::optional<SyncHandshakePayload> SyncHandshakePayload::fromJson(const std::string& jsonStr) {
    json j = json::parse(jsonStr, nullptr, false);
    if (!j.is_object() || !j.contains("deviceId") || !j["deviceId"].is_string()) {
        spdlog::warn("Protocol: malformed SyncHandshake payload");
        return std::nullopt;
    }
    SyncHandshakePayload p;
    p.deviceId = j["deviceId"].get<std::string>();
    auto ts = j.find("lastSyncTimestamp");
    if (ts != j.end() && !ts->is_null()) {
        if (!ts->is_number()) {
            return std::nullopt;
        }
        p.lastSyncTimestamp = ts->get<int64_t>();
    }
    return p;
}

// ═══════════════════════════════════════════════════════════
// SyncCompletePayload
// ═══════════════════════════════════════════════════════════

std::string SyncCompletePayload::toJson() const {
    json j = {
        {"deviceId", deviceId},
        {"recordsReceived", recordsReceived},
        {"merged", merged}
    };
    return j.dump();
}

std::optional<SyncCompletePayload> SyncCompletePayload::fromJson(const std::string& jsonStr) {
    json j = json::parse(jsonStr, nullptr, false);
    if (!j.is_object() || !j.contains("deviceId") || !j["deviceId"].is_string()) {
        spdlog::warn("Protocol: malformed SyncComplete payload");
        return std::nullopt;
    }
    SyncCompletePayload p;
    p.deviceId = j["deviceId"].get<std::string>();
    if (j.contains("recordsReceived") && j["recordsReceived"].is_number_integer()) {
        p.recordsReceived = j["recordsReceived"].get<int64_t>();
    }
    if (j.contains("merged") && j["merged"].is_boolean()) {
        p.merged = j["merged"].get<bool>();
    }
    return p;
}

// ═══════════════════════════════════════════════════════════
// ErrorPayload
// ═══════════════════════════════════════════════════════════

std::string ErrorPayload::toJson() const {
    json j = {{"code", code}, {"message", message}};
    return j.dump();
}

std::optional<ErrorPayload> ErrorPayload::fromJson(const std::string& jsonStr) {
    json j = json::parse(jsonStr, nullptr, false);
    if (!j.is_object()) {
        return std::nullopt;
    }
    ErrorPayload p;
    if (j.contains("code") && j["code"].is_string()) {
        p.code = j["code"].get<std::string>();
    }
    if (j.contains("message") && j["message"].is_string()) {
        p.message = j["message"].get<std::string>();
    }
    return p;
}

// ═══════════════════════════════════════════════════════════
// generateRequestId
// ═══════════════════════════════════════════════════════════

std::string generateRequestId() {
    return Crypto::generateUUID();
}

} // namespace Balance

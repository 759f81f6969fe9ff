// test_network_protocol.cpp — data channel framing and payloads

#include <gtest/gtest.h>
#include "balance/Network/NetworkProtocol.h"
#include <nlohmann/json.hpp>

using namespace Balance;
using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// MessageSerializer
// ═══════════════════════════════════════════════════════════

TEST(MessageSerializerTest, HeaderLayout) {
    Message msg(MessageType::SyncHandshake, "req-1");
    msg.setJsonPayload("{}");

    auto bytes = MessageSerializer::serialize(msg);
    ASSERT_EQ(bytes.size(), MESSAGE_HEADER_SIZE + 5 + 2);
    EXPECT_EQ(bytes[0], 0x42);
    EXPECT_EQ(bytes[1], 0x4C);
    EXPECT_EQ(bytes[2], 0x4E);
    EXPECT_EQ(bytes[3], 0x43);
    EXPECT_EQ(MessageSerializer::getMessageSize(bytes.data(), bytes.size()), bytes.size());
    EXPECT_EQ(bytes[8], static_cast<uint8_t>(MessageType::SyncHandshake));
    EXPECT_EQ(bytes[9], 5);
}

TEST(MessageSerializerTest, DeserializeRestoresMessage) {
    Message msg(MessageType::SyncComplete, "abc");
    msg.setJsonPayload(R"({"deviceId":"d"})");

    auto parsed = MessageSerializer::deserialize(MessageSerializer::serialize(msg));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->type, MessageType::SyncComplete);
    EXPECT_EQ(parsed->requestId, "abc");
    EXPECT_EQ(parsed->getJsonPayload(), R"({"deviceId":"d"})");
}

TEST(MessageSerializerTest, RejectsBadMagic) {
    auto bytes = MessageSerializer::serialize(Message(MessageType::Disconnect));
    bytes[0] = 0x00;
    EXPECT_FALSE(MessageSerializer::deserialize(bytes).has_value());
    EXPECT_FALSE(MessageSerializer::hasValidHeader(bytes.data(), bytes.size()));
}

TEST(MessageSerializerTest, RejectsTruncatedFrame) {
    Message msg(MessageType::SyncPayload, "r");
    msg.setJsonPayload(std::string(100, 'x'));
    auto bytes = MessageSerializer::serialize(msg);

    EXPECT_FALSE(MessageSerializer::deserialize(bytes.data(), bytes.size() - 1).has_value());
    // A partial frame with a sane header is still acceptable while more data arrives
    EXPECT_TRUE(MessageSerializer::hasValidHeader(bytes.data(), 8));
    EXPECT_EQ(MessageSerializer::getMessageSize(bytes.data(), 7), 0u);
}

TEST(MessageSerializerTest, RejectsUnknownType) {
    auto bytes = MessageSerializer::serialize(Message(MessageType::SyncComplete, "r"));
    bytes[8] = 0x00;
    EXPECT_FALSE(MessageSerializer::deserialize(bytes).has_value());
    EXPECT_FALSE(isKnownMessageType(0x00));
    EXPECT_TRUE(isKnownMessageType(static_cast<uint8_t>(MessageType::SyncPayloadPart)));
}

TEST(MessageSerializerTest, RejectsOversizedLength) {
    auto bytes = MessageSerializer::serialize(Message(MessageType::Disconnect));
    bytes[4] = 0x7F;
    EXPECT_FALSE(MessageSerializer::hasValidHeader(bytes.data(), bytes.size()));
}

TEST(MessageSerializerTest, TypeNames) {
    EXPECT_STREQ(messageTypeName(MessageType::SyncPayloadPart), "SyncPayloadPart");
    EXPECT_STREQ(messageTypeName(static_cast<MessageType>(0xEE)), "Unknown");
}

// ═══════════════════════════════════════════════════════════
// Payloads
// ═══════════════════════════════════════════════════════════

TEST(ProtocolPayloadTest, HelloParses) {
    HelloPayload hello;
    hello.sessionId = "s-1";
    hello.deviceId = "device-a";

    auto parsed = HelloPayload::fromJson(hello.toJson());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->sessionId, "s-1");
    EXPECT_EQ(parsed->protocolVersion, static_cast<int>(MESSAGE_PROTOCOL_VERSION));
    EXPECT_FALSE(HelloPayload::fromJson(R"({"sessionId":1})").has_value());
}

TEST(ProtocolPayloadTest, HandshakeWithoutWatermark) {
    SyncHandshakePayload handshake;
    handshake.deviceId = "device-a";

    json j = json::parse(handshake.toJson());
    EXPECT_TRUE(j["lastSyncTimestamp"].is_null());

    auto parsed = SyncHandshakePayload::fromJson(handshake.toJson());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->lastSyncTimestamp.has_value());

    EXPECT_FALSE(SyncHandshakePayload::fromJson(R"({"deviceId":"d","lastSyncTimestamp":"x"})").has_value());
}

TEST(ProtocolPayloadTest, CompleteDefaultsToMerged) {
    auto parsed = SyncCompletePayload::fromJson(R"({"deviceId":"d"})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->merged);
    EXPECT_EQ(parsed->recordsReceived, 0);
}

TEST(ProtocolPayloadTest, ErrorPayloadTolerant) {
    auto parsed = ErrorPayload::fromJson(R"({"message":"boom"})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->code.empty());
    EXPECT_EQ(parsed->message, "boom");
    EXPECT_FALSE(ErrorPayload::fromJson("not json").has_value());
}

TEST(ProtocolPayloadTest, RequestIdsAreUnique) {
    EXPECT_NE(generateRequestId(), generateRequestId());
}

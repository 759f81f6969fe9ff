// test_state_machine.cpp — PeerConnection state table and guards
// These tests catch bugs like operations running in the wrong state

#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <functional>

#include "balance/Errors.h"
#include "balance/Network/PeerConnection.h"

using namespace Balance;
using State = PeerConnection::State;

// ═══════════════════════════════════════════════════════════
// Transition table
// ═══════════════════════════════════════════════════════════

TEST(PeerStateTableTest, NegotiationPaths) {
    EXPECT_TRUE(PeerConnection::canTransition(State::Idle, State::OfferCreated));
    EXPECT_TRUE(PeerConnection::canTransition(State::Idle, State::AnswerCreated));
    EXPECT_TRUE(PeerConnection::canTransition(State::OfferCreated, State::Connecting));
    EXPECT_TRUE(PeerConnection::canTransition(State::AnswerCreated, State::Connecting));
    EXPECT_TRUE(PeerConnection::canTransition(State::Connecting, State::Open));
    EXPECT_TRUE(PeerConnection::canTransition(State::Open, State::Closed));
}

TEST(PeerStateTableTest, NoShortcuts) {
    EXPECT_FALSE(PeerConnection::canTransition(State::Idle, State::Open));
    EXPECT_FALSE(PeerConnection::canTransition(State::Idle, State::Connecting));
    EXPECT_FALSE(PeerConnection::canTransition(State::OfferCreated, State::Open));
    EXPECT_FALSE(PeerConnection::canTransition(State::OfferCreated, State::AnswerCreated));
    EXPECT_FALSE(PeerConnection::canTransition(State::Open, State::Connecting));
}

TEST(PeerStateTableTest, EveryLiveStateCanEnd) {
    for (State s : {State::Idle, State::OfferCreated, State::AnswerCreated, State::Connecting, State::Open}) {
        EXPECT_TRUE(PeerConnection::canTransition(s, State::Closed)) << PeerConnection::stateName(s);
        EXPECT_TRUE(PeerConnection::canTransition(s, State::Failed)) << PeerConnection::stateName(s);
    }
}

TEST(PeerStateTableTest, TerminalStatesStay) {
    for (State to : {State::Idle, State::OfferCreated, State::AnswerCreated,
                     State::Connecting, State::Open, State::Closed, State::Failed}) {
        EXPECT_FALSE(PeerConnection::canTransition(State::Closed, to));
        EXPECT_FALSE(PeerConnection::canTransition(State::Failed, to));
    }
}

TEST(PeerStateTableTest, StateNames) {
    EXPECT_STREQ(PeerConnection::stateName(State::Idle), "idle");
    EXPECT_STREQ(PeerConnection::stateName(State::OfferCreated), "offer-created");
    EXPECT_STREQ(PeerConnection::stateName(State::AnswerCreated), "answer-created");
    EXPECT_STREQ(PeerConnection::stateName(State::Connecting), "connecting");
    EXPECT_STREQ(PeerConnection::stateName(State::Open), "open");
    EXPECT_STREQ(PeerConnection::stateName(State::Closed), "closed");
    EXPECT_STREQ(PeerConnection::stateName(State::Failed), "failed");
}

// ═══════════════════════════════════════════════════════════
// Guards on a live connection
// ═══════════════════════════════════════════════════════════

namespace {

TransportErrorCode codeOf(const std::function<void()>& action) {
    try {
        action();
    } catch (const TransportError& e) {
        return e.code();
    }
    ADD_FAILURE() << "no TransportError thrown";
    return TransportErrorCode::Timeout;
}

} // anonymous namespace

TEST(PeerStateGuardTest, InitialStateIsIdle) {
    PeerConnection peer("device-a");
    EXPECT_EQ(peer.getState(), State::Idle);
    EXPECT_FALSE(peer.isOpen());
    EXPECT_TRUE(peer.getSessionId().empty());
}

TEST(PeerStateGuardTest, SecondOfferRejected) {
    PeerConnection peer("device-a");
    peer.createOffer();
    EXPECT_EQ(peer.getState(), State::OfferCreated);
    EXPECT_FALSE(peer.getSessionId().empty());

    EXPECT_EQ(codeOf([&]() { peer.createOffer(); }), TransportErrorCode::InvalidState);
    EXPECT_EQ(codeOf([&]() { peer.acceptOffer("x"); }), TransportErrorCode::InvalidState);
    EXPECT_EQ(peer.getState(), State::OfferCreated);
}

TEST(PeerStateGuardTest, CompleteWithoutOfferRejected) {
    PeerConnection peer("device-a");
    EXPECT_EQ(codeOf([&]() { peer.completeConnection("x"); }), TransportErrorCode::InvalidState);
    EXPECT_EQ(peer.getState(), State::Idle);
}

TEST(PeerStateGuardTest, MalformedOfferLeavesIdle) {
    PeerConnection peer("device-b");
    EXPECT_EQ(codeOf([&]() { peer.acceptOffer("not-an-offer"); }), TransportErrorCode::MalformedDescription);
    EXPECT_EQ(peer.getState(), State::Idle);
}

TEST(PeerStateGuardTest, ExpiredOfferLeavesIdle) {
    SessionDescription offer;
    offer.sessionId = "s";
    offer.deviceId = "device-a";
    offer.expiresAt = 1;
    offer.psk = PskKey{};

    PeerConnection peer("device-b");
    EXPECT_EQ(codeOf([&]() { peer.acceptOffer(offer.encode()); }), TransportErrorCode::Expired);
    EXPECT_EQ(peer.getState(), State::Idle);
}

TEST(PeerStateGuardTest, MalformedAnswerFails) {
    PeerConnection peer("device-a");
    peer.createOffer();
    EXPECT_EQ(codeOf([&]() { peer.completeConnection("garbage"); }), TransportErrorCode::MalformedDescription);
    EXPECT_EQ(peer.getState(), State::Failed);
    EXPECT_EQ(peer.getLastErrorCode(), TransportErrorCode::MalformedDescription);
}

TEST(PeerStateGuardTest, AnswerForOtherSessionFails) {
    PeerConnection peer("device-a");
    peer.createOffer();

    SessionDescription answer;
    answer.type = DescriptionType::Answer;
    answer.sessionId = "some-other-session";
    answer.deviceId = "device-b";
    answer.expiresAt = INT64_MAX;
    answer.candidates.push_back({"127.0.0.1", 1, "host"});

    EXPECT_EQ(codeOf([&]() { peer.completeConnection(answer.encode()); }),
              TransportErrorCode::MalformedDescription);
    EXPECT_EQ(peer.getState(), State::Failed);
}

TEST(PeerStateGuardTest, CloseIsIdempotent) {
    PeerConnection peer("device-a");
    std::atomic<int> closedEvents{0};
    peer.onStateChanged([&](State s) {
        if (s == State::Closed) closedEvents++;
    });

    peer.createOffer();
    peer.close();
    peer.close();
    EXPECT_EQ(peer.getState(), State::Closed);
    EXPECT_EQ(closedEvents.load(), 1);
}

TEST(PeerStateGuardTest, FailedStaysFailedAfterClose) {
    PeerConnection peer("device-a");
    peer.createOffer();
    EXPECT_THROW(peer.completeConnection("garbage"), TransportError);

    peer.close();
    EXPECT_EQ(peer.getState(), State::Failed);
}

TEST(PeerStateGuardTest, SendRequiresOpenChannel) {
    PeerConnection peer("device-a");
    EXPECT_EQ(codeOf([&]() { peer.send(Message(MessageType::SyncComplete)); }), TransportErrorCode::ChannelClosed);
}

TEST(PeerStateGuardTest, WaitForOpenAfterCloseThrows) {
    PeerConnection peer("device-a");
    peer.close();
    EXPECT_EQ(codeOf([&]() { peer.waitForOpen(100); }), TransportErrorCode::ChannelClosed);
}

TEST(PeerStateGuardTest, WaitForOpenTimesOut) {
    PeerConnection peer("device-a");
    peer.createOffer();
    EXPECT_EQ(codeOf([&]() { peer.waitForOpen(50); }), TransportErrorCode::Timeout);
}

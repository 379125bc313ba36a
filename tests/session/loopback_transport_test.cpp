#include <gtest/gtest.h>
#include <carlink/session/loopback_transport.hpp>

#include "session_fakes.hpp"

#include <memory>
#include <vector>

namespace carlink::session::test {

class LoopbackTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        offerer_ = provider_.create();
        answerer_ = provider_.create();

        offerer_->onHealthChange = [this](TransportHealth health) { offerer_health_.push_back(health); };
        answerer_->onHealthChange = [this](TransportHealth health) { answerer_health_.push_back(health); };
        answerer_->onDataChannel = [this](std::shared_ptr<DataChannel> channel) { incoming_.push_back(channel); };
        answerer_->onRemoteTrack = [this](TrackKind kind) { answerer_tracks_.push_back(kind); };
        offerer_->onRemoteTrack = [this](TrackKind kind) { offerer_tracks_.push_back(kind); };
    }

    // Offer/answer lengkap antara kedua transport
    void negotiate() {
        auto offer = offerer_->createOffer();
        ASSERT_TRUE(offer.is_ok());
        ASSERT_TRUE(answerer_->setRemoteDescription(offer.value()).is_ok());

        auto answer = answerer_->createAnswer();
        ASSERT_TRUE(answer.is_ok());
        ASSERT_TRUE(offerer_->setRemoteDescription(answer.value()).is_ok());
    }

    LoopbackTransportProvider provider_;
    std::unique_ptr<PeerTransport> offerer_;
    std::unique_ptr<PeerTransport> answerer_;

    std::vector<TransportHealth> offerer_health_;
    std::vector<TransportHealth> answerer_health_;
    std::vector<std::shared_ptr<DataChannel>> incoming_;
    std::vector<TrackKind> offerer_tracks_;
    std::vector<TrackKind> answerer_tracks_;
};

TEST_F(LoopbackTransportTest, NegotiationConnectsBothSides) {
    negotiate();

    ASSERT_FALSE(offerer_health_.empty());
    ASSERT_FALSE(answerer_health_.empty());
    EXPECT_EQ(offerer_health_.back(), TransportHealth::Connected);
    EXPECT_EQ(answerer_health_.back(), TransportHealth::Connected);
    EXPECT_EQ(answerer_health_.front(), TransportHealth::Checking);
    EXPECT_EQ(provider_.activeTransports(), 2u);
    EXPECT_EQ(provider_.createdTransports(), 2u);
}

TEST_F(LoopbackTransportTest, DataChannelDeliversMessages) {
    auto opened = offerer_->openDataChannel("gamepad", DataChannelInit{});
    ASSERT_TRUE(opened.is_ok());
    auto channel = opened.value();
    EXPECT_FALSE(channel->isOpen());

    negotiate();
    ASSERT_EQ(incoming_.size(), 1u);
    EXPECT_EQ(incoming_[0]->label(), "gamepad");
    EXPECT_TRUE(channel->isOpen());
    EXPECT_TRUE(incoming_[0]->isOpen());

    std::vector<std::vector<uint8_t>> received;
    incoming_[0]->onMessage = [&](const std::vector<uint8_t>& bytes) { received.push_back(bytes); };

    std::vector<uint8_t> payload{1, 2, 3, 4};
    ASSERT_TRUE(channel->send(payload.data(), payload.size()).is_ok());
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], payload);
}

TEST_F(LoopbackTransportTest, SendBeforeOpenFails) {
    auto channel = offerer_->openDataChannel("gamepad", DataChannelInit{}).value();
    uint8_t byte = 0;
    auto sent = channel->send(&byte, 1);
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().code(), core::ErrorCode::ConnectionClosed);
}

TEST_F(LoopbackTransportTest, TracksAreAnnounced) {
    carlink::test::FakeMediaSource media;
    media.has_audio = false;
    ASSERT_TRUE(answerer_->addLocalMedia(media).is_ok());

    negotiate();
    EXPECT_TRUE(answerer_tracks_.empty());
    EXPECT_EQ(offerer_tracks_, std::vector<TrackKind>{TrackKind::Video});
}

TEST_F(LoopbackTransportTest, EmitsHostCandidate) {
    std::vector<IceCandidate> candidates;
    offerer_->onLocalCandidate = [&](const IceCandidate& candidate) { candidates.push_back(candidate); };

    ASSERT_TRUE(offerer_->createOffer().is_ok());
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_NE(candidates[0].candidate.find("127.0.0.1"), std::string::npos);
    EXPECT_NE(candidates[0].candidate.find("typ host"), std::string::npos);
}

TEST_F(LoopbackTransportTest, RejectsOutOfOrderNegotiation) {
    SessionDescription answer;
    answer.type = SdpType::Answer;
    answer.sdp = "v=0\no=carlink-loopback 2\n";
    EXPECT_TRUE(offerer_->setRemoteDescription(answer).is_error());

    EXPECT_TRUE(answerer_->createAnswer().is_error());

    IceCandidate candidate;
    candidate.candidate = "candidate:1";
    EXPECT_TRUE(answerer_->addRemoteCandidate(candidate).is_error());
}

TEST_F(LoopbackTransportTest, RejectsForeignDescription) {
    SessionDescription offer;
    offer.type = SdpType::Offer;
    offer.sdp = "v=0\no=- 0 0 IN IP4 127.0.0.1\n";

    auto result = answerer_->setRemoteDescription(offer);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::NegotiationFailed);

    offer.sdp = "v=0\no=carlink-loopback 999\n";
    EXPECT_TRUE(answerer_->setRemoteDescription(offer).is_error());
}

TEST_F(LoopbackTransportTest, CloseDisconnectsPeer) {
    auto channel = offerer_->openDataChannel("gamepad", DataChannelInit{}).value();
    negotiate();
    ASSERT_EQ(incoming_.size(), 1u);

    offerer_->close();
    EXPECT_EQ(answerer_health_.back(), TransportHealth::Disconnected);
    EXPECT_FALSE(channel->isOpen());
    EXPECT_FALSE(incoming_[0]->isOpen());
    EXPECT_EQ(provider_.activeTransports(), 1u);

    // Tidak ada callback setelah close
    auto reported = offerer_health_.size();
    provider_.dropLinks();
    EXPECT_EQ(offerer_health_.size(), reported);
}

TEST_F(LoopbackTransportTest, DropLinksDisconnectsEveryone) {
    negotiate();

    provider_.dropLinks();
    EXPECT_EQ(offerer_health_.back(), TransportHealth::Disconnected);
    EXPECT_EQ(answerer_health_.back(), TransportHealth::Disconnected);
}

} // namespace carlink::session::test

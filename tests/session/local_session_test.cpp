#include <gtest/gtest.h>
#include <carlink/session/call_manager.hpp>
#include <carlink/session/control_channel_manager.hpp>
#include <carlink/session/loopback_transport.hpp>
#include <carlink/session/signaling_channel.hpp>

#include "manual_scheduler.hpp"
#include "session_fakes.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace carlink::session::test {

using namespace std::chrono_literals;
using carlink::test::FakeInputSource;
using carlink::test::FakeMediaSource;
using carlink::test::ManualScheduler;

// Relay in-process + transport loopback, tanpa jaringan
class LocalSessionTest : public ::testing::Test {
protected:
    PeerSessionOptions options(relay::Role local, relay::Role target) {
        PeerSessionOptions result;
        result.room = "video-room";
        result.local_role = local;
        result.target_role = target;
        return result;
    }

    CallInfo onlyCall(const PeerSessionManager& manager) {
        auto calls = manager.calls();
        EXPECT_EQ(calls.size(), 1u);
        return calls.empty() ? CallInfo{} : calls[0];
    }

    ManualScheduler scheduler_;
    LocalRelayHub hub_;
    LoopbackTransportProvider transports_;
    FakeMediaSource car_media_;
    FakeInputSource input_;

    std::unique_ptr<LocalSignalingChannel> controller_channel_ = hub_.connect();
    std::unique_ptr<LocalSignalingChannel> car_channel_ = hub_.connect();
};

TEST_F(LocalSessionTest, LocalChannelRelaysEvents) {
    std::vector<relay::WireMessage> received;
    car_channel_->setEventHandler([&](const relay::WireMessage& message) { received.push_back(message); });

    car_channel_->emit(relay::WireMessage("join-room", {{"roomId", "lobby"}, {"userInfo", {{"role", "Car"}}}}));
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].event, "joined-room");
    EXPECT_EQ(received[0].data["userId"], car_channel_->connectionId());

    controller_channel_->emit(relay::WireMessage("join-room", {{"roomId", "lobby"}}));
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[1].event, "user-joined");
    EXPECT_EQ(received[1].data["userId"], controller_channel_->connectionId());

    controller_channel_->close();
    EXPECT_FALSE(controller_channel_->isConnected());
    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(received[2].event, "user-left");
    EXPECT_EQ(hub_.registry().room("lobby")->members.size(), 1u);
}

TEST_F(LocalSessionTest, VideoCallConnectsAndRecovers) {
    CallManager car(scheduler_, *car_channel_, transports_,
                    options(relay::Role::Car, relay::Role::Controller), &car_media_);
    CallManager controller(scheduler_, *controller_channel_, transports_,
                           options(relay::Role::Controller, relay::Role::Car));

    std::vector<TrackKind> tracks;
    controller.onRemoteMedia = [&](const std::string&, TrackKind kind) { tracks.push_back(kind); };

    car.start();
    scheduler_.runPending();
    controller.start();
    scheduler_.runPending();

    auto call = onlyCall(controller);
    EXPECT_EQ(call.state, CallState::Connected);
    EXPECT_EQ(call.remote_id, car_channel_->connectionId());
    EXPECT_EQ(onlyCall(car).state, CallState::Connected);
    EXPECT_EQ(tracks.size(), 2u);

    // Jaringan putus: kedua sisi reconnect, hanya Controller yang membuat offer
    transports_.dropLinks();
    scheduler_.runPending();
    EXPECT_EQ(onlyCall(controller).state, CallState::Reconnecting);
    EXPECT_EQ(onlyCall(car).state, CallState::Reconnecting);

    scheduler_.advance(1000ms);

    call = onlyCall(controller);
    EXPECT_EQ(call.state, CallState::Connected);
    EXPECT_EQ(call.attempt, 0);
    EXPECT_EQ(onlyCall(car).state, CallState::Connected);
    EXPECT_EQ(scheduler_.pendingTimers(), 0u);
    EXPECT_EQ(transports_.createdTransports(), 4u);
    EXPECT_EQ(transports_.activeTransports(), 2u);

    controller.stop();
    scheduler_.runPending();
    EXPECT_TRUE(controller.calls().empty());

    // Car melihat link putus sebelum user-left, jadi menunggu offer sampai attempt habis
    EXPECT_EQ(onlyCall(car).state, CallState::Reconnecting);
    scheduler_.advance(60000ms);
    EXPECT_TRUE(car.calls().empty());
    EXPECT_EQ(transports_.activeTransports(), 0u);
    EXPECT_EQ(scheduler_.pendingTimers(), 0u);
}

// Car kehilangan koneksi relay, lalu masuk lagi dengan id baru
TEST_F(LocalSessionTest, CarRejoinsAfterRelayLinkDrop) {
    CallManager car(scheduler_, *car_channel_, transports_,
                    options(relay::Role::Car, relay::Role::Controller), &car_media_);
    CallManager controller(scheduler_, *controller_channel_, transports_,
                           options(relay::Role::Controller, relay::Role::Car));

    car.start();
    controller.start();
    scheduler_.runPending();
    ASSERT_EQ(onlyCall(controller).state, CallState::Connected);
    auto old_id = car_channel_->connectionId();

    car_channel_->dropLink();
    scheduler_.runPending();
    EXPECT_FALSE(car.joined());
    EXPECT_TRUE(controller.calls().empty());
    EXPECT_EQ(onlyCall(car).state, CallState::Reconnecting);

    car_channel_->restoreLink();
    scheduler_.runPending();

    EXPECT_TRUE(car.joined());
    EXPECT_NE(car_channel_->connectionId(), old_id);
    EXPECT_EQ(car.localId(), car_channel_->connectionId());

    auto call = onlyCall(controller);
    EXPECT_EQ(call.state, CallState::Connected);
    EXPECT_EQ(call.remote_id, car_channel_->connectionId());

    auto car_call = onlyCall(car);
    EXPECT_EQ(car_call.state, CallState::Connected);
    EXPECT_EQ(car_call.attempt, 0);
    EXPECT_EQ(scheduler_.pendingTimers(), 0u);
    EXPECT_EQ(transports_.activeTransports(), 2u);

    controller.stop();
    car.stop();
    scheduler_.runPending();
}

TEST_F(LocalSessionTest, RemoteToggleRoundTrip) {
    CallManager car(scheduler_, *car_channel_, transports_,
                    options(relay::Role::Car, relay::Role::Controller), &car_media_);
    CallManager controller(scheduler_, *controller_channel_, transports_,
                           options(relay::Role::Controller, relay::Role::Car));

    std::vector<bool> video_states;
    controller.onRemoteMediaState = [&](TrackKind kind, bool enabled) {
        if (kind == TrackKind::Video) video_states.push_back(enabled);
    };

    car.start();
    controller.start();
    scheduler_.runPending();

    controller.toggleRemoteVideo();
    scheduler_.runPending();
    EXPECT_FALSE(car_media_.video_enabled);

    controller.toggleRemoteVideo();
    scheduler_.runPending();
    EXPECT_TRUE(car_media_.video_enabled);

    EXPECT_EQ(video_states, (std::vector<bool>{false, true}));
}

TEST_F(LocalSessionTest, ControlFramesReachPi) {
    ControlChannelConfig config;
    config.send_frequency_hz = 50.0;

    ControlChannelManager pi(scheduler_, *car_channel_, transports_,
                             options(relay::Role::Pi, relay::Role::Controller), config);
    ControlChannelManager controller(scheduler_, *controller_channel_, transports_,
                                     options(relay::Role::Controller, relay::Role::Pi), config, &input_);

    std::vector<control::ControlFrame> frames;
    pi.onControlFrame = [&](const control::ControlFrame& frame) { frames.push_back(frame); };

    pi.start();
    scheduler_.runPending();
    controller.start();
    scheduler_.runPending();

    ASSERT_EQ(onlyCall(controller).state, CallState::Connected);
    EXPECT_TRUE(controller.producing());
    EXPECT_FALSE(pi.producing());

    InputState state;
    state.throttle = 1.0;
    state.steering = -1.0;
    state.buttons = {false, true};
    input_.state = state;

    scheduler_.advance(100ms);

    ASSERT_EQ(frames.size(), 5u);
    for (std::size_t i = 0; i < frames.size(); ++i) {
        EXPECT_EQ(frames[i].sequence, i + 1);
    }
    EXPECT_EQ(frames[0].throttle_raw, 32767);
    EXPECT_EQ(frames[0].steering_raw, -32767);
    EXPECT_EQ(frames[0].buttons, 0b10);
    EXPECT_EQ(pi.stats().frames_received, 5u);
    EXPECT_EQ(controller.stats().frames_sent, 5u);

    controller.stopProduction();
    scheduler_.advance(100ms);
    EXPECT_EQ(frames.size(), 5u);
}

} // namespace carlink::session::test

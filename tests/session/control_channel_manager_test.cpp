#include <gtest/gtest.h>
#include <carlink/session/control_channel_manager.hpp>

#include "manual_scheduler.hpp"
#include "session_fakes.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace carlink::session::test {

using namespace std::chrono_literals;
using carlink::test::FakeDataChannel;
using carlink::test::FakeInputSource;
using carlink::test::FakeSignalingChannel;
using carlink::test::FakeTransportProvider;
using carlink::test::ManualScheduler;

namespace {

nlohmann::json user(const std::string& id, const std::string& role) {
    return {{"id", id}, {"userInfo", {{"role", role}}}};
}

nlohmann::json sdp(const std::string& type, const std::string& text) {
    return {{"type", type}, {"sdp", text}};
}

} // namespace

class ControlChannelManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.send_frequency_hz = 50.0;  // tick 20 ms
    }

    void createController() {
        PeerSessionOptions options;
        options.local_role = relay::Role::Controller;
        manager_ = std::make_unique<ControlChannelManager>(
            scheduler_, signaling_, transports_, options, config_, &input_);
        manager_->start();
        scheduler_.runPending();
    }

    void createPi(control::VehicleController* vehicle = nullptr) {
        PeerSessionOptions options;
        options.local_role = relay::Role::Pi;
        manager_ = std::make_unique<ControlChannelManager>(
            scheduler_, signaling_, transports_, options, config_, nullptr, vehicle);
        manager_->start();
        scheduler_.runPending();
    }

    // Pi menerima offer dari ctrl-1, Connected, lalu channel gamepad dari Controller
    std::shared_ptr<FakeDataChannel> connectPi(control::VehicleController* vehicle = nullptr) {
        createPi(vehicle);
        deliver("joined-room", {
            {"roomId", "control-room"},
            {"userId", "pi-1"},
            {"users", {user("ctrl-1", "Controller"), user("pi-1", "Pi")}}
        });
        deliver("offer", {{"fromUserId", "ctrl-1"}, {"offer", sdp("offer", "v=0 ctrl")}});
        signalLast(TransportHealth::Connected);

        auto gamepad = std::make_shared<FakeDataChannel>("gamepad");
        transports_.last()->announceChannel(gamepad);
        scheduler_.runPending();
        return gamepad;
    }

    void receiveFrame(FakeDataChannel& channel, double throttle, double steering, uint16_t buttons, uint32_t sequence) {
        auto bytes = control::encode(throttle, steering, buttons, sequence, scheduler_.nowMillis());
        channel.receive(std::vector<uint8_t>(bytes.begin(), bytes.end()));
        scheduler_.runPending();
    }

    void deliver(const std::string& event, nlohmann::json data) {
        signaling_.deliver(event, std::move(data));
        scheduler_.runPending();
    }

    void signalLast(TransportHealth health) {
        transports_.last()->signal(health);
        scheduler_.runPending();
    }

    // Controller join, negosiasi dengan pi-1, lalu Connected
    void connectController() {
        createController();
        deliver("joined-room", {
            {"roomId", "control-room"},
            {"userId", "ctrl-1"},
            {"users", {user("pi-1", "Pi"), user("ctrl-1", "Controller")}}
        });
        deliver("answer", {{"fromUserId", "pi-1"}, {"answer", sdp("answer", "v=0 pi")}});
        signalLast(TransportHealth::Connected);
    }

    std::shared_ptr<FakeDataChannel> lastChannel() {
        auto state = transports_.last();
        return state && !state->channels.empty() ? state->channels.back() : nullptr;
    }

    void setInput(double throttle, double steering, std::vector<bool> buttons = {}) {
        session::InputState state;
        state.throttle = throttle;
        state.steering = steering;
        state.buttons = std::move(buttons);
        input_.state = state;
    }

    ManualScheduler scheduler_;
    FakeSignalingChannel signaling_;
    FakeTransportProvider transports_;
    FakeInputSource input_;
    ControlChannelConfig config_;
    std::unique_ptr<ControlChannelManager> manager_;
};

TEST_F(ControlChannelManagerTest, JoinsControlRoom) {
    config_.room = "pit-lane";
    createController();

    auto joins = signaling_.sentWith("join-room");
    ASSERT_EQ(joins.size(), 1u);
    EXPECT_EQ(joins[0].data["roomId"], "pit-lane");
    EXPECT_EQ(manager_->options().target_role, relay::Role::Pi);
}

TEST_F(ControlChannelManagerTest, OpensGamepadChannel) {
    connectController();

    auto state = transports_.last();
    ASSERT_EQ(state->channels.size(), 1u);
    EXPECT_EQ(state->channels[0]->label(), "gamepad");
    ASSERT_TRUE(state->channel_init);
    EXPECT_TRUE(state->channel_init->ordered);
    EXPECT_EQ(state->channel_init->max_retransmits, 3);
}

TEST_F(ControlChannelManagerTest, ProducesFramesWhileConnected) {
    connectController();
    EXPECT_TRUE(manager_->producing());

    lastChannel()->openNow();
    setInput(0.5, -0.05, {true, false, true});

    scheduler_.advance(20ms);
    auto channel = lastChannel();
    ASSERT_EQ(channel->sent.size(), 1u);

    auto frame = control::decode(channel->sent[0]);
    ASSERT_TRUE(frame.is_ok());
    EXPECT_EQ(frame.value().sequence, 1u);
    EXPECT_NEAR(frame.value().throttle(), 0.4 / 0.9, 1.0 / 32767.0);
    EXPECT_EQ(frame.value().steering_raw, 0);
    EXPECT_EQ(frame.value().buttons, 5);
    EXPECT_EQ(frame.value().timestamp_ms, static_cast<uint32_t>(scheduler_.nowMillis() & 0xFFFFFFFF));

    scheduler_.advance(40ms);
    ASSERT_EQ(channel->sent.size(), 3u);
    EXPECT_EQ(control::decode(channel->sent[2]).value().sequence, 3u);
    EXPECT_EQ(manager_->sequence(), 3u);
    EXPECT_EQ(manager_->stats().frames_sent, 3u);
}

TEST_F(ControlChannelManagerTest, SkipsTicksUntilChannelOpens) {
    connectController();
    setInput(0.2, 0.2);

    scheduler_.advance(100ms);
    EXPECT_TRUE(lastChannel()->sent.empty());
    EXPECT_EQ(manager_->sequence(), 0u);

    lastChannel()->openNow();
    scheduler_.advance(20ms);
    ASSERT_EQ(lastChannel()->sent.size(), 1u);
    EXPECT_EQ(control::decode(lastChannel()->sent[0]).value().sequence, 1u);
}

TEST_F(ControlChannelManagerTest, NoInputDeviceSendsNothing) {
    connectController();
    lastChannel()->openNow();

    scheduler_.advance(100ms);
    EXPECT_GT(input_.reads, 0);
    EXPECT_TRUE(lastChannel()->sent.empty());
    EXPECT_EQ(manager_->sequence(), 0u);
}

TEST_F(ControlChannelManagerTest, ManualStopAndStart) {
    connectController();
    lastChannel()->openNow();
    setInput(1.0, 0.0);

    scheduler_.advance(20ms);
    ASSERT_EQ(lastChannel()->sent.size(), 1u);

    manager_->stopProduction();
    scheduler_.runPending();
    EXPECT_FALSE(manager_->producing());
    EXPECT_EQ(scheduler_.pendingTimers(), 0u);

    scheduler_.advance(200ms);
    EXPECT_EQ(lastChannel()->sent.size(), 1u);

    manager_->startProduction();
    scheduler_.runPending();
    EXPECT_TRUE(manager_->producing());

    scheduler_.advance(20ms);
    ASSERT_EQ(lastChannel()->sent.size(), 2u);
    EXPECT_EQ(control::decode(lastChannel()->sent[1]).value().sequence, 2u);
}

TEST_F(ControlChannelManagerTest, StartRefusedWithoutConnection) {
    createController();

    manager_->startProduction();
    scheduler_.runPending();

    EXPECT_FALSE(manager_->producing());
    EXPECT_EQ(scheduler_.pendingTimers(), 0u);
}

TEST_F(ControlChannelManagerTest, DisconnectStopsAndReconnectResumes) {
    connectController();
    lastChannel()->openNow();
    setInput(0.0, 1.0);

    scheduler_.advance(20ms);
    ASSERT_EQ(manager_->sequence(), 1u);

    signalLast(TransportHealth::Disconnected);
    EXPECT_FALSE(manager_->producing());

    // Attempt pertama setelah 1000 ms membuka channel baru
    scheduler_.advance(1000ms);
    ASSERT_EQ(transports_.created.size(), 2u);
    EXPECT_EQ(manager_->sequence(), 1u);

    deliver("answer", {{"fromUserId", "pi-1"}, {"answer", sdp("answer", "v=0 pi again")}});
    signalLast(TransportHealth::Connected);
    EXPECT_TRUE(manager_->producing());

    lastChannel()->openNow();
    scheduler_.advance(20ms);
    ASSERT_EQ(lastChannel()->sent.size(), 1u);
    EXPECT_EQ(control::decode(lastChannel()->sent[0]).value().sequence, 2u);
}

TEST_F(ControlChannelManagerTest, ManualStopSurvivesReconnect) {
    connectController();

    manager_->stopProduction();
    scheduler_.runPending();

    signalLast(TransportHealth::Disconnected);
    scheduler_.advance(1000ms);
    deliver("answer", {{"fromUserId", "pi-1"}, {"answer", sdp("answer", "v=0 pi again")}});
    signalLast(TransportHealth::Connected);

    EXPECT_EQ(manager_->call("pi-1")->state, CallState::Connected);
    EXPECT_FALSE(manager_->producing());
}

TEST_F(ControlChannelManagerTest, DestroyCancelsTicks) {
    connectController();
    ASSERT_GT(scheduler_.pendingTimers(), 0u);

    manager_.reset();
    EXPECT_EQ(scheduler_.pendingTimers(), 0u);
}

// Sisi Pi: decode frame dari channel yang dibuka Controller
TEST_F(ControlChannelManagerTest, ReceiverDecodesFrames) {
    createPi();
    deliver("joined-room", {
        {"roomId", "control-room"},
        {"userId", "pi-1"},
        {"users", {user("ctrl-1", "Controller"), user("pi-1", "Pi")}}
    });
    deliver("offer", {{"fromUserId", "ctrl-1"}, {"offer", sdp("offer", "v=0 ctrl")}});
    ASSERT_EQ(signaling_.sentWith("answer").size(), 1u);
    EXPECT_TRUE(transports_.last()->channels.empty());

    std::vector<control::ControlFrame> frames;
    manager_->onControlFrame = [&](const control::ControlFrame& frame) { frames.push_back(frame); };

    auto other = std::make_shared<FakeDataChannel>("chat");
    auto gamepad = std::make_shared<FakeDataChannel>("gamepad");
    transports_.last()->announceChannel(other);
    transports_.last()->announceChannel(gamepad);
    scheduler_.runPending();
    EXPECT_FALSE(other->onMessage);
    ASSERT_TRUE(gamepad->onMessage);

    auto bytes = control::encode(0.25, -0.5, 0b11, 7, 1234);
    gamepad->receive(std::vector<uint8_t>(bytes.begin(), bytes.end()));
    gamepad->receive(std::vector<uint8_t>(15, 0));
    gamepad->receive(std::vector<uint8_t>(17, 0));
    scheduler_.runPending();

    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].sequence, 7u);
    EXPECT_EQ(frames[0].timestamp_ms, 1234u);
    EXPECT_EQ(frames[0].pressedButtons(), (std::vector<int>{0, 1}));

    auto stats = manager_->stats();
    EXPECT_EQ(stats.frames_received, 1u);
    EXPECT_EQ(stats.malformed_frames, 2u);
    EXPECT_FALSE(manager_->producing());
}

// 60 Hz: periode 16.667 ms tidak boleh melebar jadi 17 ms
TEST_F(ControlChannelManagerTest, SixtyHertzKeepsExactRate) {
    config_.send_frequency_hz = 60.0;
    connectController();
    lastChannel()->openNow();
    setInput(0.3, 0.0);

    scheduler_.advance(1000ms);
    EXPECT_EQ(lastChannel()->sent.size(), 60u);
    EXPECT_EQ(manager_->sequence(), 60u);

    scheduler_.advance(2000ms);
    EXPECT_EQ(manager_->sequence(), 180u);
    EXPECT_EQ(scheduler_.pendingTimers(), 1u);
}

TEST_F(ControlChannelManagerTest, TickTimesFollowDeadline) {
    config_.send_frequency_hz = 60.0;
    connectController();
    lastChannel()->openNow();
    setInput(0.3, 0.0);
    auto start = scheduler_.nowMillis();

    std::vector<int64_t> at;
    for (int i = 0; i < 6; ++i) {
        scheduler_.advance(1ms);
        while (manager_->sequence() == static_cast<uint32_t>(at.size())) {
            scheduler_.advance(1ms);
        }
        at.push_back(scheduler_.nowMillis() - start);
    }
    // ceil(n * 16.667 ms)
    EXPECT_EQ(at, (std::vector<int64_t>{17, 34, 50, 67, 84, 100}));
}

TEST_F(ControlChannelManagerTest, ReconnectFindsPiByRole) {
    connectController();

    signalLast(TransportHealth::Disconnected);
    deliver("user-left", {{"userId", "pi-1"}});
    ASSERT_TRUE(manager_->call("pi-1"));

    deliver("user-joined", {{"userId", "pi-2"}, {"userInfo", {{"role", "Pi"}}}});
    EXPECT_EQ(signaling_.sentWith("offer").size(), 1u);

    scheduler_.advance(1000ms);
    auto offers = signaling_.sentWith("offer");
    ASSERT_EQ(offers.size(), 2u);
    EXPECT_EQ(offers[1].data["targetUserId"], "pi-2");
    EXPECT_FALSE(manager_->call("pi-1"));

    deliver("answer", {{"fromUserId", "pi-2"}, {"answer", sdp("answer", "v=0 pi-2")}});
    signalLast(TransportHealth::Connected);
    auto info = manager_->call("pi-2");
    ASSERT_TRUE(info);
    EXPECT_EQ(info->state, CallState::Connected);
    EXPECT_EQ(info->attempt, 0);
    EXPECT_TRUE(manager_->producing());
}

TEST_F(ControlChannelManagerTest, PiDrivesVehicleFromFrames) {
    control::SimulatedActuator actuator;
    control::VehicleController vehicle(actuator);
    auto gamepad = connectPi(&vehicle);

    // Deadman ditahan: maju penuh dibatasi 25%
    receiveFrame(*gamepad, -1.0, -1.0, 0b001, 1);
    EXPECT_EQ(actuator.throttlePulse(), 1640);
    EXPECT_EQ(actuator.steeringAngle(), 162);

    // Tanpa deadman throttle netral, kemudi tetap jalan
    receiveFrame(*gamepad, -1.0, 1.0, 0b000, 2);
    EXPECT_EQ(actuator.throttlePulse(), 1500);
    EXPECT_EQ(actuator.steeringAngle(), 18);

    EXPECT_EQ(vehicle.status().frames_applied, 2u);
    EXPECT_EQ(vehicle.status().last_sequence, 2u);
    EXPECT_EQ(manager_->stats().vehicle_errors, 0u);
}

TEST_F(ControlChannelManagerTest, PiStopsVehicleOnDisconnect) {
    control::SimulatedActuator actuator;
    control::VehicleController vehicle(actuator);
    auto gamepad = connectPi(&vehicle);

    receiveFrame(*gamepad, -1.0, 1.0, 0b001, 1);
    ASSERT_EQ(actuator.throttlePulse(), 1640);
    ASSERT_EQ(actuator.steeringAngle(), 18);

    signalLast(TransportHealth::Disconnected);
    EXPECT_EQ(manager_->call("ctrl-1")->state, CallState::Reconnecting);
    EXPECT_EQ(actuator.throttlePulse(), 1500);
    EXPECT_EQ(actuator.steeringAngle(), 90);
}

TEST_F(ControlChannelManagerTest, PiStopsVehicleWhenControllerLeaves) {
    control::SimulatedActuator actuator;
    control::VehicleController vehicle(actuator);
    auto gamepad = connectPi(&vehicle);

    receiveFrame(*gamepad, 1.0, -0.5, 0b001, 1);
    ASSERT_EQ(actuator.throttlePulse(), 1360);

    deliver("user-left", {{"userId", "ctrl-1"}});
    EXPECT_FALSE(manager_->call("ctrl-1"));
    EXPECT_EQ(actuator.throttlePulse(), 1500);
    EXPECT_EQ(actuator.steeringAngle(), 90);
}

TEST(ControlChannelConfigTest, TickPeriod) {
    ControlChannelConfig config;
    EXPECT_EQ(config.tickPeriod(), 16667us);

    config.send_frequency_hz = 20.0;
    EXPECT_EQ(config.tickPeriod(), 50000us);

    config.send_frequency_hz = 1000.0;
    EXPECT_EQ(config.tickPeriod(), 1000us);
}

TEST(ControlChannelConfigTest, ReadsConfig) {
    core::Config config;
    ASSERT_TRUE(config.loadFromString(
        R"({"control": {"send_frequency_hz": 30, "deadzone": 0.2, "room": "pit", "target_role": "Pi"}})").is_ok());

    auto control = ControlChannelConfig::fromConfig(config);
    ASSERT_TRUE(control.is_ok());
    EXPECT_DOUBLE_EQ(control.value().send_frequency_hz, 30.0);
    EXPECT_DOUBLE_EQ(control.value().deadzone, 0.2);
    EXPECT_EQ(control.value().room, "pit");
    EXPECT_EQ(control.value().target_role, relay::Role::Pi);
}

TEST(ControlChannelConfigTest, DefaultsWithoutSection) {
    core::Config config;
    auto control = ControlChannelConfig::fromConfig(config);
    ASSERT_TRUE(control.is_ok());
    EXPECT_DOUBLE_EQ(control.value().send_frequency_hz, 60.0);
    EXPECT_DOUBLE_EQ(control.value().deadzone, 0.1);
    EXPECT_EQ(control.value().room, "control-room");
}

TEST(ControlChannelConfigTest, RejectsInvalidValues) {
    core::Config config;

    ASSERT_TRUE(config.loadFromString(R"({"control": {"send_frequency_hz": 0}})").is_ok());
    EXPECT_TRUE(ControlChannelConfig::fromConfig(config).is_error());

    ASSERT_TRUE(config.loadFromString(R"({"control": {"send_frequency_hz": 5000}})").is_ok());
    EXPECT_TRUE(ControlChannelConfig::fromConfig(config).is_error());

    ASSERT_TRUE(config.loadFromString(R"({"control": {"deadzone": 1.0}})").is_ok());
    EXPECT_TRUE(ControlChannelConfig::fromConfig(config).is_error());

    ASSERT_TRUE(config.loadFromString(R"({"control": {"room": ""}})").is_ok());
    EXPECT_TRUE(ControlChannelConfig::fromConfig(config).is_error());

    ASSERT_TRUE(config.loadFromString(R"({"control": {"deadzone": "wide"}})").is_ok());
    EXPECT_TRUE(ControlChannelConfig::fromConfig(config).is_error());
}

} // namespace carlink::session::test

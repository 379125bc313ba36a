/**
 * Local Session Example
 *
 * Runs a Controller, a Car and a Pi inside one process: an in-process relay
 * hub carries the signaling events and loopback transports carry media and
 * control frames. The Pi drives a simulated vehicle from the frames it
 * receives. Halfway through, every link is dropped to show recovery, then the
 * Car loses its relay connection and rejoins.
 */

#include <carlink/control/vehicle_controller.hpp>
#include <carlink/core/event.hpp>
#include <carlink/core/logger.hpp>
#include <carlink/session/call_manager.hpp>
#include <carlink/session/control_channel_manager.hpp>
#include <carlink/session/loopback_transport.hpp>
#include <carlink/session/signaling_channel.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

using namespace carlink;

namespace {

// Kamera/mikrofon palsu milik Car
class DemoMedia : public session::LocalMediaSource {
public:
    bool hasTrack(session::TrackKind) const override { return true; }

    bool trackEnabled(session::TrackKind kind) const override {
        return kind == session::TrackKind::Video ? video_ : audio_;
    }

    void setTrackEnabled(session::TrackKind kind, bool enabled) override {
        (kind == session::TrackKind::Video ? video_ : audio_) = enabled;
    }

private:
    bool video_ = true;
    bool audio_ = true;
};

// Gamepad sintetis: throttle naik turun pelan, tombol 0 berkedip
class DemoGamepad : public session::InputSource {
public:
    std::optional<session::InputState> read() override {
        ++reads_;
        session::InputState state;
        state.throttle = std::sin(reads_ / 30.0);
        state.steering = std::cos(reads_ / 45.0) * 0.5;
        state.buttons = {(reads_ / 20) % 2 == 0};  // deadman
        return state;
    }

private:
    int reads_ = 0;
};

session::PeerSessionOptions optionsFor(relay::Role local, relay::Role target) {
    session::PeerSessionOptions options;
    options.room = "video-room";
    options.local_role = local;
    options.target_role = target;
    options.reconnect.base_delay = std::chrono::milliseconds(500);
    return options;
}

} // namespace

int main() {
    core::Logger::setLevel(core::LogLevel::INFO);

    core::EventLoop loop;
    loop.start();

    session::LocalRelayHub hub;
    session::LoopbackTransportProvider transports;

    auto controller_video_link = hub.connect();
    auto car_link = hub.connect();
    auto controller_control_link = hub.connect();
    auto pi_link = hub.connect();

    DemoMedia car_media;
    DemoGamepad gamepad;
    session::ControlChannelConfig control_config;
    control_config.send_frequency_hz = 20.0;

    std::atomic<uint32_t> last_sequence{0};
    control::SimulatedActuator actuator;
    control::VehicleController vehicle(actuator);

    {
        session::CallManager car(loop, *car_link, transports,
            optionsFor(relay::Role::Car, relay::Role::Controller), &car_media);
        session::CallManager controller(loop, *controller_video_link, transports,
            optionsFor(relay::Role::Controller, relay::Role::Car));
        session::ControlChannelManager pi(loop, *pi_link, transports,
            optionsFor(relay::Role::Pi, relay::Role::Controller), control_config, nullptr, &vehicle);
        session::ControlChannelManager controller_control(loop, *controller_control_link, transports,
            optionsFor(relay::Role::Controller, relay::Role::Pi), control_config, &gamepad);

        controller.onCallStateChange = [](const session::CallInfo& info) {
            std::cout << "video call with " << info.remote_id << ": "
                      << session::callStateName(info.state) << std::endl;
        };
        controller.onRemoteMediaState = [](session::TrackKind kind, bool enabled) {
            std::cout << "car " << session::trackKindName(kind) << " is " << (enabled ? "on" : "off") << std::endl;
        };
        // Dipanggil setelah frame diterapkan ke kendaraan
        pi.onControlFrame = [&last_sequence, &actuator](const control::ControlFrame& frame) {
            last_sequence = frame.sequence;
            if (frame.sequence % 20 == 0) {
                std::cout << "pi: frame " << frame.sequence
                          << " throttle=" << frame.throttle()
                          << " steering=" << frame.steering()
                          << " -> esc " << actuator.throttlePulse() << "us"
                          << " servo " << actuator.steeringAngle() << " deg" << std::endl;
            }
        };
        car.onRelayLink = [](bool connected) {
            std::cout << "car relay link " << (connected ? "restored" : "lost") << std::endl;
        };

        car.start();
        pi.start();
        controller.start();
        controller_control.start();

        std::this_thread::sleep_for(std::chrono::seconds(2));
        controller.toggleRemoteVideo();

        std::this_thread::sleep_for(std::chrono::seconds(1));
        std::cout << "dropping every link" << std::endl;
        transports.dropLinks();

        std::this_thread::sleep_for(std::chrono::seconds(3));
        std::cout << "pi received up to frame " << last_sequence.load() << std::endl;

        std::cout << "dropping the car's relay connection" << std::endl;
        car_link->dropLink();
        std::this_thread::sleep_for(std::chrono::seconds(1));
        car_link->restoreLink();
        std::this_thread::sleep_for(std::chrono::seconds(1));

        controller_control.stop();
        controller.stop();
        pi.stop();
        car.stop();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        // Manager dihancurkan setelah loop berhenti
        loop.stop();
    }

    return 0;
}

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <carlink/control/control_frame.hpp>
#include <carlink/control/vehicle_controller.hpp>
#include <carlink/core/config.hpp>
#include <carlink/core/error.hpp>
#include <carlink/session/peer_session_manager.hpp>

namespace carlink::session {

// Konfigurasi control channel, dibaca dari object "control"
struct ControlChannelConfig {
    double send_frequency_hz = 60.0;
    double deadzone = control::kDefaultDeadzone;
    std::string room = "control-room";
    relay::Role target_role = relay::Role::Pi;

    // Periode tick produksi frame dalam mikrodetik (dibulatkan)
    std::chrono::microseconds tickPeriod() const;

    static core::Result<ControlChannelConfig> fromConfig(const core::Config& config);
};

struct ControlChannelStats {
    uint64_t frames_sent = 0;
    uint64_t frames_received = 0;
    uint64_t malformed_frames = 0;
    uint64_t send_failures = 0;
    uint64_t vehicle_errors = 0;
};

// Channel data-only untuk frame input kontrol (Controller -> Pi).
// room dan target_role pada options diganti dengan nilai dari config.
// Di sisi Pi frame diteruskan ke VehicleController (jika ada); kendaraan
// dihentikan setiap kali Call keluar dari Connected.
class ControlChannelManager : public PeerSessionManager {
public:
    static constexpr const char* kChannelLabel = "gamepad";
    static constexpr int kMaxRetransmits = 3;

    ControlChannelManager(core::Scheduler& scheduler,
                          SignalingChannel& signaling,
                          TransportProvider& transports,
                          PeerSessionOptions options,
                          ControlChannelConfig config,
                          InputSource* input = nullptr,
                          control::VehicleController* vehicle = nullptr);
    ~ControlChannelManager() override;

    // Override manual di atas auto start/stop
    void startProduction();
    void stopProduction();

    bool producing() const { return producing_; }
    uint32_t sequence() const { return sequence_; }
    ControlChannelStats stats() const;
    const ControlChannelConfig& config() const { return config_; }

    // Frame valid yang diterima (sisi penerima)
    std::function<void(const control::ControlFrame&)> onControlFrame;

protected:
    core::Result<void> prepareTransport(Call& call) override;
    void onCallConnected(Call& call) override;
    void onCallLeftConnected(Call& call) override;
    void onCallClosed(Call& call) override;
    void onIncomingDataChannel(Call& call, std::shared_ptr<DataChannel> channel) override;

private:
    void bindChannel(Call& call, std::shared_ptr<DataChannel> channel);
    void handleFrame(const std::vector<uint8_t>& bytes);
    void stopVehicle();

    void startTicks();
    void stopTicks();
    void scheduleTick();
    void tick(uint64_t generation);

    ControlChannelConfig config_;
    InputSource* input_;
    control::VehicleController* vehicle_;

    bool producing_ = false;
    bool manual_stop_ = false;
    std::optional<core::TimerId> tick_timer_;
    uint64_t tick_generation_ = 0;
    // Deadline tick ke-n = origin + n * (1e6 / Hz) us
    int64_t tick_origin_us_ = 0;
    uint64_t tick_index_ = 0;
    uint32_t sequence_ = 0;

    std::atomic<uint64_t> frames_sent_{0};
    std::atomic<uint64_t> frames_received_{0};
    std::atomic<uint64_t> malformed_frames_{0};
    std::atomic<uint64_t> send_failures_{0};
    std::atomic<uint64_t> vehicle_errors_{0};
};

} // namespace carlink::session

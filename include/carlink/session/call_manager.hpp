#pragma once

#include <functional>
#include <string>

#include <carlink/core/config.hpp>
#include <carlink/core/error.hpp>
#include <carlink/session/peer_session_manager.hpp>

namespace carlink::session {

// Konfigurasi call video, dibaca dari object "video"
struct VideoCallConfig {
    std::string room = "video-room";
    relay::Role target_role = relay::Role::Car;

    static core::Result<VideoCallConfig> fromConfig(const core::Config& config);
};

// Call audio/video utama antara Controller dan Car
class CallManager : public PeerSessionManager {
public:
    // media boleh nullptr (peer tanpa kamera/mikrofon)
    CallManager(core::Scheduler& scheduler,
                SignalingChannel& signaling,
                TransportProvider& transports,
                PeerSessionOptions options,
                LocalMediaSource* media = nullptr);

    // Minta Car menyalakan/mematikan track lokalnya
    void toggleRemoteVideo();
    void toggleRemoteAudio();

    // Events
    std::function<void(const std::string&, TrackKind)> onRemoteMedia;
    std::function<void(const std::string&)> onRemoteMediaRemoved;
    std::function<void(TrackKind, bool)> onRemoteMediaState;

protected:
    core::Result<void> prepareTransport(Call& call) override;
    void onRemoteTrack(Call& call, TrackKind kind) override;
    void onCallClosed(Call& call) override;
    void onRemoteControl(const nlohmann::json& data) override;

private:
    void sendToggle(const std::string& action);
    void applyToggle(TrackKind kind);

    LocalMediaSource* media_;
};

} // namespace carlink::session

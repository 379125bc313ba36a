#include <carlink/session/call_manager.hpp>
#include <carlink/core/logger.hpp>

namespace carlink::session {

using core::Logger;

namespace {

constexpr const char* kToggleVideo = "toggle-video";
constexpr const char* kToggleAudio = "toggle-audio";
constexpr const char* kMediaState = "media-state";

std::optional<TrackKind> trackKindFromString(const std::string& name) {
    if (name == "video") return TrackKind::Video;
    if (name == "audio") return TrackKind::Audio;
    return std::nullopt;
}

} // namespace

core::Result<VideoCallConfig> VideoCallConfig::fromConfig(const core::Config& config) {
    VideoCallConfig result;
    auto node = config.section("video");

    std::string target = relay::roleName(result.target_role);
    auto read_room = node->read("room", result.room);
    if (read_room.is_error()) return read_room.error();
    auto read_target = node->read("target_role", target);
    if (read_target.is_error()) return read_target.error();

    if (result.room.empty()) {
        return {core::ErrorCode::InvalidData, "video.room must not be empty"};
    }
    result.target_role = relay::roleFromString(target);
    if (result.target_role == relay::Role::Unknown) {
        return {core::ErrorCode::InvalidData, "video.target_role is not a known role: " + target};
    }
    return result;
}

CallManager::CallManager(core::Scheduler& scheduler,
                         SignalingChannel& signaling,
                         TransportProvider& transports,
                         PeerSessionOptions options,
                         LocalMediaSource* media)
    : PeerSessionManager(scheduler, signaling, transports, std::move(options))
    , media_(media) {}

void CallManager::toggleRemoteVideo() {
    post([this]() { sendToggle(kToggleVideo); });
}

void CallManager::toggleRemoteAudio() {
    post([this]() { sendToggle(kToggleAudio); });
}

void CallManager::sendToggle(const std::string& action) {
    if (!joined()) {
        Logger::warn("{}: cannot send {} before joining a room", relay::roleName(options().local_role), action);
        return;
    }
    send(relay::events::RemoteControl, {{"action", action}, {"room", options().room}});
}

core::Result<void> CallManager::prepareTransport(Call& call) {
    if (!media_) {
        return {};
    }
    return call.transport->addLocalMedia(*media_);
}

void CallManager::onRemoteTrack(Call& call, TrackKind kind) {
    Logger::info("Remote {} track from {}", trackKindName(kind), call.remote_id);
    if (onRemoteMedia) {
        onRemoteMedia(call.remote_id, kind);
    }
}

void CallManager::onCallClosed(Call& call) {
    if (onRemoteMediaRemoved) {
        onRemoteMediaRemoved(call.remote_id);
    }
}

void CallManager::onRemoteControl(const nlohmann::json& data) {
    if (!data.is_object() || !data.contains("action") || !data["action"].is_string()) {
        Logger::debug("remote-control without action ignored");
        return;
    }

    auto action = data["action"].get<std::string>();
    if (action == kToggleVideo) {
        applyToggle(TrackKind::Video);
    } else if (action == kToggleAudio) {
        applyToggle(TrackKind::Audio);
    } else if (action == kMediaState && isInitiator()) {
        auto kind = trackKindFromString(data.value("kind", std::string()));
        if (!kind || !data.contains("enabled") || !data["enabled"].is_boolean()) {
            Logger::debug("malformed media-state ignored");
            return;
        }
        bool enabled = data["enabled"].get<bool>();
        Logger::info("Remote {} is now {}", trackKindName(*kind), enabled ? "on" : "off");
        if (onRemoteMediaState) {
            onRemoteMediaState(*kind, enabled);
        }
    } else {
        Logger::debug("remote-control action {} ignored", action);
    }
}

void CallManager::applyToggle(TrackKind kind) {
    if (isInitiator()) return;

    if (!media_ || !media_->hasTrack(kind)) {
        Logger::debug("No local {} track to toggle", trackKindName(kind));
        return;
    }

    bool enabled = !media_->trackEnabled(kind);
    media_->setTrackEnabled(kind, enabled);
    Logger::info("Local {} turned {} by remote request", trackKindName(kind), enabled ? "on" : "off");

    send(relay::events::RemoteControl, {
        {"action", kMediaState},
        {"kind", trackKindName(kind)},
        {"enabled", enabled},
        {"room", options().room}
    });
}

} // namespace carlink::session

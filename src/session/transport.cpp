#include <carlink/session/transport.hpp>

namespace carlink::session {

const char* transportHealthName(TransportHealth health) {
    switch (health) {
        case TransportHealth::New: return "new";
        case TransportHealth::Checking: return "checking";
        case TransportHealth::Connected: return "connected";
        case TransportHealth::Completed: return "completed";
        case TransportHealth::Disconnected: return "disconnected";
        case TransportHealth::Failed: return "failed";
        case TransportHealth::Closed: return "closed";
    }
    return "unknown";
}

const char* trackKindName(TrackKind kind) {
    switch (kind) {
        case TrackKind::Audio: return "audio";
        case TrackKind::Video: return "video";
    }
    return "unknown";
}

nlohmann::json SessionDescription::toJson() const {
    return {
        {"type", type == SdpType::Offer ? "offer" : "answer"},
        {"sdp", sdp}
    };
}

core::Result<SessionDescription> SessionDescription::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return {core::ErrorCode::InvalidMessage, "Session description must be an object"};
    }

    auto type = json.find("type");
    auto sdp = json.find("sdp");
    if (type == json.end() || !type->is_string()) {
        return {core::ErrorCode::MissingField, "Session description has no type"};
    }
    if (sdp == json.end() || !sdp->is_string()) {
        return {core::ErrorCode::MissingField, "Session description has no sdp"};
    }

    SessionDescription description;
    auto type_name = type->get<std::string>();
    if (type_name == "offer") {
        description.type = SdpType::Offer;
    } else if (type_name == "answer") {
        description.type = SdpType::Answer;
    } else {
        return {core::ErrorCode::InvalidMessage, "Unsupported session description type: " + type_name};
    }
    description.sdp = sdp->get<std::string>();
    return description;
}

nlohmann::json IceCandidate::toJson() const {
    return {
        {"candidate", candidate},
        {"sdpMid", sdp_mid},
        {"sdpMLineIndex", sdp_mline_index}
    };
}

core::Result<IceCandidate> IceCandidate::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return {core::ErrorCode::InvalidMessage, "ICE candidate must be an object"};
    }

    auto candidate = json.find("candidate");
    if (candidate == json.end() || !candidate->is_string()) {
        return {core::ErrorCode::MissingField, "ICE candidate has no candidate"};
    }

    IceCandidate result;
    result.candidate = candidate->get<std::string>();

    auto mid = json.find("sdpMid");
    if (mid != json.end() && mid->is_string()) {
        result.sdp_mid = mid->get<std::string>();
    }
    auto index = json.find("sdpMLineIndex");
    if (index != json.end() && index->is_number_integer()) {
        result.sdp_mline_index = index->get<int>();
    }
    return result;
}

} // namespace carlink::session

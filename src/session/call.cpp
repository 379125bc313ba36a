#include <carlink/session/call.hpp>

#include <algorithm>

namespace carlink::session {

const char* callStateName(CallState state) {
    switch (state) {
        case CallState::Idle: return "Idle";
        case CallState::Negotiating: return "Negotiating";
        case CallState::Connected: return "Connected";
        case CallState::Disconnected: return "Disconnected";
        case CallState::Reconnecting: return "Reconnecting";
        case CallState::Closed: return "Closed";
    }
    return "Unknown";
}

std::chrono::milliseconds ReconnectPolicy::delayFor(int attempt) const {
    auto delay = base_delay;
    for (int i = 1; i < attempt && delay < cap_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, cap_delay);
}

core::Result<ReconnectPolicy> ReconnectPolicy::fromConfig(const core::Config& config) {
    ReconnectPolicy policy;
    auto node = config.section("reconnect");

    int64_t base = policy.base_delay.count();
    int64_t cap = policy.cap_delay.count();
    int64_t max_attempts = policy.max_attempts;
    int64_t grace = policy.grace_period.count();

    for (auto read : {
            node->read("base_delay_ms", base),
            node->read("cap_delay_ms", cap),
            node->read("max_attempts", max_attempts),
            node->read("grace_period_ms", grace)}) {
        if (read.is_error()) return read.error();
    }

    if (base <= 0 || cap < base) {
        return {core::ErrorCode::InvalidData, "reconnect delays must satisfy 0 < base_delay_ms <= cap_delay_ms"};
    }
    if (max_attempts < 1) {
        return {core::ErrorCode::InvalidData, "reconnect.max_attempts must be at least 1"};
    }
    if (grace <= 0) {
        return {core::ErrorCode::InvalidData, "reconnect.grace_period_ms must be positive"};
    }

    policy.base_delay = std::chrono::milliseconds(base);
    policy.cap_delay = std::chrono::milliseconds(cap);
    policy.max_attempts = static_cast<int>(max_attempts);
    policy.grace_period = std::chrono::milliseconds(grace);
    return policy;
}

CallInfo describeCall(const Call& call) {
    CallInfo info;
    info.id = call.id;
    info.remote_id = call.remote_id;
    info.remote_role = call.remote_role;
    info.state = call.state;
    info.attempt = call.attempt;
    info.reconnecting = call.reconnecting;
    info.remote_tracks = call.remote_tracks;
    return info;
}

} // namespace carlink::session

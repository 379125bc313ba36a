#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <carlink/core/config.hpp>
#include <carlink/core/error.hpp>
#include <carlink/core/event.hpp>
#include <carlink/relay/session_registry.hpp>
#include <carlink/session/transport.hpp>

namespace carlink::session {

enum class CallState {
    Idle,
    Negotiating,
    Connected,
    Disconnected,
    Reconnecting,
    Closed
};

const char* callStateName(CallState state);

struct ReconnectPolicy {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds cap_delay{30000};
    int max_attempts = 5;
    std::chrono::milliseconds grace_period{2000};

    // Delay sebelum attempt ke-k (mulai dari 1): min(base * 2^(k-1), cap)
    std::chrono::milliseconds delayFor(int attempt) const;

    // Baca dari object "reconnect"
    static core::Result<ReconnectPolicy> fromConfig(const core::Config& config);
};

// Anggota room lain seperti yang terlihat dari event relay
struct Member {
    std::string id;
    relay::Role role = relay::Role::Unknown;
    nlohmann::json user_info = nlohmann::json::object();
};

// Sesi dengan satu peer remote; hanya dilacak di sisi client
struct Call {
    uint64_t id = 0;
    std::string remote_id;
    relay::Role remote_role = relay::Role::Unknown;
    CallState state = CallState::Idle;
    bool initiator = false;

    int attempt = 0;
    bool reconnecting = false;            // guard single-flight
    std::optional<core::TimerId> timer;   // backoff atau grace timer
    uint64_t timer_generation = 0;
    uint64_t epoch = 0;                   // naik setiap transport diganti

    std::unique_ptr<PeerTransport> transport;
    std::shared_ptr<DataChannel> data_channel;
    bool has_remote_description = false;
    std::vector<IceCandidate> pending_candidates;
    std::vector<TrackKind> remote_tracks;
};

// Snapshot Call untuk observer
struct CallInfo {
    uint64_t id = 0;
    std::string remote_id;
    relay::Role remote_role = relay::Role::Unknown;
    CallState state = CallState::Idle;
    int attempt = 0;
    bool reconnecting = false;
    std::vector<TrackKind> remote_tracks;
};

CallInfo describeCall(const Call& call);

} // namespace carlink::session

#pragma once

#include <string>
#include <string_view>
#include <chrono>

#include <nlohmann/json.hpp>

#include <carlink/core/error.hpp>

namespace carlink::relay {

// Nama event pada wire
namespace events {
    inline constexpr const char* JoinRoom = "join-room";
    inline constexpr const char* JoinedRoom = "joined-room";
    inline constexpr const char* LeaveRoom = "leave-room";
    inline constexpr const char* UserJoined = "user-joined";
    inline constexpr const char* UserLeft = "user-left";
    inline constexpr const char* Offer = "offer";
    inline constexpr const char* Answer = "answer";
    inline constexpr const char* IceCandidate = "ice-candidate";
    inline constexpr const char* RemoteControl = "remote-control";
    inline constexpr const char* Message = "message";
    inline constexpr const char* Error = "error";
}

// Envelope satu frame teks: {"event": "<verb>", "data": {...}}
struct WireMessage {
    std::string event;
    nlohmann::json data = nlohmann::json::object();

    WireMessage() = default;
    WireMessage(std::string e, nlohmann::json d)
        : event(std::move(e)), data(std::move(d)) {}

    std::string toJson() const;
    static core::Result<WireMessage> fromJson(std::string_view text);
};

// ISO-8601 UTC dengan milidetik, misalnya 2024-05-01T12:00:00.000Z
std::string toIsoTimestamp(std::chrono::system_clock::time_point time);

} // namespace carlink::relay

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <mutex>
#include <cstdint>

#include <carlink/core/error.hpp>
#include <carlink/relay/session_registry.hpp>
#include <carlink/relay/wire.hpp>

namespace carlink::relay {

// Tujuan pengiriman pesan keluar dari relay ke satu koneksi
class DeliverySink {
public:
    virtual ~DeliverySink() = default;
    virtual void deliver(const std::string& connection_id, const WireMessage& message) = 0;
};

// Router pesan signaling: keanggotaan room, negosiasi, dan remote-control.
// Relay tidak pernah melihat media; payload negosiasi diteruskan apa adanya.
class SignalingRelay {
public:
    SignalingRelay(SessionRegistry& registry, DeliverySink& sink);

    SignalingRelay(const SignalingRelay&) = delete;
    SignalingRelay& operator=(const SignalingRelay&) = delete;

    // Koneksi baru dengan id yang dibuat relay
    std::string connect();

    // Koneksi baru dengan id dari pemanggil
    void connect(const std::string& connection_id);

    // Idempotent: leave-room implisit lalu hapus dari registry
    void disconnect(const std::string& connection_id);

    void handle(const std::string& connection_id, const WireMessage& message);

    // Parse frame teks lalu handle; frame rusak dibalas dengan event error
    void handleText(const std::string& connection_id, std::string_view text);

    struct Stats {
        uint64_t connections_accepted = 0;
        uint64_t connections_closed = 0;
        uint64_t messages_received = 0;
        uint64_t messages_forwarded = 0;
        uint64_t errors = 0;
    };

    Stats getStats() const;

    SessionRegistry& registry() { return registry_; }

private:
    core::Result<void> dispatch(const std::string& connection_id, const WireMessage& message);

    core::Result<void> handleJoinRoom(const std::string& connection_id, const nlohmann::json& data);
    core::Result<void> handleLeaveRoom(const std::string& connection_id);
    core::Result<void> handleSignaling(const std::string& connection_id,
                                       const std::string& event,
                                       const nlohmann::json& data);
    core::Result<void> handleRemoteControl(const std::string& connection_id, const nlohmann::json& data);
    core::Result<void> handleMessage(const std::string& connection_id, const nlohmann::json& data);

    void broadcastUserLeft(const std::string& user_id, const Departure& departure);
    void send(const std::string& connection_id, const WireMessage& message);
    void sendError(const std::string& connection_id, const core::Error& error);

    SessionRegistry& registry_;
    DeliverySink& sink_;

    Stats stats_;
    mutable std::mutex stats_mutex_;
};

// Id koneksi acak, misalnya "client-3fa91c0b27de"
std::string generateConnectionId();

} // namespace carlink::relay

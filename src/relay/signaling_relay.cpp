#include <carlink/relay/signaling_relay.hpp>
#include <carlink/core/logger.hpp>

#include <random>
#include <sstream>

namespace carlink::relay {

namespace {

std::optional<std::string> stringField(const nlohmann::json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

nlohmann::json describeMember(const User& user) {
    return {
        {"id", user.id},
        {"userInfo", user.user_info},
        {"joinedAt", toIsoTimestamp(user.joined_at)}
    };
}

} // namespace

SignalingRelay::SignalingRelay(SessionRegistry& registry, DeliverySink& sink)
    : registry_(registry)
    , sink_(sink) {}

std::string SignalingRelay::connect() {
    auto id = generateConnectionId();
    connect(id);
    return id;
}

void SignalingRelay::connect(const std::string& connection_id) {
    User user;
    user.id = connection_id;
    user.joined_at = std::chrono::system_clock::now();
    registry_.addUser(std::move(user));

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.connections_accepted++;
    }
    core::Logger::info("Relay: user connected: {}", connection_id);
}

void SignalingRelay::disconnect(const std::string& connection_id) {
    auto departure = registry_.removeEverywhere(connection_id);
    if (!registry_.removeUser(connection_id)) {
        return;
    }
    if (departure) {
        broadcastUserLeft(connection_id, *departure);
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.connections_closed++;
    }
    core::Logger::info("Relay: user disconnected: {}", connection_id);
}

void SignalingRelay::handle(const std::string& connection_id, const WireMessage& message) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_received++;
    }

    auto result = dispatch(connection_id, message);
    if (result.is_error()) {
        sendError(connection_id, result.error());
    }
}

void SignalingRelay::handleText(const std::string& connection_id, std::string_view text) {
    auto message = WireMessage::fromJson(text);
    if (message.is_error()) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.messages_received++;
        }
        sendError(connection_id, message.error());
        return;
    }
    handle(connection_id, message.value());
}

SignalingRelay::Stats SignalingRelay::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

core::Result<void> SignalingRelay::dispatch(const std::string& connection_id, const WireMessage& message) {
    if (!registry_.lookup(connection_id)) {
        return {core::ErrorCode::InvalidState, "Connection is not registered"};
    }

    const auto& event = message.event;
    core::Logger::debug("Relay: {} from {}", event, connection_id);

    if (event == events::JoinRoom) {
        return handleJoinRoom(connection_id, message.data);
    }
    if (event == events::LeaveRoom) {
        return handleLeaveRoom(connection_id);
    }
    if (event == events::Offer || event == events::Answer || event == events::IceCandidate) {
        return handleSignaling(connection_id, event, message.data);
    }
    if (event == events::RemoteControl) {
        return handleRemoteControl(connection_id, message.data);
    }
    if (event == events::Message) {
        return handleMessage(connection_id, message.data);
    }

    return {core::ErrorCode::InvalidMessage, "Unknown event: " + event};
}

core::Result<void> SignalingRelay::handleJoinRoom(const std::string& connection_id, const nlohmann::json& data) {
    auto room_id = stringField(data, "roomId");
    if (!room_id) {
        return {core::ErrorCode::MissingField, "Room ID is required"};
    }

    nlohmann::json user_info = nlohmann::json::object();
    auto info = data.find("userInfo");
    if (info != data.end() && info->is_object()) {
        user_info = *info;
    }

    auto joined = registry_.join(*room_id, connection_id, user_info);
    if (!joined) {
        return {core::ErrorCode::InvalidState, "Connection is not registered"};
    }

    // Leave implisit dari room sebelumnya (atau room yang sama saat re-join)
    if (joined->departed) {
        broadcastUserLeft(connection_id, *joined->departed);
    }

    nlohmann::json users = nlohmann::json::array();
    std::string joined_at;
    for (const auto& member : joined->members) {
        users.push_back(describeMember(member));
        if (member.id == connection_id) {
            joined_at = toIsoTimestamp(member.joined_at);
        }
    }

    send(connection_id, WireMessage(events::JoinedRoom, {
        {"roomId", *room_id},
        {"userId", connection_id},
        {"users", users}
    }));

    WireMessage announcement(events::UserJoined, {
        {"userId", connection_id},
        {"userInfo", user_info},
        {"joinedAt", joined_at}
    });
    for (const auto& member : joined->members) {
        if (member.id != connection_id) {
            send(member.id, announcement);
        }
    }

    core::Logger::info("Relay: user {} joined room {} as {} ({} members)",
        connection_id, *room_id, roleName(roleFromUserInfo(user_info)), joined->members.size());
    return {};
}

core::Result<void> SignalingRelay::handleLeaveRoom(const std::string& connection_id) {
    auto departure = registry_.removeEverywhere(connection_id);
    if (!departure) {
        return {};
    }

    broadcastUserLeft(connection_id, *departure);
    core::Logger::info("Relay: user {} left room {}", connection_id, departure->room_id);
    return {};
}

core::Result<void> SignalingRelay::handleSignaling(const std::string& connection_id,
                                                   const std::string& event,
                                                   const nlohmann::json& data) {
    auto target = stringField(data, "targetUserId");
    if (!target) {
        return {core::ErrorCode::MissingField, "Target user ID is required"};
    }
    if (!registry_.lookup(*target)) {
        return {core::ErrorCode::UnknownTarget, "Target user not found"};
    }

    nlohmann::json payload = data;
    payload.erase("targetUserId");
    payload["fromUserId"] = connection_id;

    send(*target, WireMessage(event, std::move(payload)));
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_forwarded++;
    }
    core::Logger::debug("Relay: {} forwarded from {} to {}", event, connection_id, *target);
    return {};
}

core::Result<void> SignalingRelay::handleRemoteControl(const std::string& connection_id, const nlohmann::json& data) {
    auto room_id = stringField(data, "room");
    if (!room_id) {
        auto sender = registry_.lookup(connection_id);
        if (!sender || !sender->room) {
            return {core::ErrorCode::NotInRoom, "You must be in a room to send remote-control"};
        }
        room_id = sender->room;
    }

    nlohmann::json payload = data;
    payload["fromUserId"] = connection_id;
    WireMessage forward(events::RemoteControl, std::move(payload));

    for (const auto& member : registry_.members(*room_id)) {
        if (member.id != connection_id) {
            send(member.id, forward);
        }
    }
    core::Logger::debug("Relay: remote-control from {} to room {}", connection_id, *room_id);
    return {};
}

core::Result<void> SignalingRelay::handleMessage(const std::string& connection_id, const nlohmann::json& data) {
    auto sender = registry_.lookup(connection_id);
    if (!sender || !sender->room) {
        return {core::ErrorCode::NotInRoom, "You must be in a room to send messages"};
    }

    auto text = data.find("message");
    WireMessage chat(events::Message, {
        {"fromUserId", connection_id},
        {"message", text != data.end() ? *text : nlohmann::json()},
        {"timestamp", toIsoTimestamp(std::chrono::system_clock::now())}
    });

    for (const auto& member : registry_.members(*sender->room)) {
        if (member.id != connection_id) {
            send(member.id, chat);
        }
    }
    return {};
}

void SignalingRelay::broadcastUserLeft(const std::string& user_id, const Departure& departure) {
    WireMessage left(events::UserLeft, {{"userId", user_id}});
    for (const auto& member : departure.remaining) {
        if (member != user_id) {
            send(member, left);
        }
    }
}

void SignalingRelay::send(const std::string& connection_id, const WireMessage& message) {
    sink_.deliver(connection_id, message);
}

void SignalingRelay::sendError(const std::string& connection_id, const core::Error& error) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.errors++;
    }
    core::Logger::warn("Relay: rejected message from {}: {}", connection_id, error.what());
    send(connection_id, WireMessage(events::Error, {{"message", error.what()}}));
}

std::string generateConnectionId() {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << "client-";

    for (int i = 0; i < 12; ++i) {
        oss << std::hex << dis(gen);
    }

    return oss.str();
}

} // namespace carlink::relay

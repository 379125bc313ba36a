#include <carlink/relay/session_registry.hpp>
#include <carlink/core/logger.hpp>

#include <algorithm>

namespace carlink::relay {

const char* roleName(Role role) {
    switch (role) {
        case Role::Controller: return "Controller";
        case Role::Car: return "Car";
        case Role::Pi: return "Pi";
        case Role::Unknown: return "Unknown";
    }
    return "Unknown";
}

Role roleFromString(std::string_view name) {
    if (name == "Controller") return Role::Controller;
    if (name == "Car") return Role::Car;
    if (name == "Pi") return Role::Pi;
    return Role::Unknown;
}

Role roleFromUserInfo(const nlohmann::json& user_info) {
    if (!user_info.is_object()) return Role::Unknown;
    auto it = user_info.find("role");
    if (it == user_info.end() || !it->is_string()) return Role::Unknown;
    return roleFromString(it->get<std::string>());
}

void SessionRegistry::addUser(User user) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = user.id;
    user.room.reset();
    users_[id] = std::move(user);
    core::Logger::debug("Registry: user {} registered ({} total)", id, users_.size());
}

bool SessionRegistry::removeUser(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return false;
    }

    detachLocked(it->second);
    users_.erase(it);
    core::Logger::debug("Registry: user {} removed ({} total)", user_id, users_.size());
    return true;
}

std::optional<JoinResult> SessionRegistry::join(const std::string& room_id,
                                                const std::string& user_id,
                                                nlohmann::json user_info) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return std::nullopt;
    }

    User& user = it->second;
    JoinResult result;
    result.departed = detachLocked(user);

    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end()) {
        Room room;
        room.id = room_id;
        room.created_at = std::chrono::system_clock::now();
        room_it = rooms_.emplace(room_id, std::move(room)).first;
        core::Logger::debug("Registry: room {} created", room_id);
    }

    room_it->second.members.push_back(user_id);
    user.room = room_id;
    user.user_info = user_info.is_object() ? std::move(user_info) : nlohmann::json::object();

    result.members = snapshotLocked(room_it->second);
    return result;
}

bool SessionRegistry::leave(const std::string& room_id, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it != users_.end() && it->second.room == room_id) {
        detachLocked(it->second);
    }
    return rooms_.count(room_id) > 0;
}

std::optional<Departure> SessionRegistry::removeEverywhere(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return detachLocked(it->second);
}

std::optional<User> SessionRegistry::lookup(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Room> SessionRegistry::room(const std::string& room_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Room> SessionRegistry::listRooms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Room> rooms;
    rooms.reserve(rooms_.size());
    for (const auto& [id, room] : rooms_) {
        rooms.push_back(room);
    }
    return rooms;
}

std::vector<User> SessionRegistry::members(const std::string& room_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rooms_.find(room_id);
    if (it == rooms_.end()) {
        return {};
    }
    return snapshotLocked(it->second);
}

std::size_t SessionRegistry::userCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.size();
}

std::size_t SessionRegistry::roomCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rooms_.size();
}

std::optional<Departure> SessionRegistry::detachLocked(User& user) {
    if (!user.room) {
        return std::nullopt;
    }

    Departure departure;
    departure.room_id = *user.room;
    user.room.reset();

    auto room_it = rooms_.find(departure.room_id);
    if (room_it == rooms_.end()) {
        return departure;
    }

    auto& members = room_it->second.members;
    members.erase(std::remove(members.begin(), members.end(), user.id), members.end());
    departure.remaining = members;

    // Room kosong tidak dipertahankan
    if (members.empty()) {
        rooms_.erase(room_it);
        core::Logger::debug("Registry: room {} deleted (empty)", departure.room_id);
    }
    return departure;
}

std::vector<User> SessionRegistry::snapshotLocked(const Room& room) const {
    std::vector<User> snapshot;
    snapshot.reserve(room.members.size());
    for (const auto& id : room.members) {
        auto it = users_.find(id);
        if (it != users_.end()) {
            snapshot.push_back(it->second);
        }
    }
    return snapshot;
}

} // namespace carlink::relay

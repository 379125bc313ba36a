#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <unordered_map>
#include <optional>
#include <mutex>
#include <chrono>

#include <nlohmann/json.hpp>

namespace carlink::relay {

// Peran peer, dibaca dari userInfo.role
enum class Role {
    Controller,
    Car,
    Pi,
    Unknown
};

const char* roleName(Role role);
Role roleFromString(std::string_view name);
Role roleFromUserInfo(const nlohmann::json& user_info);

struct User {
    std::string id;
    nlohmann::json user_info = nlohmann::json::object();
    std::optional<std::string> room;
    std::chrono::system_clock::time_point joined_at;

    Role role() const { return roleFromUserInfo(user_info); }
};

struct Room {
    std::string id;
    std::vector<std::string> members;  // urutan join
    std::chrono::system_clock::time_point created_at;
};

// Room yang baru saja ditinggalkan beserta anggota yang tersisa
struct Departure {
    std::string room_id;
    std::vector<std::string> remaining;
};

struct JoinResult {
    std::vector<User> members;          // snapshot setelah join, termasuk yang join
    std::optional<Departure> departed;  // room lama (bisa room yang sama saat re-join)
};

// Penyimpanan room dan user di memori. Semua mutasi diserialisasi oleh satu mutex.
class SessionRegistry {
public:
    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Registrasi koneksi
    void addUser(User user);
    bool removeUser(const std::string& user_id);

    // Masuk ke room; user yang belum terdaftar menghasilkan nullopt
    std::optional<JoinResult> join(const std::string& room_id,
                                   const std::string& user_id,
                                   nlohmann::json user_info);

    // Keluar dari room; return true jika room masih ada
    bool leave(const std::string& room_id, const std::string& user_id);

    // Keluarkan user dari room manapun yang ditempatinya
    std::optional<Departure> removeEverywhere(const std::string& user_id);

    // Query read-only
    std::optional<User> lookup(const std::string& user_id) const;
    std::optional<Room> room(const std::string& room_id) const;
    std::vector<Room> listRooms() const;
    std::vector<User> members(const std::string& room_id) const;
    std::size_t userCount() const;
    std::size_t roomCount() const;

private:
    // Mutex harus dipegang pemanggil
    std::optional<Departure> detachLocked(User& user);
    std::vector<User> snapshotLocked(const Room& room) const;

    std::unordered_map<std::string, User> users_;
    std::map<std::string, Room> rooms_;
    mutable std::mutex mutex_;
};

} // namespace carlink::relay

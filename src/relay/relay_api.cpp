#include <carlink/relay/relay_api.hpp>
#include <carlink/relay/wire.hpp>
#include <carlink/core/logger.hpp>

#include <sstream>
#include <optional>

#include <nlohmann/json.hpp>

namespace carlink::relay {

using json = nlohmann::json;

namespace {

std::vector<std::string> splitPath(std::string_view path) {
    std::vector<std::string> parts;
    std::stringstream ss{std::string(path)};
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

// Cocokkan pola seperti "/rooms/:id" dengan path aktual
std::optional<std::unordered_map<std::string, std::string>> matchPath(const std::string& pattern,
                                                                      std::string_view path) {
    auto pattern_parts = splitPath(pattern);
    auto path_parts = splitPath(path);
    if (pattern_parts.size() != path_parts.size()) {
        return std::nullopt;
    }

    std::unordered_map<std::string, std::string> params;
    for (size_t i = 0; i < pattern_parts.size(); i++) {
        if (pattern_parts[i][0] == ':') {
            params[pattern_parts[i].substr(1)] = path_parts[i];
        } else if (pattern_parts[i] != path_parts[i]) {
            return std::nullopt;
        }
    }
    return params;
}

HttpResponse jsonResponse(int status_code, const json& body) {
    return {status_code, body.dump(), "application/json"};
}

} // namespace

RelayApi::RelayApi(const SessionRegistry& registry)
    : registry_(registry) {
    registerEndpoint("GET", "/health", [this](const HttpRequest&) {
        return health();
    });
    registerEndpoint("GET", "/rooms", [this](const HttpRequest&) {
        return rooms();
    });
    registerEndpoint("GET", "/rooms/:id", [this](const HttpRequest& req) {
        return room(req.path_params.at("id"));
    });
}

HttpResponse RelayApi::health() const {
    return jsonResponse(200, {
        {"status", "healthy"},
        {"rooms", registry_.roomCount()},
        {"users", registry_.userCount()},
        {"timestamp", toIsoTimestamp(std::chrono::system_clock::now())}
    });
}

HttpResponse RelayApi::rooms() const {
    json list = json::array();
    for (const auto& room : registry_.listRooms()) {
        list.push_back({
            {"roomId", room.id},
            {"userCount", room.members.size()},
            {"createdAt", toIsoTimestamp(room.created_at)}
        });
    }
    return jsonResponse(200, {{"rooms", list}});
}

HttpResponse RelayApi::room(const std::string& room_id) const {
    auto room = registry_.room(room_id);
    if (!room) {
        return jsonResponse(404, {{"error", "Room not found"}});
    }

    json users = json::array();
    for (const auto& member : registry_.members(room_id)) {
        users.push_back({
            {"id", member.id},
            {"joinedAt", toIsoTimestamp(member.joined_at)}
        });
    }

    return jsonResponse(200, {
        {"roomId", room_id},
        {"userCount", users.size()},
        {"users", users}
    });
}

HttpResponse RelayApi::route(std::string_view method, std::string_view path) const {
    auto prefix = std::string(method) + ":";

    for (const auto& [key, handler] : endpoints_) {
        if (key.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        auto params = matchPath(key.substr(prefix.size()), path);
        if (!params) {
            continue;
        }

        HttpRequest request;
        request.method = std::string(method);
        request.path = std::string(path);
        request.path_params = std::move(*params);

        core::Logger::debug("HTTP {} {}", method, path);
        return handler(request);
    }

    return jsonResponse(404, {{"error", "Not found"}});
}

void RelayApi::registerEndpoint(const std::string& method, const std::string& pattern, EndpointHandler handler) {
    endpoints_[method + ":" + pattern] = std::move(handler);
}

std::string httpStatusMessage(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

} // namespace carlink::relay

#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <unordered_map>
#include <vector>

#include <carlink/relay/session_registry.hpp>

namespace carlink::relay {

struct HttpRequest {
    std::string method;
    std::string path;
    std::unordered_map<std::string, std::string> path_params;
};

struct HttpResponse {
    int status_code;
    std::string body;
    std::string content_type;
};

using EndpointHandler = std::function<HttpResponse(const HttpRequest&)>;

// Permukaan HTTP read-only relay: /health, /rooms, /rooms/:id.
// Tidak bergantung pada transport sehingga dapat diuji tanpa socket.
class RelayApi {
public:
    explicit RelayApi(const SessionRegistry& registry);

    HttpResponse health() const;
    HttpResponse rooms() const;
    HttpResponse room(const std::string& room_id) const;

    // Cocokkan method + path ke endpoint terdaftar; 404 jika tidak ada
    HttpResponse route(std::string_view method, std::string_view path) const;

private:
    void registerEndpoint(const std::string& method, const std::string& pattern, EndpointHandler handler);

    const SessionRegistry& registry_;
    std::unordered_map<std::string, EndpointHandler> endpoints_;  // "GET:/rooms/:id"
};

std::string httpStatusMessage(int status_code);

} // namespace carlink::relay

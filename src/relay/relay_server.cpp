#include <carlink/relay/relay_server.hpp>
#include <carlink/relay/relay_api.hpp>
#include <carlink/core/logger.hpp>

#include <atomic>
#include <future>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <uWebSockets/App.h>

namespace carlink::relay {

namespace {

struct PerSocketData {
    std::string connection_id;
};

using WebSocket = uWS::WebSocket<false, true, PerSocketData>;

} // namespace

core::Result<RelayConfig> RelayConfig::fromConfig(const core::Config& config) {
    RelayConfig result;
    auto node = config.section("relay");

    int64_t port = result.port;
    int64_t max_payload = static_cast<int64_t>(result.max_payload_bytes);
    int64_t idle_timeout = result.idle_timeout_seconds;

    for (auto read : {
            node->read("host", result.host),
            node->read("port", port),
            node->read("log_level", result.log_level),
            node->read("max_payload_bytes", max_payload),
            node->read("idle_timeout_seconds", idle_timeout)}) {
        if (read.is_error()) return read.error();
    }

    if (port < 0 || port > 65535) {
        return {core::ErrorCode::InvalidData, "relay.port out of range: " + std::to_string(port)};
    }
    if (max_payload <= 0) {
        return {core::ErrorCode::InvalidData, "relay.max_payload_bytes must be positive"};
    }
    if (idle_timeout < 0 || idle_timeout > 960) {
        return {core::ErrorCode::InvalidData, "relay.idle_timeout_seconds out of range"};
    }
    if (!core::logLevelFromString(result.log_level)) {
        return {core::ErrorCode::InvalidData, "Unknown log level: " + result.log_level};
    }

    result.port = static_cast<int>(port);
    result.max_payload_bytes = static_cast<std::size_t>(max_payload);
    result.idle_timeout_seconds = static_cast<int>(idle_timeout);
    return result;
}

class RelayServerImpl : public RelayServer, private DeliverySink {
public:
    explicit RelayServerImpl(RelayConfig config)
        : config_(std::move(config))
        , relay_(registry_, *this)
        , api_(registry_) {}

    ~RelayServerImpl() override {
        stop();
    }

    core::Result<void> start() override {
        if (running_) {
            core::Logger::warn("Relay server already running");
            return {};
        }

        core::Logger::info("Starting relay server on {}:{}", config_.host, config_.port);

        std::promise<int> listening;
        auto listened = listening.get_future();

        server_thread_ = std::thread([this, promise = std::move(listening)]() mutable {
            run(promise);
        });

        int port = listened.get();
        if (port < 0) {
            if (server_thread_.joinable()) {
                server_thread_.join();
            }
            return {core::ErrorCode::ConnectionFailed,
                core::Logger::format("Failed to listen on {}:{}", config_.host, config_.port)};
        }

        port_ = port;
        running_ = true;
        return {};
    }

    void stop() override {
        if (!running_) {
            return;
        }

        core::Logger::info("Stopping relay server");

        // Tutup listen socket dan semua koneksi dari dalam loop thread
        loop_->defer([this]() {
            closeAll();
        });

        if (server_thread_.joinable()) {
            server_thread_.join();
        }

        running_ = false;
    }

    bool isRunning() const override {
        return running_;
    }

    int port() const override {
        return port_;
    }

    SessionRegistry& registry() override {
        return registry_;
    }

    SignalingRelay::Stats stats() const override {
        return relay_.getStats();
    }

private:
    void run(std::promise<int>& listening) {
        loop_ = uWS::Loop::get();

        uWS::App app;

        app.ws<PerSocketData>("/ws", {
            .compression = uWS::DISABLED,
            .maxPayloadLength = static_cast<unsigned int>(config_.max_payload_bytes),
            .idleTimeout = static_cast<unsigned short>(config_.idle_timeout_seconds),
            .open = [this](auto* ws) {
                auto* data = ws->getUserData();
                data->connection_id = relay_.connect();
                sockets_[data->connection_id] = ws;
            },
            .message = [this](auto* ws, std::string_view message, uWS::OpCode) {
                relay_.handleText(ws->getUserData()->connection_id, message);
            },
            .close = [this](auto* ws, int code, std::string_view) {
                auto id = ws->getUserData()->connection_id;
                core::Logger::debug("WebSocket {} closed with code {}", id, code);
                sockets_.erase(id);
                relay_.disconnect(id);
            }
        });

        app.get("/*", [this](auto* res, auto* req) {
            auto response = api_.route("GET", req->getUrl());
            res->writeStatus(std::to_string(response.status_code) + " " +
                             httpStatusMessage(response.status_code));
            res->writeHeader("Content-Type", response.content_type);
            res->end(response.body);
        });

        app.listen(config_.host, config_.port, [this, &listening](us_listen_socket_t* socket) {
            listen_socket_ = socket;
            if (socket) {
                int port = us_socket_local_port(0, reinterpret_cast<us_socket_t*>(socket));
                core::Logger::info("Relay server listening on {}:{}", config_.host, port);
                listening.set_value(port);
            } else {
                core::Logger::error("Failed to start relay server on {}:{}", config_.host, config_.port);
                listening.set_value(-1);
            }
        });

        app.run();

        core::Logger::info("Relay server stopped");
    }

    void closeAll() {
        if (listen_socket_) {
            us_listen_socket_close(0, listen_socket_);
            listen_socket_ = nullptr;
        }

        // close() memanggil handler close yang menghapus entri dari sockets_
        std::vector<WebSocket*> open;
        open.reserve(sockets_.size());
        for (const auto& [id, ws] : sockets_) {
            open.push_back(ws);
        }
        for (auto* ws : open) {
            ws->close();
        }
    }

    // Dipanggil relay di loop thread
    void deliver(const std::string& connection_id, const WireMessage& message) override {
        auto it = sockets_.find(connection_id);
        if (it == sockets_.end()) {
            core::Logger::debug("Dropping {} for closed connection {}", message.event, connection_id);
            return;
        }
        it->second->send(message.toJson(), uWS::OpCode::TEXT);
    }

    RelayConfig config_;
    SessionRegistry registry_;
    SignalingRelay relay_;
    RelayApi api_;

    uWS::Loop* loop_ = nullptr;
    us_listen_socket_t* listen_socket_ = nullptr;
    std::unordered_map<std::string, WebSocket*> sockets_;

    std::atomic<bool> running_{false};
    std::atomic<int> port_{0};
    std::thread server_thread_;
};

std::unique_ptr<RelayServer> RelayServer::create(RelayConfig config) {
    return std::make_unique<RelayServerImpl>(std::move(config));
}

} // namespace carlink::relay

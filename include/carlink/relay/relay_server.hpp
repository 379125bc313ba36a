#pragma once

#include <string>
#include <memory>
#include <cstdint>

#include <carlink/core/config.hpp>
#include <carlink/core/error.hpp>
#include <carlink/relay/session_registry.hpp>
#include <carlink/relay/signaling_relay.hpp>

namespace carlink::relay {

struct RelayConfig {
    std::string host = "0.0.0.0";
    int port = 3000;
    std::string log_level = "info";
    std::size_t max_payload_bytes = 64 * 1024;
    int idle_timeout_seconds = 120;

    // Baca dari object "relay"; key yang tidak ada memakai default
    static core::Result<RelayConfig> fromConfig(const core::Config& config);
};

// Front jaringan relay: endpoint WebSocket (/ws) untuk event relay dan
// permukaan HTTP read-only, dilayani satu uWS::App di thread sendiri.
class RelayServer {
public:
    virtual ~RelayServer() = default;

    // Mulai listen; kembali setelah socket terbuka atau gagal
    virtual core::Result<void> start() = 0;

    virtual void stop() = 0;

    virtual bool isRunning() const = 0;

    // Port yang benar-benar dipakai (berguna saat config port = 0)
    virtual int port() const = 0;

    virtual SessionRegistry& registry() = 0;

    virtual SignalingRelay::Stats stats() const = 0;

    static std::unique_ptr<RelayServer> create(RelayConfig config);
};

} // namespace carlink::relay

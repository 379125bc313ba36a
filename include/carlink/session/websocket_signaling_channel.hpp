#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <carlink/core/error.hpp>
#include <carlink/session/signaling_channel.hpp>

namespace carlink::session {

// Jeda sambung ulang ke relay: base_delay * 2^(n-1), maksimal cap_delay.
// Jumlah percobaan tidak dibatasi.
struct RelayRetryPolicy {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds cap_delay{30000};

    std::chrono::milliseconds delayFor(int attempt) const;
};

// Koneksi relay lewat jaringan (WebSocket client, Boost.Beast).
// Satu thread I/O per channel; event handler dan link handler dipanggil dari
// thread tersebut. Setelah koneksi pertama berhasil, koneksi yang putus
// disambung ulang otomatis sampai close().
class WebSocketSignalingChannel : public SignalingChannel {
public:
    WebSocketSignalingChannel(std::string host, std::string port, std::string path = "/ws",
                              RelayRetryPolicy retry = {});
    ~WebSocketSignalingChannel() override;

    WebSocketSignalingChannel(const WebSocketSignalingChannel&) = delete;
    WebSocketSignalingChannel& operator=(const WebSocketSignalingChannel&) = delete;

    // Resolve, connect, handshake; blocking sampai koneksi pertama berhasil atau gagal
    core::Result<void> connect();

    void emit(const relay::WireMessage& message) override;
    void setEventHandler(EventHandler handler) override;
    void setLinkHandler(LinkHandler handler) override;
    bool isConnected() const override;
    void close() override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace carlink::session

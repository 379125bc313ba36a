#pragma once

#include <cstddef>
#include <memory>

#include <carlink/session/transport.hpp>

namespace carlink::session {

// Transport in-process: dua PeerTransport dipasangkan lewat description yang
// dipertukarkan. Connected dilaporkan setelah kedua sisi memegang local dan
// remote description; pesan data channel dikirim langsung ke pasangannya.
//
// Callback dipanggil sambil memegang lock provider, jadi handler hanya boleh
// meneruskan event ke scheduler.
class LoopbackTransportProvider : public TransportProvider {
public:
    LoopbackTransportProvider();
    ~LoopbackTransportProvider() override;

    LoopbackTransportProvider(const LoopbackTransportProvider&) = delete;
    LoopbackTransportProvider& operator=(const LoopbackTransportProvider&) = delete;

    std::unique_ptr<PeerTransport> create() override;

    // Simulasi putusnya jaringan: setiap link Connected melaporkan Disconnected
    void dropLinks();

    std::size_t activeTransports() const;
    std::size_t createdTransports() const;

    class Network;

private:
    std::shared_ptr<Network> network_;
};

} // namespace carlink::session

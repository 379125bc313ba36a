#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <carlink/relay/session_registry.hpp>
#include <carlink/relay/signaling_relay.hpp>
#include <carlink/relay/wire.hpp>

namespace carlink::session {

// Sisi client dari satu koneksi relay.
// Event handler dan link handler dapat dipanggil dari thread manapun dan hanya
// boleh meneruskan ke scheduler, bukan memanggil emit secara langsung.
class SignalingChannel {
public:
    using EventHandler = std::function<void(const relay::WireMessage&)>;

    // true saat koneksi relay (kembali) tersambung, false saat putus.
    // Setelah tersambung ulang relay memberi connection id baru.
    using LinkHandler = std::function<void(bool connected)>;

    virtual ~SignalingChannel() = default;

    virtual void emit(const relay::WireMessage& message) = 0;
    virtual void setEventHandler(EventHandler handler) = 0;
    virtual void setLinkHandler(LinkHandler handler) = 0;
    virtual bool isConnected() const = 0;
    virtual void close() = 0;
};

class LocalSignalingChannel;

// Relay in-process: SessionRegistry + SignalingRelay tanpa jaringan.
// Harus hidup lebih lama dari semua channel yang dibuatnya.
class LocalRelayHub : private relay::DeliverySink {
public:
    LocalRelayHub();
    ~LocalRelayHub() override;

    LocalRelayHub(const LocalRelayHub&) = delete;
    LocalRelayHub& operator=(const LocalRelayHub&) = delete;

    std::unique_ptr<LocalSignalingChannel> connect();

    relay::SessionRegistry& registry() { return registry_; }
    relay::SignalingRelay& relay() { return relay_; }

private:
    friend class LocalSignalingChannel;

    void deliver(const std::string& connection_id, const relay::WireMessage& message) override;
    void attach(const std::string& connection_id, LocalSignalingChannel* channel);
    void detach(const std::string& connection_id);

    relay::SessionRegistry registry_;
    relay::SignalingRelay relay_;

    std::mutex mutex_;
    std::unordered_map<std::string, LocalSignalingChannel*> channels_;
};

class LocalSignalingChannel : public SignalingChannel {
public:
    LocalSignalingChannel(LocalRelayHub& hub, std::string connection_id);
    ~LocalSignalingChannel() override;

    void emit(const relay::WireMessage& message) override;
    void setEventHandler(EventHandler handler) override;
    void setLinkHandler(LinkHandler handler) override;
    bool isConnected() const override;
    void close() override;

    // Putuskan koneksi ke relay tanpa menutup channel; relay melihat disconnect
    void dropLink();

    // Sambung ulang dengan connection id baru
    void restoreLink();

    std::string connectionId() const;

private:
    friend class LocalRelayHub;

    void receive(const relay::WireMessage& message);
    void notifyLink(bool connected);

    LocalRelayHub& hub_;

    mutable std::mutex mutex_;
    std::string connection_id_;
    EventHandler handler_;
    LinkHandler link_handler_;
    bool connected_ = true;
    bool closed_ = false;
};

} // namespace carlink::session

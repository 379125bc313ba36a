#include <carlink/session/signaling_channel.hpp>
#include <carlink/core/logger.hpp>

namespace carlink::session {

LocalRelayHub::LocalRelayHub()
    : relay_(registry_, *this) {}

LocalRelayHub::~LocalRelayHub() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!channels_.empty()) {
        core::Logger::warn("LocalRelayHub destroyed with {} open channels", channels_.size());
    }
}

std::unique_ptr<LocalSignalingChannel> LocalRelayHub::connect() {
    auto id = relay::generateConnectionId();
    auto channel = std::make_unique<LocalSignalingChannel>(*this, id);
    attach(id, channel.get());
    return channel;
}

void LocalRelayHub::attach(const std::string& connection_id, LocalSignalingChannel* channel) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels_[connection_id] = channel;
    }
    relay_.connect(connection_id);
}

void LocalRelayHub::deliver(const std::string& connection_id, const relay::WireMessage& message) {
    // Lock dipegang selama receive supaya channel tidak dihancurkan di tengah pengiriman;
    // handler channel tidak boleh memanggil emit secara sinkron
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(connection_id);
    if (it == channels_.end()) {
        core::Logger::debug("LocalRelayHub: dropping {} for closed connection {}", message.event, connection_id);
        return;
    }
    it->second->receive(message);
}

void LocalRelayHub::detach(const std::string& connection_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels_.erase(connection_id);
    }
    relay_.disconnect(connection_id);
}

LocalSignalingChannel::LocalSignalingChannel(LocalRelayHub& hub, std::string connection_id)
    : hub_(hub)
    , connection_id_(std::move(connection_id)) {}

LocalSignalingChannel::~LocalSignalingChannel() {
    close();
}

void LocalSignalingChannel::emit(const relay::WireMessage& message) {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            core::Logger::warn("LocalSignalingChannel {}: emit {} while disconnected", connection_id_, message.event);
            return;
        }
        id = connection_id_;
    }
    hub_.relay().handle(id, message);
}

void LocalSignalingChannel::setEventHandler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void LocalSignalingChannel::setLinkHandler(LinkHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    link_handler_ = std::move(handler);
}

bool LocalSignalingChannel::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

std::string LocalSignalingChannel::connectionId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_id_;
}

void LocalSignalingChannel::close() {
    std::string id;
    bool was_connected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        was_connected = connected_;
        connected_ = false;
        handler_ = nullptr;
        link_handler_ = nullptr;
        id = connection_id_;
    }
    if (was_connected) {
        hub_.detach(id);
    }
}

void LocalSignalingChannel::dropLink() {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !connected_) return;
        connected_ = false;
        id = connection_id_;
    }
    core::Logger::info("LocalSignalingChannel {}: link dropped", id);
    hub_.detach(id);
    notifyLink(false);
}

void LocalSignalingChannel::restoreLink() {
    std::string id = relay::generateConnectionId();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || connected_) return;
        connected_ = true;
        connection_id_ = id;
    }
    core::Logger::info("LocalSignalingChannel: link restored as {}", id);
    hub_.attach(id, this);
    notifyLink(true);
}

void LocalSignalingChannel::receive(const relay::WireMessage& message) {
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }
    if (handler) {
        handler(message);
    }
}

void LocalSignalingChannel::notifyLink(bool connected) {
    LinkHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = link_handler_;
    }
    if (handler) {
        handler(connected);
    }
}

} // namespace carlink::session

#include <carlink/session/loopback_transport.hpp>
#include <carlink/core/logger.hpp>

#include <algorithm>
#include <mutex>
#include <sstream>
#include <unordered_map>

namespace carlink::session {

using core::Logger;

namespace {

constexpr const char* kOriginPrefix = "o=carlink-loopback ";
constexpr const char* kTrackPrefix = "a=track:";
constexpr const char* kChannelPrefix = "a=channel:";

struct ParsedSdp {
    uint64_t origin = 0;
    std::vector<TrackKind> tracks;
    std::vector<std::string> channels;
};

std::optional<ParsedSdp> parseSdp(const std::string& sdp) {
    ParsedSdp parsed;
    bool has_origin = false;

    std::istringstream lines(sdp);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.rfind(kOriginPrefix, 0) == 0) {
            try {
                parsed.origin = std::stoull(line.substr(std::char_traits<char>::length(kOriginPrefix)));
                has_origin = true;
            }
            catch (const std::exception&) {
                return std::nullopt;
            }
        } else if (line.rfind(kTrackPrefix, 0) == 0) {
            auto kind = line.substr(std::char_traits<char>::length(kTrackPrefix));
            if (kind == "audio") parsed.tracks.push_back(TrackKind::Audio);
            if (kind == "video") parsed.tracks.push_back(TrackKind::Video);
        } else if (line.rfind(kChannelPrefix, 0) == 0) {
            parsed.channels.push_back(line.substr(std::char_traits<char>::length(kChannelPrefix)));
        }
    }

    if (!has_origin) return std::nullopt;
    return parsed;
}

} // namespace

class LoopbackTransport;

class LoopbackTransportProvider::Network {
public:
    std::mutex mutex;
    std::unordered_map<uint64_t, LoopbackTransport*> transports;
    uint64_t next_id = 1;
    std::size_t created = 0;

    LoopbackTransport* find(uint64_t id) {
        auto it = transports.find(id);
        return it != transports.end() ? it->second : nullptr;
    }
};

using Network = LoopbackTransportProvider::Network;

class LoopbackDataChannel : public DataChannel {
public:
    LoopbackDataChannel(std::shared_ptr<Network> network, std::string label)
        : network_(std::move(network))
        , label_(std::move(label)) {}

    std::string label() const override {
        return label_;
    }

    bool isOpen() const override {
        std::lock_guard<std::mutex> lock(network_->mutex);
        return open_;
    }

    core::Result<void> send(const uint8_t* data, std::size_t size) override {
        std::lock_guard<std::mutex> lock(network_->mutex);
        auto peer = peer_.lock();
        if (!open_ || !peer || !peer->open_) {
            return {core::ErrorCode::ConnectionClosed, "Data channel " + label_ + " is not open"};
        }

        std::vector<uint8_t> bytes(data, data + size);
        if (peer->onMessage) {
            peer->onMessage(bytes);
        }
        return {};
    }

    void close() override {
        std::lock_guard<std::mutex> lock(network_->mutex);
        closeLocked(true);
    }

    // Helper berikut dipanggil dengan network mutex dipegang
    void pairLocked(const std::shared_ptr<LoopbackDataChannel>& self, const std::shared_ptr<LoopbackDataChannel>& other) {
        peer_ = other;
        other->peer_ = self;
    }

    bool pairedLocked() const {
        return !peer_.expired();
    }

    void openLocked() {
        if (open_ || closed_) return;
        open_ = true;
        if (onOpen) onOpen();
    }

    void closeLocked(bool notify_peer) {
        if (closed_) return;
        closed_ = true;

        bool was_open = open_;
        open_ = false;
        if (was_open && onClose) onClose();

        if (notify_peer) {
            if (auto peer = peer_.lock()) {
                peer->closeLocked(false);
            }
        }
    }

private:
    std::shared_ptr<Network> network_;
    std::string label_;
    std::weak_ptr<LoopbackDataChannel> peer_;
    bool open_ = false;
    bool closed_ = false;
};

class LoopbackTransport : public PeerTransport {
public:
    LoopbackTransport(std::shared_ptr<Network> network, uint64_t id)
        : network_(std::move(network))
        , id_(id) {}

    ~LoopbackTransport() override {
        close();
    }

    core::Result<void> addLocalMedia(LocalMediaSource& media) override {
        std::lock_guard<std::mutex> lock(network_->mutex);
        if (closed_) {
            return {core::ErrorCode::InvalidState, "Transport is closed"};
        }

        for (auto kind : {TrackKind::Audio, TrackKind::Video}) {
            if (media.hasTrack(kind) && std::find(local_tracks_.begin(), local_tracks_.end(), kind) == local_tracks_.end()) {
                local_tracks_.push_back(kind);
            }
        }
        return {};
    }

    core::Result<std::shared_ptr<DataChannel>> openDataChannel(const std::string& label,
                                                               const DataChannelInit&) override {
        std::lock_guard<std::mutex> lock(network_->mutex);
        if (closed_) {
            return {core::ErrorCode::InvalidState, "Transport is closed"};
        }
        if (has_local_) {
            return {core::ErrorCode::NotSupported, "Data channels must be opened before negotiation"};
        }

        auto channel = std::make_shared<LoopbackDataChannel>(network_, label);
        channels_.push_back(channel);
        return std::shared_ptr<DataChannel>(channel);
    }

    core::Result<SessionDescription> createOffer() override {
        std::lock_guard<std::mutex> lock(network_->mutex);
        if (closed_) {
            return {core::ErrorCode::InvalidState, "Transport is closed"};
        }
        if (has_local_ || has_remote_) {
            return {core::ErrorCode::InvalidState, "Offer already negotiated"};
        }

        SessionDescription offer;
        offer.type = SdpType::Offer;
        offer.sdp = buildSdp(true);
        has_local_ = true;

        emitCandidateLocked();
        maybeConnectLocked();
        return offer;
    }

    core::Result<SessionDescription> createAnswer() override {
        std::lock_guard<std::mutex> lock(network_->mutex);
        if (closed_) {
            return {core::ErrorCode::InvalidState, "Transport is closed"};
        }
        if (!has_remote_ || remote_type_ != SdpType::Offer || has_local_) {
            return {core::ErrorCode::InvalidState, "No remote offer to answer"};
        }

        SessionDescription answer;
        answer.type = SdpType::Answer;
        answer.sdp = buildSdp(false);
        has_local_ = true;

        emitCandidateLocked();
        maybeConnectLocked();
        return answer;
    }

    core::Result<void> setRemoteDescription(const SessionDescription& description) override {
        std::lock_guard<std::mutex> lock(network_->mutex);
        if (closed_) {
            return {core::ErrorCode::InvalidState, "Transport is closed"};
        }
        if (has_remote_) {
            return {core::ErrorCode::InvalidState, "Remote description already set"};
        }
        if (description.type == SdpType::Offer && has_local_) {
            return {core::ErrorCode::NegotiationFailed, "Unexpected offer after local offer"};
        }
        if (description.type == SdpType::Answer && !has_local_) {
            return {core::ErrorCode::NegotiationFailed, "Answer without local offer"};
        }

        auto parsed = parseSdp(description.sdp);
        if (!parsed) {
            return {core::ErrorCode::NegotiationFailed, "Not a loopback session description"};
        }

        auto* peer = network_->find(parsed->origin);
        if (!peer || peer == this) {
            return {core::ErrorCode::NegotiationFailed, "Remote transport is gone"};
        }

        peer_id_ = parsed->origin;
        has_remote_ = true;
        remote_type_ = description.type;

        if (description.type == SdpType::Offer) {
            for (const auto& label : parsed->channels) {
                auto remote = peer->unpairedChannelLocked(label);
                if (!remote) continue;

                auto channel = std::make_shared<LoopbackDataChannel>(network_, label);
                channel->pairLocked(channel, remote);
                channels_.push_back(channel);
                if (onDataChannel) onDataChannel(channel);
            }
        }

        for (auto kind : parsed->tracks) {
            if (onRemoteTrack) onRemoteTrack(kind);
        }

        maybeConnectLocked();
        return {};
    }

    core::Result<void> addRemoteCandidate(const IceCandidate& candidate) override {
        std::lock_guard<std::mutex> lock(network_->mutex);
        if (closed_) {
            return {core::ErrorCode::InvalidState, "Transport is closed"};
        }
        if (!has_remote_) {
            return {core::ErrorCode::InvalidState, "Candidate before remote description"};
        }
        if (candidate.candidate.empty()) {
            return {core::ErrorCode::InvalidArgument, "Empty ICE candidate"};
        }
        ++remote_candidates_;
        return {};
    }

    void close() override {
        std::lock_guard<std::mutex> lock(network_->mutex);
        if (closed_) return;

        for (auto& channel : channels_) {
            channel->closeLocked(true);
        }
        channels_.clear();

        // Pasangan melihat link putus
        if (auto* peer = network_->find(peer_id_); peer && peer->peer_id_ == id_) {
            peer->dropLocked();
        }

        closed_ = true;
        health_ = TransportHealth::Closed;
        network_->transports.erase(id_);
    }

    // Helper berikut dipanggil dengan network mutex dipegang
    void dropLocked() {
        if (closed_) return;
        for (auto& channel : channels_) {
            channel->closeLocked(false);
        }
        if (health_ == TransportHealth::Checking || health_ == TransportHealth::Connected) {
            setHealthLocked(TransportHealth::Disconnected);
        }
    }

    bool connectedLocked() const {
        return !closed_ && health_ == TransportHealth::Connected;
    }

private:
    std::string buildSdp(bool with_channels) const {
        std::ostringstream sdp;
        sdp << "v=0\n";
        sdp << kOriginPrefix << id_ << "\n";
        for (auto kind : local_tracks_) {
            sdp << kTrackPrefix << trackKindName(kind) << "\n";
        }
        if (with_channels) {
            for (const auto& channel : channels_) {
                sdp << kChannelPrefix << channel->label() << "\n";
            }
        }
        return sdp.str();
    }

    std::shared_ptr<LoopbackDataChannel> unpairedChannelLocked(const std::string& label) {
        for (auto& channel : channels_) {
            if (channel->label() == label && !channel->pairedLocked()) {
                return channel;
            }
        }
        return nullptr;
    }

    void emitCandidateLocked() {
        if (!onLocalCandidate) return;

        IceCandidate candidate;
        candidate.candidate = "candidate:1 1 UDP 2122252543 127.0.0.1 " + std::to_string(40000 + id_ % 20000) + " typ host";
        candidate.sdp_mid = "0";
        candidate.sdp_mline_index = 0;
        onLocalCandidate(candidate);
    }

    void setHealthLocked(TransportHealth health) {
        if (closed_ || health_ == health) return;
        health_ = health;
        if (onHealthChange) onHealthChange(health);
    }

    void maybeConnectLocked() {
        if (!has_local_ || !has_remote_) return;
        setHealthLocked(TransportHealth::Checking);

        auto* peer = network_->find(peer_id_);
        if (!peer || peer->peer_id_ != id_ || !peer->has_local_ || !peer->has_remote_) return;

        setHealthLocked(TransportHealth::Connected);
        peer->setHealthLocked(TransportHealth::Connected);

        for (auto& channel : channels_) channel->openLocked();
        for (auto& channel : peer->channels_) channel->openLocked();
    }

    std::shared_ptr<Network> network_;
    uint64_t id_;
    uint64_t peer_id_ = 0;

    bool closed_ = false;
    bool has_local_ = false;
    bool has_remote_ = false;
    SdpType remote_type_ = SdpType::Offer;
    TransportHealth health_ = TransportHealth::New;

    std::vector<TrackKind> local_tracks_;
    std::vector<std::shared_ptr<LoopbackDataChannel>> channels_;
    std::size_t remote_candidates_ = 0;
};

LoopbackTransportProvider::LoopbackTransportProvider()
    : network_(std::make_shared<Network>()) {}

LoopbackTransportProvider::~LoopbackTransportProvider() {
    std::lock_guard<std::mutex> lock(network_->mutex);
    if (!network_->transports.empty()) {
        Logger::debug("LoopbackTransportProvider destroyed with {} open transports", network_->transports.size());
    }
}

std::unique_ptr<PeerTransport> LoopbackTransportProvider::create() {
    std::lock_guard<std::mutex> lock(network_->mutex);
    auto id = network_->next_id++;
    auto transport = std::make_unique<LoopbackTransport>(network_, id);
    network_->transports[id] = transport.get();
    ++network_->created;
    return transport;
}

void LoopbackTransportProvider::dropLinks() {
    std::lock_guard<std::mutex> lock(network_->mutex);
    std::size_t dropped = 0;
    for (auto& [id, transport] : network_->transports) {
        if (transport->connectedLocked()) {
            transport->dropLocked();
            ++dropped;
        }
    }
    Logger::info("Loopback: dropped {} links", dropped);
}

std::size_t LoopbackTransportProvider::activeTransports() const {
    std::lock_guard<std::mutex> lock(network_->mutex);
    return network_->transports.size();
}

std::size_t LoopbackTransportProvider::createdTransports() const {
    std::lock_guard<std::mutex> lock(network_->mutex);
    return network_->created;
}

} // namespace carlink::session

#pragma once

#include <carlink/relay/wire.hpp>
#include <carlink/session/signaling_channel.hpp>
#include <carlink/session/transport.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace carlink::test {

// Records emitted events and lets a test inject relay events
class FakeSignalingChannel : public session::SignalingChannel {
public:
    void emit(const relay::WireMessage& message) override {
        if (!connected) {
            dropped.push_back(message);
            return;
        }
        sent.push_back(message);
    }

    void setEventHandler(EventHandler handler) override {
        handler_ = std::move(handler);
    }

    void setLinkHandler(LinkHandler handler) override {
        link_handler_ = std::move(handler);
    }

    bool isConnected() const override {
        return connected;
    }

    // Relay connection lost / re-established
    void dropLink() {
        connected = false;
        if (link_handler_) link_handler_(false);
    }

    void restoreLink() {
        connected = true;
        if (link_handler_) link_handler_(true);
    }

    bool hasLinkHandler() const {
        return static_cast<bool>(link_handler_);
    }

    void close() override {}

    void deliver(const std::string& event, nlohmann::json data) {
        if (handler_) {
            handler_(relay::WireMessage(event, std::move(data)));
        }
    }

    bool hasHandler() const {
        return static_cast<bool>(handler_);
    }

    std::vector<relay::WireMessage> sentWith(const std::string& event) const {
        std::vector<relay::WireMessage> result;
        for (const auto& message : sent) {
            if (message.event == event) result.push_back(message);
        }
        return result;
    }

    std::vector<relay::WireMessage> sent;
    std::vector<relay::WireMessage> dropped;
    bool connected = true;

private:
    EventHandler handler_;
    LinkHandler link_handler_;
};

class FakeDataChannel : public session::DataChannel {
public:
    explicit FakeDataChannel(std::string label) : label_(std::move(label)) {}

    std::string label() const override { return label_; }
    bool isOpen() const override { return open; }

    core::Result<void> send(const uint8_t* data, std::size_t size) override {
        if (!open) {
            return {core::ErrorCode::ConnectionClosed, "Data channel is not open"};
        }
        sent.emplace_back(data, data + size);
        return {};
    }

    void close() override {
        open = false;
        closed = true;
    }

    void openNow() {
        open = true;
        if (onOpen) onOpen();
    }

    void receive(const std::vector<uint8_t>& bytes) {
        if (onMessage) onMessage(bytes);
    }

    bool open = false;
    bool closed = false;
    std::vector<std::vector<uint8_t>> sent;

private:
    std::string label_;
};

class FakeTransport;

// Outlives the transport so tests can inspect a transport the manager dropped
struct FakeTransportState {
    FakeTransport* transport = nullptr;
    bool closed = false;
    bool media_added = false;
    bool fail_offer = false;
    int offers = 0;
    int answers = 0;
    std::optional<session::SessionDescription> remote_description;
    std::vector<session::IceCandidate> remote_candidates;
    std::vector<std::shared_ptr<FakeDataChannel>> channels;
    std::optional<session::DataChannelInit> channel_init;

    void signal(session::TransportHealth health);
    void announceCandidate(const session::IceCandidate& candidate);
    void announceChannel(std::shared_ptr<FakeDataChannel> channel);
    void announceTrack(session::TrackKind kind);
};

class FakeTransport : public session::PeerTransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeTransportState> state)
        : state_(std::move(state)) {
        state_->transport = this;
    }

    ~FakeTransport() override {
        state_->transport = nullptr;
    }

    core::Result<void> addLocalMedia(session::LocalMediaSource&) override {
        state_->media_added = true;
        return {};
    }

    core::Result<std::shared_ptr<session::DataChannel>> openDataChannel(
            const std::string& label, const session::DataChannelInit& init) override {
        auto channel = std::make_shared<FakeDataChannel>(label);
        state_->channels.push_back(channel);
        state_->channel_init = init;
        return std::shared_ptr<session::DataChannel>(channel);
    }

    core::Result<session::SessionDescription> createOffer() override {
        if (state_->fail_offer) {
            return {core::ErrorCode::NegotiationFailed, "offer rejected"};
        }
        ++state_->offers;
        session::SessionDescription offer;
        offer.type = session::SdpType::Offer;
        offer.sdp = "v=0 fake-offer " + std::to_string(state_->offers);
        return offer;
    }

    core::Result<session::SessionDescription> createAnswer() override {
        if (!state_->remote_description) {
            return {core::ErrorCode::InvalidState, "no remote offer"};
        }
        ++state_->answers;
        session::SessionDescription answer;
        answer.type = session::SdpType::Answer;
        answer.sdp = "v=0 fake-answer";
        return answer;
    }

    core::Result<void> setRemoteDescription(const session::SessionDescription& description) override {
        state_->remote_description = description;
        return {};
    }

    core::Result<void> addRemoteCandidate(const session::IceCandidate& candidate) override {
        state_->remote_candidates.push_back(candidate);
        return {};
    }

    void close() override {
        state_->closed = true;
    }

private:
    std::shared_ptr<FakeTransportState> state_;
};

inline void FakeTransportState::signal(session::TransportHealth health) {
    if (transport && !closed && transport->onHealthChange) transport->onHealthChange(health);
}

inline void FakeTransportState::announceCandidate(const session::IceCandidate& candidate) {
    if (transport && !closed && transport->onLocalCandidate) transport->onLocalCandidate(candidate);
}

inline void FakeTransportState::announceChannel(std::shared_ptr<FakeDataChannel> channel) {
    if (transport && !closed && transport->onDataChannel) transport->onDataChannel(std::move(channel));
}

inline void FakeTransportState::announceTrack(session::TrackKind kind) {
    if (transport && !closed && transport->onRemoteTrack) transport->onRemoteTrack(kind);
}

class FakeTransportProvider : public session::TransportProvider {
public:
    std::unique_ptr<session::PeerTransport> create() override {
        auto state = std::make_shared<FakeTransportState>();
        state->fail_offer = fail_offers;
        created.push_back(state);
        return std::make_unique<FakeTransport>(state);
    }

    std::shared_ptr<FakeTransportState> last() const {
        return created.empty() ? nullptr : created.back();
    }

    bool fail_offers = false;
    std::vector<std::shared_ptr<FakeTransportState>> created;
};

class FakeMediaSource : public session::LocalMediaSource {
public:
    bool hasTrack(session::TrackKind kind) const override {
        return kind == session::TrackKind::Video ? has_video : has_audio;
    }

    bool trackEnabled(session::TrackKind kind) const override {
        return kind == session::TrackKind::Video ? video_enabled : audio_enabled;
    }

    void setTrackEnabled(session::TrackKind kind, bool enabled) override {
        (kind == session::TrackKind::Video ? video_enabled : audio_enabled) = enabled;
    }

    bool has_video = true;
    bool has_audio = true;
    bool video_enabled = true;
    bool audio_enabled = true;
};

class FakeInputSource : public session::InputSource {
public:
    std::optional<session::InputState> read() override {
        ++reads;
        return state;
    }

    std::optional<session::InputState> state;
    int reads = 0;
};

} // namespace carlink::test

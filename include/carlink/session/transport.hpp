#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <carlink/core/error.hpp>

namespace carlink::session {

// Sinyal kesehatan transport (mengikuti ICE connection state)
enum class TransportHealth {
    New,
    Checking,
    Connected,
    Completed,
    Disconnected,
    Failed,
    Closed
};

const char* transportHealthName(TransportHealth health);

enum class SdpType {
    Offer,
    Answer
};

// Session description: {"type": "offer"|"answer", "sdp": "..."}
struct SessionDescription {
    SdpType type = SdpType::Offer;
    std::string sdp;

    nlohmann::json toJson() const;
    static core::Result<SessionDescription> fromJson(const nlohmann::json& json);
};

// ICE candidate: {"candidate": "...", "sdpMid": "...", "sdpMLineIndex": n}
struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    int sdp_mline_index = 0;

    nlohmann::json toJson() const;
    static core::Result<IceCandidate> fromJson(const nlohmann::json& json);
};

struct DataChannelInit {
    bool ordered = true;
    std::optional<int> max_retransmits;
};

// Data channel biner milik transport
class DataChannel {
public:
    virtual ~DataChannel() = default;

    virtual std::string label() const = 0;
    virtual bool isOpen() const = 0;
    virtual core::Result<void> send(const uint8_t* data, std::size_t size) = 0;
    virtual void close() = 0;

    // Events
    std::function<void()> onOpen;
    std::function<void()> onClose;
    std::function<void(const std::vector<uint8_t>&)> onMessage;
};

enum class TrackKind {
    Audio,
    Video
};

const char* trackKindName(TrackKind kind);

// Sumber media lokal (kamera/mikrofon)
class LocalMediaSource {
public:
    virtual ~LocalMediaSource() = default;

    virtual bool hasTrack(TrackKind kind) const = 0;
    virtual bool trackEnabled(TrackKind kind) const = 0;
    virtual void setTrackEnabled(TrackKind kind, bool enabled) = 0;
};

struct InputState {
    double throttle = 0.0;
    double steering = 0.0;
    std::vector<bool> buttons;
};

// Perangkat input (gamepad); nullopt berarti tidak ada perangkat
class InputSource {
public:
    virtual ~InputSource() = default;
    virtual std::optional<InputState> read() = 0;
};

// Satu koneksi peer. Setelah close() tidak ada callback lagi.
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    virtual core::Result<void> addLocalMedia(LocalMediaSource& media) = 0;
    virtual core::Result<std::shared_ptr<DataChannel>> openDataChannel(const std::string& label,
                                                                       const DataChannelInit& init) = 0;

    // Buat description lokal dan pasang sebagai local description
    virtual core::Result<SessionDescription> createOffer() = 0;
    virtual core::Result<SessionDescription> createAnswer() = 0;

    virtual core::Result<void> setRemoteDescription(const SessionDescription& description) = 0;
    virtual core::Result<void> addRemoteCandidate(const IceCandidate& candidate) = 0;

    virtual void close() = 0;

    // Events
    std::function<void(TransportHealth)> onHealthChange;
    std::function<void(const IceCandidate&)> onLocalCandidate;
    std::function<void(std::shared_ptr<DataChannel>)> onDataChannel;
    std::function<void(TrackKind)> onRemoteTrack;
};

class TransportProvider {
public:
    virtual ~TransportProvider() = default;
    virtual std::unique_ptr<PeerTransport> create() = 0;
};

} // namespace carlink::session

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <carlink/core/error.hpp>
#include <carlink/core/event.hpp>
#include <carlink/relay/session_registry.hpp>
#include <carlink/relay/wire.hpp>
#include <carlink/session/call.hpp>
#include <carlink/session/signaling_channel.hpp>
#include <carlink/session/transport.hpp>

namespace carlink::session {

struct PeerSessionOptions {
    std::string room;
    relay::Role local_role = relay::Role::Controller;
    relay::Role target_role = relay::Role::Car;
    nlohmann::json user_info = nlohmann::json::object();  // "role" diisi dari local_role
    ReconnectPolicy reconnect;
};

// State machine per Call di atas satu koneksi relay dan satu room.
//
// Semua pekerjaan (event relay, sinyal transport, timer, dan API publik)
// dijalankan di Scheduler satu per satu. Query (call(), calls(), members())
// hanya boleh dipanggil dari thread scheduler.
//
// Hanya sisi Controller yang mengirim offer; sisi lain menunggu offer,
// termasuk saat reconnect.
//
// Saat koneksi relay putus manager keluar dari room (joined() false, members
// kosong) tanpa menutup Call; saat tersambung lagi join-room dikirim ulang.
//
// Manager harus dihancurkan dari thread scheduler atau setelah scheduler berhenti.
class PeerSessionManager {
public:
    PeerSessionManager(core::Scheduler& scheduler,
                       SignalingChannel& signaling,
                       TransportProvider& transports,
                       PeerSessionOptions options);
    virtual ~PeerSessionManager();

    PeerSessionManager(const PeerSessionManager&) = delete;
    PeerSessionManager& operator=(const PeerSessionManager&) = delete;

    // Pasang handler relay lalu join room
    void start();

    // Leave room, tutup semua Call, lepas dari signaling channel
    void stop();

    // Mulai Call ke peer remote (Idle -> Negotiating)
    void initiate(const std::string& remote_id);

    // Tutup Call ke peer remote; selalu menang atas reconnect yang sedang berjalan
    void hangup(const std::string& remote_id);

    std::optional<CallInfo> call(const std::string& remote_id) const;
    std::vector<CallInfo> calls() const;
    std::vector<Member> members() const;
    const std::string& localId() const { return local_id_; }
    bool joined() const { return joined_; }
    bool isInitiator() const { return options_.local_role == relay::Role::Controller; }
    const PeerSessionOptions& options() const { return options_; }

    // Events
    std::function<void(const Member&)> onUserJoined;
    std::function<void(const std::string&)> onUserLeft;
    std::function<void(const CallInfo&)> onCallStateChange;
    std::function<void(const std::string&)> onRelayError;
    std::function<void(bool)> onRelayLink;

protected:
    // Tambahkan media lokal atau buka data channel sebelum offer/answer
    virtual core::Result<void> prepareTransport(Call& call) = 0;

    virtual void onCallConnected(Call&) {}
    virtual void onCallLeftConnected(Call&) {}
    virtual void onCallClosed(Call&) {}
    virtual void onIncomingDataChannel(Call&, std::shared_ptr<DataChannel>) {}
    virtual void onRemoteTrack(Call&, TrackKind) {}
    virtual void onRemoteControl(const nlohmann::json&) {}

    // Jalankan di scheduler; diabaikan jika manager sudah dihancurkan
    void post(core::Task task);

    // Timer di scheduler dengan guard yang sama seperti post()
    core::TimerId schedule(std::chrono::milliseconds delay, core::Task task);
    void send(const std::string& event, nlohmann::json data);

    Call* findCall(const std::string& remote_id);
    Call* findCallById(uint64_t call_id);
    Call* connectedCall();

    core::Scheduler& scheduler() { return scheduler_; }

private:
    void handleSignal(const relay::WireMessage& message);
    void handleLink(bool connected);
    void handleJoinedRoom(const nlohmann::json& data);
    void handleUserJoined(const nlohmann::json& data);
    void handleUserLeft(const nlohmann::json& data);
    void handleOffer(const nlohmann::json& data);
    void handleAnswer(const nlohmann::json& data);
    void handleIceCandidate(const nlohmann::json& data);

    void maybeAutoInitiate();
    void startOutgoing(const std::string& remote_id);
    Call& createCall(const std::string& remote_id, bool initiator);
    core::Result<void> attachTransport(Call& call);
    void detachTransport(Call& call);
    core::Result<void> sendOffer(Call& call);
    core::Result<void> answerOffer(Call& call, const SessionDescription& offer);
    core::Result<void> applyRemoteDescription(Call& call, const SessionDescription& description);
    void flushPendingCandidates(Call& call);

    // Jalankan fn di scheduler hanya jika Call dan epoch transport-nya masih sama
    void postForCall(uint64_t call_id, uint64_t epoch, std::function<void(Call&)> fn);

    void handleHealth(Call& call, TransportHealth health);
    void handleNegotiationFailure(Call& call, const core::Error& error);
    void beginReconnect(Call& call);
    void scheduleAttempt(Call& call);
    void runAttempt(uint64_t call_id);
    void onGraceExpired(uint64_t call_id);

    void armTimer(Call& call, std::chrono::milliseconds delay, void (PeerSessionManager::*handler)(uint64_t));
    void cancelTimer(Call& call);
    void setState(Call& call, CallState state);
    void closeCall(uint64_t call_id, const std::string& reason);
    void closeAllCalls(const std::string& reason);

    std::optional<Member> findMember(const std::string& id) const;
    std::optional<Member> findMemberByRole(relay::Role role) const;
    const char* tag() const { return relay::roleName(options_.local_role); }

    core::Scheduler& scheduler_;
    SignalingChannel& signaling_;
    TransportProvider& transports_;
    PeerSessionOptions options_;

    std::string local_id_;
    bool joined_ = false;
    bool started_ = false;
    std::vector<Member> members_;  // urutan join, tanpa diri sendiri
    std::map<uint64_t, Call> calls_;
    uint64_t next_call_id_ = 1;

    std::shared_ptr<bool> alive_;
};

} // namespace carlink::session

#include <carlink/session/peer_session_manager.hpp>
#include <carlink/core/logger.hpp>

#include <algorithm>

namespace carlink::session {

namespace events = relay::events;
using core::Logger;

namespace {

const nlohmann::json& field(const nlohmann::json& data, const char* key) {
    static const nlohmann::json null_value;
    if (!data.is_object()) return null_value;
    auto it = data.find(key);
    return it != data.end() ? *it : null_value;
}

std::string stringField(const nlohmann::json& data, const char* key) {
    const auto& value = field(data, key);
    return value.is_string() ? value.get<std::string>() : std::string();
}

} // namespace

PeerSessionManager::PeerSessionManager(core::Scheduler& scheduler,
                                       SignalingChannel& signaling,
                                       TransportProvider& transports,
                                       PeerSessionOptions options)
    : scheduler_(scheduler)
    , signaling_(signaling)
    , transports_(transports)
    , options_(std::move(options))
    , alive_(std::make_shared<bool>(true)) {
    if (!options_.user_info.is_object()) {
        options_.user_info = nlohmann::json::object();
    }
    options_.user_info["role"] = relay::roleName(options_.local_role);
}

PeerSessionManager::~PeerSessionManager() {
    signaling_.setEventHandler(nullptr);
    signaling_.setLinkHandler(nullptr);
    alive_.reset();

    for (auto& [id, call] : calls_) {
        if (call.timer) {
            scheduler_.cancel(*call.timer);
            call.timer.reset();
        }
        detachTransport(call);
    }
    calls_.clear();
}

void PeerSessionManager::start() {
    post([this]() {
        if (started_) return;
        started_ = true;

        std::weak_ptr<bool> alive = alive_;
        auto* scheduler = &scheduler_;
        signaling_.setEventHandler([this, alive, scheduler](const relay::WireMessage& message) {
            scheduler->post([this, alive, message]() {
                if (!alive.lock()) return;
                handleSignal(message);
            });
        });
        signaling_.setLinkHandler([this, alive, scheduler](bool connected) {
            scheduler->post([this, alive, connected]() {
                if (!alive.lock()) return;
                handleLink(connected);
            });
        });

        Logger::info("{}: joining room {}", tag(), options_.room);
        send(events::JoinRoom, {{"roomId", options_.room}, {"userInfo", options_.user_info}});
    });
}

void PeerSessionManager::stop() {
    post([this]() {
        if (!started_) return;
        started_ = false;

        closeAllCalls("stopped");
        if (joined_) {
            send(events::LeaveRoom, nlohmann::json::object());
        }
        signaling_.setEventHandler(nullptr);
        signaling_.setLinkHandler(nullptr);

        joined_ = false;
        members_.clear();
        Logger::info("{}: left room {}", tag(), options_.room);
    });
}

void PeerSessionManager::initiate(const std::string& remote_id) {
    post([this, remote_id]() {
        startOutgoing(remote_id);
    });
}

void PeerSessionManager::hangup(const std::string& remote_id) {
    post([this, remote_id]() {
        auto* call = findCall(remote_id);
        if (!call) {
            Logger::debug("{}: hangup for {} without a call", tag(), remote_id);
            return;
        }
        closeCall(call->id, "hangup");
    });
}

std::optional<CallInfo> PeerSessionManager::call(const std::string& remote_id) const {
    for (const auto& [id, call] : calls_) {
        if (call.remote_id == remote_id) {
            return describeCall(call);
        }
    }
    return std::nullopt;
}

std::vector<CallInfo> PeerSessionManager::calls() const {
    std::vector<CallInfo> result;
    result.reserve(calls_.size());
    for (const auto& [id, call] : calls_) {
        result.push_back(describeCall(call));
    }
    return result;
}

std::vector<Member> PeerSessionManager::members() const {
    return members_;
}

void PeerSessionManager::post(core::Task task) {
    std::weak_ptr<bool> alive = alive_;
    scheduler_.post([alive, task = std::move(task)]() {
        if (!alive.lock()) return;
        task();
    });
}

core::TimerId PeerSessionManager::schedule(std::chrono::milliseconds delay, core::Task task) {
    std::weak_ptr<bool> alive = alive_;
    return scheduler_.schedule(delay, [alive, task = std::move(task)]() {
        if (!alive.lock()) return;
        task();
    });
}

void PeerSessionManager::send(const std::string& event, nlohmann::json data) {
    signaling_.emit(relay::WireMessage(event, std::move(data)));
}

Call* PeerSessionManager::findCall(const std::string& remote_id) {
    for (auto& [id, call] : calls_) {
        if (call.remote_id == remote_id) {
            return &call;
        }
    }
    return nullptr;
}

Call* PeerSessionManager::findCallById(uint64_t call_id) {
    auto it = calls_.find(call_id);
    return it != calls_.end() ? &it->second : nullptr;
}

Call* PeerSessionManager::connectedCall() {
    for (auto& [id, call] : calls_) {
        if (call.state == CallState::Connected) {
            return &call;
        }
    }
    return nullptr;
}

void PeerSessionManager::handleSignal(const relay::WireMessage& message) {
    const auto& event = message.event;
    const auto& data = message.data;

    if (event == events::JoinedRoom) {
        handleJoinedRoom(data);
    } else if (event == events::UserJoined) {
        handleUserJoined(data);
    } else if (event == events::UserLeft) {
        handleUserLeft(data);
    } else if (event == events::Offer) {
        handleOffer(data);
    } else if (event == events::Answer) {
        handleAnswer(data);
    } else if (event == events::IceCandidate) {
        handleIceCandidate(data);
    } else if (event == events::RemoteControl) {
        onRemoteControl(data);
    } else if (event == events::Message) {
        Logger::debug("{}: message from {}: {}", tag(), stringField(data, "fromUserId"), field(data, "message").dump());
    } else if (event == events::Error) {
        auto text = stringField(data, "message");
        Logger::warn("{}: relay error: {}", tag(), text);
        if (onRelayError) {
            onRelayError(text);
        }
    } else {
        Logger::debug("{}: ignoring event {}", tag(), event);
    }
}

void PeerSessionManager::handleLink(bool connected) {
    if (!started_) return;

    if (!connected) {
        // Membership dan id lokal tidak berlaku lagi; Call dibiarkan ke jalur health transport
        Logger::warn("{}: relay connection lost, {} call(s) kept", tag(), calls_.size());
        joined_ = false;
        members_.clear();
        if (onRelayLink) {
            onRelayLink(false);
        }
        return;
    }

    if (onRelayLink) {
        onRelayLink(true);
    }
    if (joined_) return;

    Logger::info("{}: relay connection restored, rejoining room {}", tag(), options_.room);
    send(events::JoinRoom, {{"roomId", options_.room}, {"userInfo", options_.user_info}});
}

void PeerSessionManager::handleJoinedRoom(const nlohmann::json& data) {
    local_id_ = stringField(data, "userId");
    joined_ = true;
    members_.clear();

    const auto& users = field(data, "users");
    if (users.is_array()) {
        for (const auto& user : users) {
            auto id = stringField(user, "id");
            if (id.empty() || id == local_id_) continue;

            Member member;
            member.id = id;
            member.user_info = field(user, "userInfo");
            member.role = relay::roleFromUserInfo(member.user_info);
            members_.push_back(std::move(member));
        }
    }

    Logger::info("{}: joined room {} as {} ({} other members)", tag(), options_.room, local_id_, members_.size());

    if (onUserJoined) {
        for (const auto& member : members_) {
            onUserJoined(member);
        }
    }
    maybeAutoInitiate();
}

void PeerSessionManager::handleUserJoined(const nlohmann::json& data) {
    auto id = stringField(data, "userId");
    if (id.empty() || id == local_id_) return;

    Member member;
    member.id = id;
    member.user_info = field(data, "userInfo");
    member.role = relay::roleFromUserInfo(member.user_info);

    auto it = std::find_if(members_.begin(), members_.end(), [&](const Member& m) { return m.id == id; });
    if (it != members_.end()) {
        *it = member;
    } else {
        members_.push_back(member);
    }

    Logger::info("{}: {} {} joined", tag(), relay::roleName(member.role), id);
    if (onUserJoined) {
        onUserJoined(member);
    }
    maybeAutoInitiate();
}

void PeerSessionManager::handleUserLeft(const nlohmann::json& data) {
    auto id = stringField(data, "userId");
    if (id.empty()) return;

    members_.erase(std::remove_if(members_.begin(), members_.end(),
        [&](const Member& m) { return m.id == id; }), members_.end());

    Logger::info("{}: {} left", tag(), id);
    if (onUserLeft) {
        onUserLeft(id);
    }

    auto* call = findCall(id);
    if (!call) return;

    if (call->reconnecting) {
        // Peer bisa kembali dengan id baru; reconnect yang menentukan
        Logger::info("{}: {} left during reconnection, keeping call {}", tag(), id, call->id);
        return;
    }
    closeCall(call->id, "peer left");
}

void PeerSessionManager::handleOffer(const nlohmann::json& data) {
    auto from = stringField(data, "fromUserId");
    if (from.empty()) {
        Logger::warn("{}: offer without fromUserId", tag());
        return;
    }

    auto offer = SessionDescription::fromJson(field(data, "offer"));
    if (offer.is_error() || offer.value().type != SdpType::Offer) {
        Logger::warn("{}: invalid offer from {}", tag(), from);
        return;
    }

    Call* call = findCall(from);
    if (!call) {
        // Peer yang kembali dengan id baru mengambil alih Call yang sedang reconnect
        auto member = findMember(from);
        auto role = member ? member->role : relay::Role::Unknown;
        if (role != relay::Role::Unknown) {
            for (auto& [id, candidate] : calls_) {
                if (candidate.reconnecting && candidate.remote_role == role) {
                    Logger::info("{}: {} {} takes over call {} (was {})",
                        tag(), relay::roleName(role), from, candidate.id, candidate.remote_id);
                    candidate.remote_id = from;
                    call = &candidate;
                    break;
                }
            }
        }
    }

    if (call && !call->reconnecting) {
        closeCall(call->id, "replaced by new offer");
        call = nullptr;
    }

    if (!call) {
        call = &createCall(from, false);
        setState(*call, CallState::Negotiating);
    } else {
        call->initiator = false;
        if (call->state == CallState::Reconnecting) {
            // Offer datang sebelum backoff selesai: langsung ke grace window
            setState(*call, CallState::Negotiating);
            armTimer(*call, options_.reconnect.grace_period, &PeerSessionManager::onGraceExpired);
        }
        detachTransport(*call);
    }

    auto attached = attachTransport(*call);
    if (attached.is_error()) {
        handleNegotiationFailure(*call, attached.error());
        return;
    }

    auto answered = answerOffer(*call, offer.value());
    if (answered.is_error()) {
        handleNegotiationFailure(*call, answered.error());
    }
}

void PeerSessionManager::handleAnswer(const nlohmann::json& data) {
    auto from = stringField(data, "fromUserId");
    auto* call = findCall(from);
    if (!call || !call->transport) {
        Logger::debug("{}: ignoring answer from {} without a pending call", tag(), from);
        return;
    }

    auto answer = SessionDescription::fromJson(field(data, "answer"));
    if (answer.is_error() || answer.value().type != SdpType::Answer) {
        Logger::warn("{}: invalid answer from {}", tag(), from);
        return;
    }

    auto applied = applyRemoteDescription(*call, answer.value());
    if (applied.is_error()) {
        handleNegotiationFailure(*call, applied.error());
    }
}

void PeerSessionManager::handleIceCandidate(const nlohmann::json& data) {
    auto from = stringField(data, "fromUserId");
    auto* call = findCall(from);
    if (!call) {
        Logger::debug("{}: ignoring ICE candidate from {}", tag(), from);
        return;
    }

    auto candidate = IceCandidate::fromJson(field(data, "candidate"));
    if (candidate.is_error()) {
        Logger::warn("{}: invalid ICE candidate from {}", tag(), from);
        return;
    }

    if (!call->transport || !call->has_remote_description) {
        call->pending_candidates.push_back(candidate.value());
        return;
    }

    auto added = call->transport->addRemoteCandidate(candidate.value());
    if (added.is_error()) {
        Logger::debug("{}: ICE candidate from {} rejected: {}", tag(), from, added.error().what());
    }
}

void PeerSessionManager::maybeAutoInitiate() {
    if (!isInitiator() || !joined_) return;

    for (const auto& [id, call] : calls_) {
        if (call.remote_role == options_.target_role) return;
    }

    auto target = findMemberByRole(options_.target_role);
    if (!target) return;

    Logger::info("{}: {} {} is present, starting call", tag(), relay::roleName(target->role), target->id);
    startOutgoing(target->id);
}

void PeerSessionManager::startOutgoing(const std::string& remote_id) {
    if (!joined_) {
        Logger::warn("{}: cannot call {} before joining a room", tag(), remote_id);
        return;
    }
    if (remote_id.empty() || remote_id == local_id_) {
        Logger::warn("{}: invalid call target '{}'", tag(), remote_id);
        return;
    }

    if (auto* existing = findCall(remote_id)) {
        closeCall(existing->id, "replaced by new call");
    }

    Call& call = createCall(remote_id, true);
    setState(call, CallState::Negotiating);

    auto attached = attachTransport(call);
    if (attached.is_error()) {
        handleNegotiationFailure(call, attached.error());
        return;
    }

    auto offered = sendOffer(call);
    if (offered.is_error()) {
        handleNegotiationFailure(call, offered.error());
    }
}

Call& PeerSessionManager::createCall(const std::string& remote_id, bool initiator) {
    Call call;
    call.id = next_call_id_++;
    call.remote_id = remote_id;
    call.initiator = initiator;
    if (auto member = findMember(remote_id)) {
        call.remote_role = member->role;
    }

    Logger::debug("{}: call {} with {} created", tag(), call.id, remote_id);
    auto [it, inserted] = calls_.emplace(call.id, std::move(call));
    return it->second;
}

core::Result<void> PeerSessionManager::attachTransport(Call& call) {
    call.transport = transports_.create();
    if (!call.transport) {
        return {core::ErrorCode::TransportFailed, "Transport provider returned no transport"};
    }

    auto call_id = call.id;
    auto epoch = call.epoch;
    auto& transport = *call.transport;

    transport.onHealthChange = [this, call_id, epoch](TransportHealth health) {
        postForCall(call_id, epoch, [this, health](Call& current) {
            handleHealth(current, health);
        });
    };

    transport.onLocalCandidate = [this, call_id, epoch](const IceCandidate& candidate) {
        postForCall(call_id, epoch, [this, candidate](Call& current) {
            send(events::IceCandidate, {{"targetUserId", current.remote_id}, {"candidate", candidate.toJson()}});
        });
    };

    transport.onDataChannel = [this, call_id, epoch](std::shared_ptr<DataChannel> channel) {
        postForCall(call_id, epoch, [this, channel](Call& current) {
            onIncomingDataChannel(current, channel);
        });
    };

    transport.onRemoteTrack = [this, call_id, epoch](TrackKind kind) {
        postForCall(call_id, epoch, [this, kind](Call& current) {
            if (std::find(current.remote_tracks.begin(), current.remote_tracks.end(), kind) == current.remote_tracks.end()) {
                current.remote_tracks.push_back(kind);
            }
            onRemoteTrack(current, kind);
        });
    };

    return prepareTransport(call);
}

void PeerSessionManager::detachTransport(Call& call) {
    // Callback dari transport lama menjadi stale
    ++call.epoch;

    // close() dulu: setelah close() tidak ada callback yang berjalan
    if (call.data_channel) {
        call.data_channel->close();
        call.data_channel->onOpen = nullptr;
        call.data_channel->onClose = nullptr;
        call.data_channel->onMessage = nullptr;
        call.data_channel.reset();
    }

    if (call.transport) {
        call.transport->close();
        call.transport->onHealthChange = nullptr;
        call.transport->onLocalCandidate = nullptr;
        call.transport->onDataChannel = nullptr;
        call.transport->onRemoteTrack = nullptr;
        call.transport.reset();
    }

    call.has_remote_description = false;
    call.pending_candidates.clear();
    call.remote_tracks.clear();
}

core::Result<void> PeerSessionManager::sendOffer(Call& call) {
    auto offer = call.transport->createOffer();
    if (offer.is_error()) {
        return offer.error();
    }

    send(events::Offer, {{"targetUserId", call.remote_id}, {"offer", offer.value().toJson()}});
    Logger::info("{}: offer sent to {}", tag(), call.remote_id);
    return {};
}

core::Result<void> PeerSessionManager::answerOffer(Call& call, const SessionDescription& offer) {
    auto applied = applyRemoteDescription(call, offer);
    if (applied.is_error()) {
        return applied;
    }

    auto answer = call.transport->createAnswer();
    if (answer.is_error()) {
        return answer.error();
    }

    send(events::Answer, {{"targetUserId", call.remote_id}, {"answer", answer.value().toJson()}});
    Logger::info("{}: answer sent to {}", tag(), call.remote_id);
    return {};
}

core::Result<void> PeerSessionManager::applyRemoteDescription(Call& call, const SessionDescription& description) {
    auto applied = call.transport->setRemoteDescription(description);
    if (applied.is_error()) {
        return applied;
    }

    call.has_remote_description = true;
    flushPendingCandidates(call);
    return {};
}

void PeerSessionManager::flushPendingCandidates(Call& call) {
    auto pending = std::move(call.pending_candidates);
    call.pending_candidates.clear();

    for (const auto& candidate : pending) {
        auto added = call.transport->addRemoteCandidate(candidate);
        if (added.is_error()) {
            Logger::debug("{}: buffered ICE candidate rejected: {}", tag(), added.error().what());
        }
    }
}

void PeerSessionManager::postForCall(uint64_t call_id, uint64_t epoch, std::function<void(Call&)> fn) {
    post([this, call_id, epoch, fn = std::move(fn)]() {
        auto* call = findCallById(call_id);
        if (!call || call->epoch != epoch) return;
        fn(*call);
    });
}

void PeerSessionManager::handleHealth(Call& call, TransportHealth health) {
    Logger::debug("{}: transport to {} is {}", tag(), call.remote_id, transportHealthName(health));

    switch (health) {
        case TransportHealth::Connected:
        case TransportHealth::Completed:
            if (call.state == CallState::Connected) return;
            if (call.reconnecting) {
                Logger::info("{}: reconnected to {} after {} attempt(s)", tag(), call.remote_id, call.attempt);
            }
            cancelTimer(call);
            call.attempt = 0;
            call.reconnecting = false;
            setState(call, CallState::Connected);
            break;

        case TransportHealth::Disconnected:
        case TransportHealth::Failed:
            if (call.reconnecting) {
                Logger::debug("{}: reconnection to {} already in progress", tag(), call.remote_id);
                return;
            }
            if (call.state == CallState::Connected || call.state == CallState::Negotiating) {
                beginReconnect(call);
            }
            break;

        default:
            break;
    }
}

void PeerSessionManager::handleNegotiationFailure(Call& call, const core::Error& error) {
    Logger::warn("{}: negotiation with {} failed: {}", tag(), call.remote_id, error.what());
    if (!call.reconnecting) {
        beginReconnect(call);
    }
}

void PeerSessionManager::beginReconnect(Call& call) {
    setState(call, CallState::Disconnected);
    call.reconnecting = true;
    call.attempt = 1;
    setState(call, CallState::Reconnecting);
    scheduleAttempt(call);
}

void PeerSessionManager::scheduleAttempt(Call& call) {
    auto delay = options_.reconnect.delayFor(call.attempt);
    Logger::info("{}: reconnect attempt {}/{} to {} in {} ms",
        tag(), call.attempt, options_.reconnect.max_attempts, call.remote_id, delay.count());
    armTimer(call, delay, &PeerSessionManager::runAttempt);
}

void PeerSessionManager::runAttempt(uint64_t call_id) {
    auto* call = findCallById(call_id);
    if (!call) return;

    detachTransport(*call);

    // Peer mungkin sudah kembali dengan id baru
    if (!findMember(call->remote_id) && call->remote_role != relay::Role::Unknown) {
        if (auto member = findMemberByRole(call->remote_role)) {
            Logger::info("{}: {} is now {}", tag(), call->remote_id, member->id);
            call->remote_id = member->id;
        }
    }

    setState(*call, CallState::Negotiating);
    armTimer(*call, options_.reconnect.grace_period, &PeerSessionManager::onGraceExpired);

    if (!isInitiator()) {
        Logger::debug("{}: waiting for a new offer from {}", tag(), call->remote_id);
        return;
    }
    if (!findMember(call->remote_id)) {
        Logger::info("{}: {} is not in the room, waiting", tag(), call->remote_id);
        return;
    }

    call->initiator = true;
    auto attached = attachTransport(*call);
    if (attached.is_error()) {
        Logger::warn("{}: reconnect attempt {} failed: {}", tag(), call->attempt, attached.error().what());
        return;
    }

    auto offered = sendOffer(*call);
    if (offered.is_error()) {
        Logger::warn("{}: reconnect attempt {} failed: {}", tag(), call->attempt, offered.error().what());
    }
}

void PeerSessionManager::onGraceExpired(uint64_t call_id) {
    auto* call = findCallById(call_id);
    if (!call || call->state == CallState::Connected) return;

    if (call->attempt >= options_.reconnect.max_attempts) {
        Logger::warn("{}: giving up on {} after {} attempts", tag(), call->remote_id, call->attempt);
        closeCall(call->id, "reconnection exhausted");
        return;
    }

    ++call->attempt;
    setState(*call, CallState::Reconnecting);
    scheduleAttempt(*call);
}

void PeerSessionManager::armTimer(Call& call, std::chrono::milliseconds delay,
                                  void (PeerSessionManager::*handler)(uint64_t)) {
    cancelTimer(call);

    auto generation = call.timer_generation;
    auto call_id = call.id;
    std::weak_ptr<bool> alive = alive_;

    call.timer = scheduler_.schedule(delay, [this, alive, call_id, generation, handler]() {
        if (!alive.lock()) return;

        auto* current = findCallById(call_id);
        if (!current || current->timer_generation != generation) return;

        current->timer.reset();
        (this->*handler)(call_id);
    });
}

void PeerSessionManager::cancelTimer(Call& call) {
    if (call.timer) {
        scheduler_.cancel(*call.timer);
        call.timer.reset();
    }
    ++call.timer_generation;
}

void PeerSessionManager::setState(Call& call, CallState state) {
    if (call.state == state) return;

    auto previous = call.state;
    call.state = state;
    Logger::info("{}: call {} with {}: {} -> {}",
        tag(), call.id, call.remote_id, callStateName(previous), callStateName(state));

    if (previous == CallState::Connected) {
        onCallLeftConnected(call);
    }
    if (state == CallState::Connected) {
        onCallConnected(call);
    }
    if (onCallStateChange) {
        onCallStateChange(describeCall(call));
    }
}

void PeerSessionManager::closeCall(uint64_t call_id, const std::string& reason) {
    auto it = calls_.find(call_id);
    if (it == calls_.end()) return;

    Call& call = it->second;
    Logger::info("{}: closing call {} with {} ({})", tag(), call.id, call.remote_id, reason);

    cancelTimer(call);
    call.reconnecting = false;
    detachTransport(call);
    setState(call, CallState::Closed);
    onCallClosed(call);

    calls_.erase(it);
}

void PeerSessionManager::closeAllCalls(const std::string& reason) {
    std::vector<uint64_t> ids;
    for (const auto& [id, call] : calls_) {
        ids.push_back(id);
    }
    for (auto id : ids) {
        closeCall(id, reason);
    }
}

std::optional<Member> PeerSessionManager::findMember(const std::string& id) const {
    for (const auto& member : members_) {
        if (member.id == id) return member;
    }
    return std::nullopt;
}

std::optional<Member> PeerSessionManager::findMemberByRole(relay::Role role) const {
    for (const auto& member : members_) {
        if (member.role == role) return member;
    }
    return std::nullopt;
}

} // namespace carlink::session

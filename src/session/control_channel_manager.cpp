#include <carlink/session/control_channel_manager.hpp>
#include <carlink/core/logger.hpp>

#include <algorithm>
#include <cmath>

namespace carlink::session {

using core::Logger;

namespace {

PeerSessionOptions withControlRoom(PeerSessionOptions options, const ControlChannelConfig& config) {
    options.room = config.room;
    options.target_role = config.target_role;
    return options;
}

} // namespace

std::chrono::microseconds ControlChannelConfig::tickPeriod() const {
    auto period = std::llround(1e6 / send_frequency_hz);
    return std::chrono::microseconds(std::max<long long>(1, period));
}

core::Result<ControlChannelConfig> ControlChannelConfig::fromConfig(const core::Config& config) {
    ControlChannelConfig result;
    auto node = config.section("control");

    std::string target = relay::roleName(result.target_role);
    for (auto read : {
            node->read("send_frequency_hz", result.send_frequency_hz),
            node->read("deadzone", result.deadzone),
            node->read("room", result.room),
            node->read("target_role", target)}) {
        if (read.is_error()) return read.error();
    }

    if (!(result.send_frequency_hz > 0.0) || result.send_frequency_hz > 1000.0) {
        return {core::ErrorCode::InvalidData, "control.send_frequency_hz must be in (0, 1000]"};
    }
    if (result.deadzone < 0.0 || result.deadzone >= 1.0) {
        return {core::ErrorCode::InvalidData, "control.deadzone must be in [0, 1)"};
    }
    if (result.room.empty()) {
        return {core::ErrorCode::InvalidData, "control.room must not be empty"};
    }
    result.target_role = relay::roleFromString(target);
    if (result.target_role == relay::Role::Unknown) {
        return {core::ErrorCode::InvalidData, "control.target_role is not a known role: " + target};
    }
    return result;
}

ControlChannelManager::ControlChannelManager(core::Scheduler& scheduler,
                                             SignalingChannel& signaling,
                                             TransportProvider& transports,
                                             PeerSessionOptions options,
                                             ControlChannelConfig config,
                                             InputSource* input,
                                             control::VehicleController* vehicle)
    : PeerSessionManager(scheduler, signaling, transports, withControlRoom(std::move(options), config))
    , config_(std::move(config))
    , input_(input)
    , vehicle_(vehicle) {}

ControlChannelManager::~ControlChannelManager() {
    if (tick_timer_) {
        scheduler().cancel(*tick_timer_);
        tick_timer_.reset();
    }
}

void ControlChannelManager::startProduction() {
    post([this]() {
        manual_stop_ = false;
        if (!connectedCall()) {
            Logger::warn("Control channel: start refused, no connected call");
            return;
        }
        startTicks();
    });
}

void ControlChannelManager::stopProduction() {
    post([this]() {
        manual_stop_ = true;
        stopTicks();
    });
}

ControlChannelStats ControlChannelManager::stats() const {
    ControlChannelStats stats;
    stats.frames_sent = frames_sent_;
    stats.frames_received = frames_received_;
    stats.malformed_frames = malformed_frames_;
    stats.send_failures = send_failures_;
    stats.vehicle_errors = vehicle_errors_;
    return stats;
}

core::Result<void> ControlChannelManager::prepareTransport(Call& call) {
    if (!call.initiator) {
        return {};
    }

    DataChannelInit init;
    init.ordered = true;
    init.max_retransmits = kMaxRetransmits;

    auto channel = call.transport->openDataChannel(kChannelLabel, init);
    if (channel.is_error()) {
        return channel.error();
    }
    bindChannel(call, channel.value());
    return {};
}

void ControlChannelManager::onCallConnected(Call&) {
    if (isInitiator() && !manual_stop_) {
        startTicks();
    }
}

void ControlChannelManager::onCallLeftConnected(Call&) {
    stopTicks();
    stopVehicle();
}

void ControlChannelManager::onCallClosed(Call&) {
    stopVehicle();
}

void ControlChannelManager::onIncomingDataChannel(Call& call, std::shared_ptr<DataChannel> channel) {
    if (!channel || channel->label() != kChannelLabel) {
        Logger::debug("Control channel: ignoring data channel {}", channel ? channel->label() : std::string("<null>"));
        return;
    }
    bindChannel(call, std::move(channel));
}

void ControlChannelManager::bindChannel(Call& call, std::shared_ptr<DataChannel> channel) {
    auto label = channel->label();
    auto remote_id = call.remote_id;

    channel->onOpen = [label, remote_id]() {
        Logger::info("Control channel: {} open to {}", label, remote_id);
    };
    channel->onClose = [label, remote_id]() {
        Logger::debug("Control channel: {} to {} closed", label, remote_id);
    };
    channel->onMessage = [this](const std::vector<uint8_t>& bytes) {
        post([this, bytes]() {
            handleFrame(bytes);
        });
    };

    call.data_channel = std::move(channel);
}

void ControlChannelManager::handleFrame(const std::vector<uint8_t>& bytes) {
    auto frame = control::decode(bytes);
    if (frame.is_error()) {
        ++malformed_frames_;
        Logger::debug("Control channel: discarding frame: {}", frame.error().what());
        return;
    }

    ++frames_received_;
    if (vehicle_) {
        auto applied = vehicle_->apply(frame.value());
        if (applied.is_error()) {
            ++vehicle_errors_;
        }
    }
    if (onControlFrame) {
        onControlFrame(frame.value());
    }
}

void ControlChannelManager::stopVehicle() {
    if (!vehicle_) return;

    auto stopped = vehicle_->stop();
    if (stopped.is_error()) {
        ++vehicle_errors_;
    }
}

void ControlChannelManager::startTicks() {
    if (producing_) return;

    producing_ = true;
    tick_origin_us_ = scheduler().nowMillis() * 1000;
    tick_index_ = 0;
    Logger::info("Control channel: producing frames at {} Hz ({} us period)",
        config_.send_frequency_hz, config_.tickPeriod().count());
    scheduleTick();
}

void ControlChannelManager::stopTicks() {
    if (!producing_) return;

    producing_ = false;
    ++tick_generation_;
    if (tick_timer_) {
        scheduler().cancel(*tick_timer_);
        tick_timer_.reset();
    }
    Logger::info("Control channel: frame production stopped after {} frames", frames_sent_.load());
}

void ControlChannelManager::scheduleTick() {
    auto generation = tick_generation_;
    int64_t now_us = scheduler().nowMillis() * 1000;
    int64_t deadline = tick_origin_us_ + std::llround((tick_index_ + 1) * 1e6 / config_.send_frequency_hz);

    if (deadline <= now_us) {
        // Tertinggal satu periode penuh: deadline dihitung ulang dari sekarang
        Logger::debug("Control channel: tick {} late by {} us, resyncing", tick_index_ + 1, now_us - deadline);
        tick_origin_us_ = now_us;
        tick_index_ = 0;
        deadline = now_us + std::llround(1e6 / config_.send_frequency_hz);
    }

    auto delay = std::chrono::milliseconds((deadline - now_us + 999) / 1000);
    tick_timer_ = schedule(delay, [this, generation]() {
        tick(generation);
    });
}

void ControlChannelManager::tick(uint64_t generation) {
    if (!producing_ || generation != tick_generation_) return;

    tick_timer_.reset();
    ++tick_index_;
    scheduleTick();

    auto* call = connectedCall();
    if (!call || !call->data_channel || !call->data_channel->isOpen()) {
        Logger::debug("Control channel: channel not ready, skipping tick");
        return;
    }

    if (!input_) return;
    auto state = input_->read();
    if (!state) return;

    double throttle = control::applyDeadzone(state->throttle, config_.deadzone);
    double steering = control::applyDeadzone(state->steering, config_.deadzone);
    uint16_t buttons = control::buttonMask(state->buttons);

    ++sequence_;
    auto bytes = control::encode(throttle, steering, buttons, sequence_, scheduler().nowMillis());

    auto sent = call->data_channel->send(bytes.data(), bytes.size());
    if (sent.is_error()) {
        ++send_failures_;
        Logger::debug("Control channel: send of frame {} failed: {}", sequence_, sent.error().what());
        return;
    }
    ++frames_sent_;
}

} // namespace carlink::session

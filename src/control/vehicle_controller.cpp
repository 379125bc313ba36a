#include <carlink/control/vehicle_controller.hpp>
#include <carlink/core/logger.hpp>

#include <algorithm>
#include <cmath>

namespace carlink::control {

using core::Logger;

core::Result<void> SimulatedActuator::setThrottlePulse(int pulse_us) {
    if (pulse_us != throttle_pulse_) {
        Logger::debug("Simulation - throttle: {}us", pulse_us);
    }
    throttle_pulse_ = pulse_us;
    return {};
}

core::Result<void> SimulatedActuator::setSteeringAngle(int degrees) {
    if (degrees != steering_angle_) {
        Logger::debug("Simulation - steering: {} degrees", degrees);
    }
    steering_angle_ = degrees;
    return {};
}

core::Result<VehicleConfig> VehicleConfig::fromConfig(const core::Config& config) {
    VehicleConfig result;
    auto node = config.section("vehicle");

    for (auto read : {
            node->read("power_limit_percent", result.power_limit_percent),
            node->read("throttle_deadzone", result.throttle_deadzone),
            node->read("require_deadman", result.require_deadman),
            node->read("steering_min_percent", result.steering_min_percent),
            node->read("steering_max_percent", result.steering_max_percent),
            node->read("steering_deadzone", result.steering_deadzone)}) {
        if (read.is_error()) return read.error();
    }

    if (!(result.power_limit_percent > 0.0) || result.power_limit_percent > 100.0) {
        return {core::ErrorCode::InvalidData, "vehicle.power_limit_percent must be in (0, 100]"};
    }
    if (result.throttle_deadzone < 0.0 || result.throttle_deadzone >= 1.0) {
        return {core::ErrorCode::InvalidData, "vehicle.throttle_deadzone must be in [0, 1)"};
    }
    if (result.steering_deadzone < 0.0 || result.steering_deadzone >= 1.0) {
        return {core::ErrorCode::InvalidData, "vehicle.steering_deadzone must be in [0, 1)"};
    }
    if (result.steering_min_percent < 0.0 || result.steering_max_percent > 100.0 ||
        result.steering_min_percent >= result.steering_max_percent) {
        return {core::ErrorCode::InvalidData, "vehicle steering range must satisfy 0 <= min < max <= 100"};
    }
    return result;
}

VehicleController::VehicleController(Actuator& actuator, VehicleConfig config)
    : actuator_(actuator)
    , config_(std::move(config)) {
    Logger::info("Vehicle: power limit {}%, steering range {}%-{}%, deadman {}",
        config_.power_limit_percent, config_.steering_min_percent, config_.steering_max_percent,
        config_.require_deadman ? "required" : "off");
}

core::Result<void> VehicleController::apply(const ControlFrame& frame) {
    bool deadman = frame.pressed(kButtonDeadman);
    bool brake = frame.pressed(kButtonEmergencyBrake);
    bool power_button = frame.pressed(kButtonPowerLimit);

    if (power_button && !power_button_held_) {
        power_limited_ = !power_limited_;
        Logger::info("Vehicle: power limit {}", power_limited_ ? "engaged" : "released");
    }
    power_button_held_ = power_button;

    double throttle = frame.throttle();
    if (brake || (config_.require_deadman && !deadman)) {
        throttle = 0.0;
    }

    int pulse = throttlePulse(throttle);
    int angle = steeringAngle(frame.steering());

    status_.deadman_held = deadman;
    status_.emergency_brake = brake;
    status_.power_limited = power_limited_;
    status_.last_sequence = frame.sequence;

    Logger::debug("Vehicle: seq {} throttle {} steering {} -> {}us {} deg (deadman {}, brake {})",
        frame.sequence, frame.throttle(), frame.steering(), pulse, angle, deadman, brake);

    auto throttled = actuator_.setThrottlePulse(pulse);
    if (throttled.is_error()) {
        Logger::warn("Vehicle: throttle output failed: {}", throttled.error().what());
        return throttled;
    }
    status_.throttle_pulse = pulse;

    auto steered = actuator_.setSteeringAngle(angle);
    if (steered.is_error()) {
        Logger::warn("Vehicle: steering output failed: {}", steered.error().what());
        return steered;
    }
    status_.steering_angle = angle;

    ++status_.frames_applied;
    return {};
}

core::Result<void> VehicleController::stop() {
    auto throttled = actuator_.setThrottlePulse(kEscNeutralPulse);
    auto steered = actuator_.setSteeringAngle(kSteeringCenterAngle);

    status_.deadman_held = false;
    status_.emergency_brake = false;

    if (throttled.is_error()) {
        Logger::error("Vehicle: stop failed, ESC not neutral: {}", throttled.error().what());
        return throttled;
    }
    status_.throttle_pulse = kEscNeutralPulse;

    if (steered.is_error()) {
        Logger::warn("Vehicle: centering steering failed: {}", steered.error().what());
        return steered;
    }
    status_.steering_angle = kSteeringCenterAngle;

    Logger::info("Vehicle stopped, steering centered");
    return {};
}

int VehicleController::throttlePulse(double throttle) const {
    double percent = power_limited_ ? config_.power_limit_percent : 100.0;
    double limited = std::clamp(throttle, -1.0, 1.0) * percent / 100.0;
    if (std::abs(limited) < config_.throttle_deadzone) {
        return kEscNeutralPulse;
    }

    // Pulse tidak pernah jatuh di deadband ESC
    if (limited < 0.0) {
        int low = kEscDeadbandHigh + 5;
        return static_cast<int>(low + (kEscMaxPulse - low) * std::min(1.0, -limited));
    }
    int high = kEscDeadbandLow - 5;
    return static_cast<int>(high - (high - kEscMinPulse) * std::min(1.0, limited));
}

int VehicleController::steeringAngle(double steering) const {
    double value = std::clamp(steering, -1.0, 1.0);
    if (std::abs(value) < config_.steering_deadzone) {
        return kSteeringCenterAngle;
    }

    // -1 (kiri) -> 100%, 1 (kanan) -> 0%, lalu dipetakan ke rentang aman
    double user_percent = (1.0 - value) * 50.0;
    double safe_percent = config_.steering_min_percent +
        (user_percent / 100.0) * (config_.steering_max_percent - config_.steering_min_percent);

    return std::clamp(static_cast<int>(safe_percent * 1.8), 0, 180);
}

} // namespace carlink::control

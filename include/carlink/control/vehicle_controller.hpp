#pragma once

#include <cstdint>
#include <vector>

#include <carlink/control/control_frame.hpp>
#include <carlink/core/config.hpp>
#include <carlink/core/error.hpp>

namespace carlink::control {

// Pulse ESC (mikrodetik)
constexpr int kEscMinPulse = 1000;       // mundur penuh
constexpr int kEscNeutralPulse = 1500;
constexpr int kEscMaxPulse = 2000;       // maju penuh
constexpr int kEscDeadbandLow = 1485;
constexpr int kEscDeadbandHigh = 1515;

constexpr int kSteeringCenterAngle = 90;

// Tombol pada frame kontrol
constexpr int kButtonDeadman = 0;        // harus ditahan agar throttle aktif
constexpr int kButtonEmergencyBrake = 1; // ditahan = throttle netral
constexpr int kButtonPowerLimit = 2;     // tekan = toggle batas daya

// Output fisik kendaraan (ESC dan servo kemudi)
class Actuator {
public:
    virtual ~Actuator() = default;

    virtual core::Result<void> setThrottlePulse(int pulse_us) = 0;
    virtual core::Result<void> setSteeringAngle(int degrees) = 0;
};

// Actuator tanpa hardware: hanya menyimpan dan me-log nilai terakhir
class SimulatedActuator : public Actuator {
public:
    core::Result<void> setThrottlePulse(int pulse_us) override;
    core::Result<void> setSteeringAngle(int degrees) override;

    int throttlePulse() const { return throttle_pulse_; }
    int steeringAngle() const { return steering_angle_; }

private:
    int throttle_pulse_ = kEscNeutralPulse;
    int steering_angle_ = kSteeringCenterAngle;
};

// Konfigurasi kendaraan, dibaca dari object "vehicle"
struct VehicleConfig {
    double power_limit_percent = 25.0;
    double throttle_deadzone = 0.05;
    bool require_deadman = true;
    double steering_min_percent = 10.0;  // batas aman servo, persen dari 0-180 derajat
    double steering_max_percent = 90.0;
    double steering_deadzone = 0.05;

    static core::Result<VehicleConfig> fromConfig(const core::Config& config);
};

struct VehicleStatus {
    int throttle_pulse = kEscNeutralPulse;
    int steering_angle = kSteeringCenterAngle;
    bool deadman_held = false;
    bool emergency_brake = false;
    bool power_limited = true;
    uint32_t last_sequence = 0;
    uint64_t frames_applied = 0;
};

// Menerapkan frame kontrol ke actuator di sisi Pi.
// Throttle netral kecuali deadman ditahan dan rem darurat dilepas.
// Batas daya aktif sejak awal; tombol power limit men-toggle-nya.
class VehicleController {
public:
    explicit VehicleController(Actuator& actuator, VehicleConfig config = {});

    VehicleController(const VehicleController&) = delete;
    VehicleController& operator=(const VehicleController&) = delete;

    core::Result<void> apply(const ControlFrame& frame);

    // Throttle netral dan kemudi lurus
    core::Result<void> stop();

    // Pemetaan axis -1..1 ke pulse ESC; input negatif = maju
    int throttlePulse(double throttle) const;

    // Pemetaan axis -1..1 ke sudut servo dalam rentang aman
    int steeringAngle(double steering) const;

    bool powerLimited() const { return power_limited_; }
    VehicleStatus status() const { return status_; }
    const VehicleConfig& config() const { return config_; }

private:
    Actuator& actuator_;
    VehicleConfig config_;

    bool power_limited_ = true;
    bool power_button_held_ = false;
    VehicleStatus status_;
};

} // namespace carlink::control

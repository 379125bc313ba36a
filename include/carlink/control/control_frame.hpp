#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>

#include <carlink/core/error.hpp>

namespace carlink::control {

constexpr std::size_t kFrameSize = 16;
constexpr uint8_t kFrameFlags = 0x02;     // penanda versi frame 2
constexpr int kMaxButtons = 16;
constexpr double kAxisScale = 32767.0;
constexpr double kDefaultDeadzone = 0.1;

using FrameBytes = std::array<uint8_t, kFrameSize>;

// Frame input kontrol berukuran tetap, semua field big-endian:
// [seq u32][timestamp u32][throttle i16][steering i16][buttons u16][flags u8][reserved u8]
struct ControlFrame {
    uint32_t sequence = 0;
    uint32_t timestamp_ms = 0;   // 32 bit bawah dari epoch ms
    int16_t throttle_raw = 0;
    int16_t steering_raw = 0;
    uint16_t buttons = 0;
    uint8_t flags = kFrameFlags;
    uint8_t reserved = 0;

    double throttle() const { return throttle_raw / kAxisScale; }
    double steering() const { return steering_raw / kAxisScale; }

    bool pressed(int button) const {
        return button >= 0 && button < kMaxButtons && (buttons & (1u << button)) != 0;
    }

    // Indeks tombol yang ditekan, urut naik
    std::vector<int> pressedButtons() const;
};

// Kuantisasi axis ke i16: round(clamp(v, -1, 1) * 32767)
int16_t quantizeAxis(double value);

// |v| < deadzone -> 0, selain itu diskalakan ulang ke rentang penuh
double applyDeadzone(double value, double deadzone = kDefaultDeadzone);

// Bit i = tombol i ditekan; tombol di atas 15 diabaikan
uint16_t buttonMask(const std::vector<bool>& pressed);

FrameBytes encode(double throttle, double steering, uint16_t buttons,
                  uint32_t sequence, int64_t now_ms);

FrameBytes encode(const ControlFrame& frame);

core::Result<ControlFrame> decode(const uint8_t* data, std::size_t size);

inline core::Result<ControlFrame> decode(const std::vector<uint8_t>& data) {
    return decode(data.data(), data.size());
}

} // namespace carlink::control

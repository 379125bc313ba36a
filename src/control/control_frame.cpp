#include <carlink/control/control_frame.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace carlink::control {

namespace {

void writeU32(uint8_t* out, uint32_t value) {
    out[0] = (value >> 24) & 0xFF;
    out[1] = (value >> 16) & 0xFF;
    out[2] = (value >> 8) & 0xFF;
    out[3] = value & 0xFF;
}

void writeU16(uint8_t* out, uint16_t value) {
    out[0] = (value >> 8) & 0xFF;
    out[1] = value & 0xFF;
}

uint32_t readU32(const uint8_t* in) {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           static_cast<uint32_t>(in[3]);
}

uint16_t readU16(const uint8_t* in) {
    return static_cast<uint16_t>((static_cast<uint16_t>(in[0]) << 8) | in[1]);
}

} // namespace

std::vector<int> ControlFrame::pressedButtons() const {
    std::vector<int> result;
    for (int i = 0; i < kMaxButtons; ++i) {
        if (pressed(i)) result.push_back(i);
    }
    return result;
}

int16_t quantizeAxis(double value) {
    if (std::isnan(value)) return 0;
    double clamped = std::clamp(value, -1.0, 1.0);
    return static_cast<int16_t>(std::lround(clamped * kAxisScale));
}

double applyDeadzone(double value, double deadzone) {
    if (std::fabs(value) < deadzone) return 0.0;
    if (deadzone >= 1.0) return 0.0;

    double scaled = (std::fabs(value) - deadzone) / (1.0 - deadzone);
    return value < 0 ? -scaled : scaled;
}

uint16_t buttonMask(const std::vector<bool>& pressed) {
    uint16_t mask = 0;
    auto count = std::min<std::size_t>(pressed.size(), kMaxButtons);
    for (std::size_t i = 0; i < count; ++i) {
        if (pressed[i]) {
            mask |= static_cast<uint16_t>(1u << i);
        }
    }
    return mask;
}

FrameBytes encode(double throttle, double steering, uint16_t buttons,
                  uint32_t sequence, int64_t now_ms) {
    ControlFrame frame;
    frame.sequence = sequence;
    frame.timestamp_ms = static_cast<uint32_t>(static_cast<uint64_t>(now_ms) & 0xFFFFFFFFu);
    frame.throttle_raw = quantizeAxis(throttle);
    frame.steering_raw = quantizeAxis(steering);
    frame.buttons = buttons;
    return encode(frame);
}

FrameBytes encode(const ControlFrame& frame) {
    FrameBytes bytes{};
    writeU32(&bytes[0], frame.sequence);
    writeU32(&bytes[4], frame.timestamp_ms);
    writeU16(&bytes[8], static_cast<uint16_t>(frame.throttle_raw));
    writeU16(&bytes[10], static_cast<uint16_t>(frame.steering_raw));
    writeU16(&bytes[12], frame.buttons);
    bytes[14] = frame.flags;
    bytes[15] = 0;
    return bytes;
}

core::Result<ControlFrame> decode(const uint8_t* data, std::size_t size) {
    if (data == nullptr || size != kFrameSize) {
        return {core::ErrorCode::MalformedFrame,
            "Control frame must be 16 bytes, got " + std::to_string(size)};
    }

    ControlFrame frame;
    frame.sequence = readU32(&data[0]);
    frame.timestamp_ms = readU32(&data[4]);
    frame.throttle_raw = static_cast<int16_t>(readU16(&data[8]));
    frame.steering_raw = static_cast<int16_t>(readU16(&data[10]));
    frame.buttons = readU16(&data[12]);
    frame.flags = data[14];
    frame.reserved = data[15];
    return frame;
}

} // namespace carlink::control

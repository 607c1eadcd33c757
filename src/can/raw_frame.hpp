// src/can/raw_frame.hpp
#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace can {

// One frame as captured from the bus. Produced by a capture source
// (frame log, SocketCAN) and never modified afterwards.
struct RawFrame {
    double timestamp = 0.0;          // seconds since epoch
    std::string channel;             // e.g. "can0"
    uint32_t arbitration_id = 0;
    uint8_t length = 0;              // DLC, 0..8
    std::array<uint8_t, 8> payload{};

    // Bytes that are actually present (length clamped to the payload size)
    size_t size() const { return length > payload.size() ? payload.size() : length; }
};

} // namespace can

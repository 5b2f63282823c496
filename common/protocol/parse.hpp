#pragma once

#include "packets.hpp"
#include <cstdint>
#include <optional>
#include <span>

namespace g1::parse {

// Identify frame type
enum class FrameType {
    Unknown,
    Battery,
    DashboardAck,
    Heartbeat,
};

FrameType identify_frame(std::span<const uint8_t> data);

// True if the frame is a command response whose status byte is COMMAND_RESPONSE
bool is_acknowledged(std::span<const uint8_t> data);

// Status byte of a command response, nullopt if the frame is too short
std::optional<uint8_t> response_status(std::span<const uint8_t> data);

// Parse battery report: 2C 66 [level]
// Returns nullopt if the frame is not a battery report or level is out of range
std::optional<uint8_t> parse_battery(std::span<const uint8_t> data);

} // namespace g1::parse

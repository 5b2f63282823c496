#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace g1::packets {

// Helper to create packet from hex string literal
template<size_t N>
constexpr std::array<uint8_t, (N - 1) / 2> from_hex(const char (&hex)[N]) {
    std::array<uint8_t, (N - 1) / 2> result{};
    for (size_t i = 0; i < result.size(); ++i) {
        auto hex_to_nibble = [](char c) -> uint8_t {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return 0;
        };
        result[i] = (hex_to_nibble(hex[i * 2]) << 4) | hex_to_nibble(hex[i * 2 + 1]);
    }
    return result;
}

// Command opcodes (first byte of every frame, echoed in the response)
namespace opcodes {
    constexpr uint8_t DASHBOARD_OPEN = 0x22;
    constexpr uint8_t BATTERY = 0x2C;
    constexpr uint8_t HEARTBEAT = 0x25;
}

// Response status categories (second byte of a command response)
namespace status {
    constexpr uint8_t COMMAND_RESPONSE = 0xC9;  // command acknowledged
    constexpr uint8_t COMMAND_REJECTED = 0xCA;
}

// Packet headers for parsing
namespace headers {
    // Battery report: 2C 66 [level]
    constexpr auto BATTERY = from_hex("2C66");

    // Silent mode / dashboard ack: 22 C9
    constexpr auto DASHBOARD_ACK = from_hex("22C9");

    // Heartbeat echo: 25
    constexpr auto HEARTBEAT = from_hex("25");
}

// True when the frame begins with the given header bytes
template<size_t N>
inline bool starts_with(std::span<const uint8_t> data, const std::array<uint8_t, N>& header) {
    return data.size() >= N && std::equal(header.begin(), header.end(), data.begin());
}

} // namespace g1::packets

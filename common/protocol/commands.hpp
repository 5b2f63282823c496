#pragma once

#include "packets.hpp"
#include <cstdint>
#include <vector>

namespace g1::commands {

// Create a two-byte command frame: [opcode][argument]
inline std::vector<uint8_t> create(uint8_t opcode, uint8_t argument) {
    return {opcode, argument};
}

// Silent mode (dashboard) toggle, sent to the right unit only
namespace silent_mode {
    inline std::vector<uint8_t> set(bool enabled) {
        return create(packets::opcodes::DASHBOARD_OPEN, enabled ? 0x01 : 0x00);
    }
}

// Battery level request, answered with a battery report frame
namespace battery {
    inline std::vector<uint8_t> request() {
        return create(packets::opcodes::BATTERY, 0x01);
    }
}

// Keep-alive, echoed by the unit
namespace heartbeat {
    inline std::vector<uint8_t> ping(uint8_t sequence) {
        return create(packets::opcodes::HEARTBEAT, sequence);
    }
}

} // namespace g1::commands

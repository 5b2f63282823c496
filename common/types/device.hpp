#pragma once

#include "enums.hpp"
#include "battery.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace g1 {

// One advertised radio device seen during a scan
struct Advertisement {
    std::string name;
    std::string address;
    int16_t rssi = 0;
};

// One physical half of the glasses
struct Unit {
    Side side = Side::Left;
    std::string address;
    std::string name;
    bool paired = false;
    int16_t rssi = 0;  // discovery-time signal strength, advisory only
};

// At most one candidate per side from a single scan
using DiscoveryResult = std::map<Side, Unit>;

// Device-wide state held for the lifetime of the connector
struct DeviceSessionState {
    bool silent_mode = false;
    BatteryLevels battery = empty_battery_levels();
};

} // namespace g1

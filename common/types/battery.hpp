#pragma once

#include "enums.hpp"
#include <cstdint>
#include <map>
#include <optional>

namespace g1 {

// Battery percentage (0-100) per unit, nullopt until the unit reports
using BatteryLevels = std::map<Side, std::optional<uint8_t>>;

inline BatteryLevels empty_battery_levels() {
    return {{Side::Left, std::nullopt}, {Side::Right, std::nullopt}};
}

constexpr uint8_t battery_level_max = 100;

} // namespace g1

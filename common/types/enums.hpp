#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace g1 {

enum class Side : uint8_t {
    Left = 0,
    Right = 1,
};

constexpr std::array<Side, 2> all_sides = {Side::Left, Side::Right};

inline std::string_view to_string(Side side) {
    switch (side) {
        case Side::Left: return "left";
        case Side::Right: return "right";
    }
    return "unknown";
}

inline std::optional<Side> side_from_string(std::string_view s) {
    if (s == "left") return Side::Left;
    if (s == "right") return Side::Right;
    return std::nullopt;
}

// Human-readable unit label used in console output ("Left glass")
inline std::string_view display_label(Side side) {
    return side == Side::Left ? "Left glass" : "Right glass";
}

// Per-unit pairing lifecycle
enum class UnitState : uint8_t {
    Unknown,
    Discovered,
    Pairing,
    Verifying,
    Paired,
};

inline std::string_view to_string(UnitState state) {
    switch (state) {
        case UnitState::Unknown: return "unknown";
        case UnitState::Discovered: return "discovered";
        case UnitState::Pairing: return "pairing";
        case UnitState::Verifying: return "verifying";
        case UnitState::Paired: return "paired";
    }
    return "unknown";
}

} // namespace g1

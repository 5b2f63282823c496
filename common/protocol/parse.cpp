#include "parse.hpp"
#include <types/battery.hpp>

namespace g1::parse {

FrameType identify_frame(std::span<const uint8_t> data) {
    using namespace packets;

    if (starts_with(data, headers::BATTERY)) return FrameType::Battery;
    if (starts_with(data, headers::DASHBOARD_ACK)) return FrameType::DashboardAck;
    if (starts_with(data, headers::HEARTBEAT)) return FrameType::Heartbeat;

    return FrameType::Unknown;
}

std::optional<uint8_t> response_status(std::span<const uint8_t> data) {
    if (data.size() < 2) {
        return std::nullopt;
    }
    return data[1];
}

bool is_acknowledged(std::span<const uint8_t> data) {
    auto status = response_status(data);
    return status && *status == packets::status::COMMAND_RESPONSE;
}

std::optional<uint8_t> parse_battery(std::span<const uint8_t> data) {
    if (!packets::starts_with(data, packets::headers::BATTERY)) {
        return std::nullopt;
    }

    if (data.size() < 3) {
        return std::nullopt;
    }

    uint8_t level = data[2];
    if (level > battery_level_max) {
        return std::nullopt;
    }
    return level;
}

} // namespace g1::parse

#include "device.hpp"

#include <protocol/commands.hpp>
#include <protocol/parse.hpp>

#include <string>

namespace g1 {

namespace {
constexpr const char* TAG = "device";
}

Status DeviceManager::set_silent_mode(bool enabled) {
    if (enabled == state_.silent_mode) {
        return Status::success();
    }

    Connection* right = callbacks_.connection_for ? callbacks_.connection_for(Side::Right) : nullptr;
    if (!right) {
        logger_.error(TAG, "Error setting silent mode: right glass not connected");
        return Status::failure(ErrorKind::Connection, "right glass not connected");
    }

    auto frame = commands::silent_mode::set(enabled);
    auto result = dispatcher_.send_command(*right, frame, true);
    if (!result) {
        logger_.error(TAG, "Error setting silent mode: " + result.status.message);
        return result.status;
    }

    const auto& response = *result;
    if (response && parse::is_acknowledged(*response)) {
        state_.silent_mode = enabled;
        logger_.info(TAG, std::string("Silent mode ") + (enabled ? "enabled" : "disabled"));
        if (callbacks_.on_status_changed) {
            callbacks_.on_status_changed();
        }
        return Status::success();
    }

    std::string code = "None";
    if (response) {
        if (auto status = parse::response_status(*response)) {
            code = std::to_string(*status);
        }
    }
    logger_.warning(TAG, "Failed to set silent mode: unexpected response " + code);
    return Status::failure(ErrorKind::Protocol, "unexpected response " + code);
}

void DeviceManager::update_battery_level(Side side, uint8_t level) {
    state_.battery[side] = level;
    logger_.debug(TAG, "Battery level updated for " + std::string(to_string(side)) + ": " +
                       std::to_string(level) + "%");
}

void DeviceManager::update_battery_level(std::string_view side, uint8_t level) {
    if (auto parsed = side_from_string(side)) {
        update_battery_level(*parsed, level);
    }
}

} // namespace g1

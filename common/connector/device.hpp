#pragma once

#include "command_dispatcher.hpp"
#include "logger.hpp"
#include "result.hpp"
#include "transport.hpp"
#include <types/battery.hpp>
#include <types/device.hpp>
#include <types/enums.hpp>

#include <cstdint>
#include <functional>
#include <string_view>

namespace g1 {

struct DeviceCallbacks {
    // Live connection to a unit, nullptr if that unit is not connected
    std::function<Connection*(Side)> connection_for;
    // Status refresh after a confirmed device-wide change
    std::function<void()> on_status_changed;
};

// Device-wide session state (silent mode, battery) and the commands that change it
class DeviceManager {
public:
    DeviceManager(CommandDispatcher& dispatcher, Logger& logger)
        : dispatcher_(dispatcher), logger_(logger) {}

    void set_callbacks(DeviceCallbacks callbacks) { callbacks_ = std::move(callbacks); }

    bool silent_mode() const { return state_.silent_mode; }

    // Sends the silent mode frame to the right unit; state only changes on an ack
    Status set_silent_mode(bool enabled);

    // Copy of the current readings
    BatteryLevels battery_level() const { return state_.battery; }

    void update_battery_level(Side side, uint8_t level);

    // Telemetry entry point; unrecognized side names are ignored
    void update_battery_level(std::string_view side, uint8_t level);

private:
    CommandDispatcher& dispatcher_;
    Logger& logger_;
    DeviceCallbacks callbacks_;
    DeviceSessionState state_;
};

} // namespace g1

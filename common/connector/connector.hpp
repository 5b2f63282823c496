#pragma once

#include "clock.hpp"
#include "command_dispatcher.hpp"
#include "config_store.hpp"
#include "device.hpp"
#include "logger.hpp"
#include "pairing.hpp"
#include "result.hpp"
#include "transport.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace g1 {

// Owns the session: pairing, device state, command dispatch and the live
// connections to both units. One instance per running daemon.
class Connector {
public:
    Connector(Transport& transport, ConfigStore& config, Logger& logger, Clock& clock,
              PairingTimings timings = {});
    ~Connector();

    Connector(const Connector&) = delete;
    Connector& operator=(const Connector&) = delete;

    PairingManager& pairing() { return pairing_; }
    DeviceManager& device() { return device_; }
    CommandDispatcher& dispatcher() { return dispatcher_; }
    ConfigStore& config() { return config_; }

    // Open live connections to both saved units
    Status connect_units();

    // Close both live connections
    void disconnect_units();

    bool connected(Side side) const;
    bool connected() const { return connected(Side::Left) && connected(Side::Right); }

    Connection* connection(Side side);

    // Best-effort battery query on a short-lived connection, used after pairing
    bool query_initial_state(Side side);

    // Ask a live unit for its battery level
    Status request_battery(Side side);

    // Keep-alive on both live connections
    void heartbeat();

    // Drain pending frames on live connections (telemetry); call from the event loop
    void poll();

    // Called with no arguments whenever status visible to clients changes
    void set_status_listener(std::function<void()> listener) { on_status_changed_ = std::move(listener); }

private:
    void handle_frame(Side side, const std::vector<uint8_t>& frame);
    void handle_connection_lost(const std::string& address);
    void notify_status();

    Transport& transport_;
    ConfigStore& config_;
    Logger& logger_;

    CommandDispatcher dispatcher_;
    PairingManager pairing_;
    DeviceManager device_;

    std::array<std::unique_ptr<Connection>, 2> connections_;
    uint8_t heartbeat_seq_ = 0;
    std::function<void()> on_status_changed_;
};

} // namespace g1

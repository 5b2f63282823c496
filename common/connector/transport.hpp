#pragma once

#include "result.hpp"
#include <types/device.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace g1 {

// Open link to one physical unit
class Connection {
public:
    virtual ~Connection() = default;

    virtual const std::string& address() const = 0;
    virtual bool is_connected() const = 0;
};

// Radio transport consumed by the connector (BlueZ on Linux, fakes in tests)
class Transport {
public:
    virtual ~Transport() = default;

    // Scan for advertising devices for the given duration
    virtual Result<std::vector<Advertisement>> scan(std::chrono::milliseconds timeout) = 0;

    // Open a connection, bounded by timeout
    virtual Result<std::unique_ptr<Connection>> connect(const std::string& address,
                                                        std::chrono::milliseconds timeout) = 0;

    // Pairing handshake on an open connection
    virtual Status pair(Connection& conn) = 0;

    virtual void disconnect(Connection& conn) = 0;

    // Send one raw frame
    virtual Status send(Connection& conn, std::span<const uint8_t> frame) = 0;

    // Wait up to timeout for the next received frame, nullopt on timeout
    virtual std::optional<std::vector<uint8_t>> receive(Connection& conn,
                                                        std::chrono::milliseconds timeout) = 0;

    // Invoked with the unit address when a live connection drops
    void set_connection_lost_handler(std::function<void(const std::string&)> handler) {
        on_connection_lost_ = std::move(handler);
    }

protected:
    void notify_connection_lost(const std::string& address) {
        if (on_connection_lost_) on_connection_lost_(address);
    }

private:
    std::function<void(const std::string&)> on_connection_lost_;
};

} // namespace g1

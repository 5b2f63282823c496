#pragma once

#include "bluez.hpp"

#include <connector/transport.hpp>

#include <dbus/dbus.h>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace bluez {

class BluezTransport;

// Live link to one unit: BlueZ device plus its UART characteristics
class BluezConnection : public g1::Connection {
public:
    BluezConnection(BluezTransport* owner, std::string address, std::string device_path,
                    std::string tx_path, std::string rx_path);
    ~BluezConnection() override;

    BluezConnection(const BluezConnection&) = delete;
    BluezConnection& operator=(const BluezConnection&) = delete;

    const std::string& address() const override { return address_; }
    bool is_connected() const override { return connected_; }

    const std::string& device_path() const { return device_path_; }
    const std::string& tx_path() const { return tx_path_; }
    const std::string& rx_path() const { return rx_path_; }

private:
    friend class BluezTransport;

    BluezTransport* owner_;
    std::string address_;
    std::string device_path_;
    std::string tx_path_;
    std::string rx_path_;
    bool connected_ = true;
    std::deque<std::vector<uint8_t>> inbox_;
};

// g1::Transport over the BlueZ D-Bus API on the system bus
class BluezTransport : public g1::Transport {
public:
    // Takes a reference on system_bus
    explicit BluezTransport(DBusConnection* system_bus);
    ~BluezTransport() override;

    BluezTransport(const BluezTransport&) = delete;
    BluezTransport& operator=(const BluezTransport&) = delete;

    g1::Result<std::vector<g1::Advertisement>> scan(std::chrono::milliseconds timeout) override;
    g1::Result<std::unique_ptr<g1::Connection>> connect(const std::string& address,
                                                        std::chrono::milliseconds timeout) override;
    g1::Status pair(g1::Connection& conn) override;
    void disconnect(g1::Connection& conn) override;
    g1::Status send(g1::Connection& conn, std::span<const uint8_t> frame) override;
    std::optional<std::vector<uint8_t>> receive(g1::Connection& conn,
                                                std::chrono::milliseconds timeout) override;

    // Dispatch pending system bus messages (call when the fd is readable)
    void process_pending();

    // File descriptor of the system bus for poll()
    int get_fd() const;

private:
    friend class BluezConnection;

    static DBusHandlerResult filter(DBusConnection* conn, DBusMessage* msg, void* data);

    // Read and dispatch bus traffic for up to timeout, or until done() holds
    void pump(std::chrono::milliseconds timeout, const std::function<bool()>& done = {});

    void forget(BluezConnection* conn);
    void on_notification(const std::string& characteristic_path, std::vector<uint8_t> value);
    void on_device_disconnected(const std::string& device_path);

    DBusConnection* bus_;
    Callbacks callbacks_;
    std::map<std::string, BluezConnection*> connections_;  // keyed by device path
    std::vector<std::string> pending_lost_;                 // addresses, reported by process_pending()
};

} // namespace bluez

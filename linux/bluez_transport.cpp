#include "bluez_transport.hpp"

#include <iostream>

namespace bluez {

namespace {

constexpr int PAIR_TIMEOUT_MS = 30000;
constexpr std::chrono::milliseconds SERVICES_POLL_INTERVAL{100};

int to_ms(std::chrono::milliseconds d) {
    return d.count() < 0 ? 0 : static_cast<int>(d.count());
}

} // namespace

BluezConnection::BluezConnection(BluezTransport* owner, std::string address, std::string device_path,
                                 std::string tx_path, std::string rx_path)
    : owner_(owner),
      address_(std::move(address)),
      device_path_(std::move(device_path)),
      tx_path_(std::move(tx_path)),
      rx_path_(std::move(rx_path)) {}

BluezConnection::~BluezConnection() {
    if (owner_) owner_->forget(this);
}

BluezTransport::BluezTransport(DBusConnection* system_bus) : bus_(system_bus) {
    dbus_connection_ref(bus_);

    callbacks_.on_notification = [this](const std::string& path, std::vector<uint8_t> value) {
        on_notification(path, std::move(value));
    };
    callbacks_.on_device_disconnected = [this](const std::string& path) {
        on_device_disconnected(path);
    };

    setup_signal_handlers(bus_);
    dbus_connection_add_filter(bus_, filter, this, nullptr);
}

BluezTransport::~BluezTransport() {
    for (auto& [path, conn] : connections_) {
        conn->owner_ = nullptr;
    }
    dbus_connection_remove_filter(bus_, filter, this);
    dbus_connection_unref(bus_);
}

DBusHandlerResult BluezTransport::filter(DBusConnection* conn, DBusMessage* msg, void* data) {
    auto* self = static_cast<BluezTransport*>(data);

    if (dbus_message_get_type(msg) == DBUS_MESSAGE_TYPE_SIGNAL) {
        if (handle_signal(conn, msg, &self->callbacks_)) {
            return DBUS_HANDLER_RESULT_HANDLED;
        }
    }
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

void BluezTransport::pump(std::chrono::milliseconds timeout, const std::function<bool()>& done) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    do {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (!dbus_connection_read_write(bus_, to_ms(remaining))) {
            std::cerr << "bluez: system bus disconnected" << std::endl;
            return;
        }
        while (dbus_connection_dispatch(bus_) == DBUS_DISPATCH_DATA_REMAINS) {}

        if (done && done()) return;
    } while (std::chrono::steady_clock::now() < deadline);
}

void BluezTransport::process_pending() {
    pump(std::chrono::milliseconds(0));

    // Reported here rather than from pump() so handlers may drop connections
    auto lost = std::move(pending_lost_);
    pending_lost_.clear();
    for (const auto& address : lost) {
        notify_connection_lost(address);
    }
}

int BluezTransport::get_fd() const {
    int fd = -1;
    if (!dbus_connection_get_unix_fd(bus_, &fd)) {
        return -1;
    }
    return fd;
}

g1::Result<std::vector<g1::Advertisement>> BluezTransport::scan(std::chrono::milliseconds timeout) {
    using ScanResult = g1::Result<std::vector<g1::Advertisement>>;

    if (!start_discovery(bus_)) {
        return ScanResult::failure(g1::ErrorKind::Discovery, "could not start discovery");
    }

    pump(timeout);
    auto devices = list_devices(bus_);
    stop_discovery(bus_);

    std::vector<g1::Advertisement> result;
    for (auto& dev : devices) {
        if (dev.name.empty()) continue;
        result.push_back({std::move(dev.name), std::move(dev.address), dev.rssi});
    }

    std::cout << "bluez: scan found " << result.size() << " named devices" << std::endl;
    return ScanResult::success(std::move(result));
}

g1::Result<std::unique_ptr<g1::Connection>> BluezTransport::connect(const std::string& address,
                                                                    std::chrono::milliseconds timeout) {
    using ConnectResult = g1::Result<std::unique_ptr<g1::Connection>>;

    auto adapter = get_adapter_path(bus_);
    if (!adapter) {
        return ConnectResult::failure(g1::ErrorKind::Connection, "no adapter found");
    }

    const auto started = std::chrono::steady_clock::now();
    std::string device_path = get_device_path(*adapter, address);

    if (!connect_device(bus_, device_path, to_ms(timeout))) {
        return ConnectResult::failure(g1::ErrorKind::Connection, "connect to " + address + " failed");
    }

    // GATT characteristics appear once services are resolved
    while (!get_bool_property(bus_, device_path.c_str(), "org.bluez.Device1", "ServicesResolved")) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (elapsed >= timeout) {
            disconnect_device(bus_, device_path);
            return ConnectResult::failure(g1::ErrorKind::Connection,
                                          "timed out resolving services on " + address);
        }
        pump(SERVICES_POLL_INTERVAL);
    }

    auto tx = find_characteristic(bus_, device_path, UART_TX_UUID);
    auto rx = find_characteristic(bus_, device_path, UART_RX_UUID);
    if (!tx || !rx) {
        disconnect_device(bus_, device_path);
        return ConnectResult::failure(g1::ErrorKind::Connection, address + " has no UART service");
    }

    if (!start_notify(bus_, *rx)) {
        disconnect_device(bus_, device_path);
        return ConnectResult::failure(g1::ErrorKind::Connection, "could not enable notifications on " + address);
    }

    auto conn = std::make_unique<BluezConnection>(this, address, device_path, *tx, *rx);
    connections_[device_path] = conn.get();

    std::cout << "bluez: connected to " << address << std::endl;
    return ConnectResult::success(std::move(conn));
}

g1::Status BluezTransport::pair(g1::Connection& conn) {
    auto* bc = dynamic_cast<BluezConnection*>(&conn);
    if (!bc || !bc->is_connected()) {
        return g1::Status::failure(g1::ErrorKind::Connection, "not connected to " + conn.address());
    }

    if (!pair_device(bus_, bc->device_path(), PAIR_TIMEOUT_MS)) {
        return g1::Status::failure(g1::ErrorKind::Connection, "pairing with " + conn.address() + " failed");
    }

    // Pairing succeeded even if trusting fails; reconnects then need the agent
    if (!trust_device(bus_, bc->device_path())) {
        std::cerr << "bluez: could not trust " << conn.address() << std::endl;
    }
    return g1::Status::success();
}

void BluezTransport::disconnect(g1::Connection& conn) {
    auto* bc = dynamic_cast<BluezConnection*>(&conn);
    if (!bc || !bc->connected_) return;

    bc->connected_ = false;
    if (!disconnect_device(bus_, bc->device_path())) {
        std::cerr << "bluez: disconnect from " << conn.address() << " failed" << std::endl;
    }
}

g1::Status BluezTransport::send(g1::Connection& conn, std::span<const uint8_t> frame) {
    auto* bc = dynamic_cast<BluezConnection*>(&conn);
    if (!bc || !bc->is_connected()) {
        return g1::Status::failure(g1::ErrorKind::Connection, "not connected to " + conn.address());
    }

    if (!write_value(bus_, bc->tx_path(), frame)) {
        return g1::Status::failure(g1::ErrorKind::Connection, "write to " + conn.address() + " failed");
    }
    return g1::Status::success();
}

std::optional<std::vector<uint8_t>> BluezTransport::receive(g1::Connection& conn,
                                                            std::chrono::milliseconds timeout) {
    auto* bc = dynamic_cast<BluezConnection*>(&conn);
    if (!bc) return std::nullopt;

    if (bc->inbox_.empty()) {
        pump(timeout, [bc]() { return !bc->inbox_.empty() || !bc->connected_; });
    }

    if (bc->inbox_.empty()) return std::nullopt;

    auto frame = std::move(bc->inbox_.front());
    bc->inbox_.pop_front();
    return frame;
}

void BluezTransport::forget(BluezConnection* conn) {
    auto it = connections_.find(conn->device_path());
    if (it != connections_.end() && it->second == conn) {
        connections_.erase(it);
    }
}

void BluezTransport::on_notification(const std::string& characteristic_path, std::vector<uint8_t> value) {
    for (auto& [path, conn] : connections_) {
        if (conn->rx_path() == characteristic_path) {
            conn->inbox_.push_back(std::move(value));
            return;
        }
    }
}

void BluezTransport::on_device_disconnected(const std::string& device_path) {
    auto it = connections_.find(device_path);
    if (it == connections_.end() || !it->second->connected_) return;

    it->second->connected_ = false;
    pending_lost_.push_back(it->second->address());
}

} // namespace bluez

#pragma once

#include <dbus/dbus.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace bluez {

// Nordic UART service used by the glasses for command frames
constexpr const char* UART_TX_UUID = "6e400002-b5a3-f393-e0a9-e50e24dcca9e";  // host -> unit
constexpr const char* UART_RX_UUID = "6e400003-b5a3-f393-e0a9-e50e24dcca9e";  // unit -> host (notify)

// Device info
struct DeviceInfo {
    std::string path;       // D-Bus object path
    std::string address;    // MAC address
    std::string name;
    int16_t rssi = 0;
    bool connected = false;
    bool paired = false;
};

// Callbacks for BlueZ events
struct Callbacks {
    std::function<void(const std::string& device_path)> on_device_disconnected;
    std::function<void(const std::string& characteristic_path, std::vector<uint8_t> value)> on_notification;
};

// Get adapter path (usually /org/bluez/hci0)
std::optional<std::string> get_adapter_path(DBusConnection* conn);

// All devices known to BlueZ (discovered, paired or connected)
std::vector<DeviceInfo> list_devices(DBusConnection* conn);

// Get a bool property of a BlueZ object
bool get_bool_property(DBusConnection* conn, const char* path, const char* iface, const char* prop);

// Start BLE discovery (LE transport only)
bool start_discovery(DBusConnection* conn);

// Stop discovery
void stop_discovery(DBusConnection* conn);

// Connect device via BlueZ, blocking up to timeout_ms
bool connect_device(DBusConnection* conn, const std::string& device_path, int timeout_ms);

// Disconnect device
bool disconnect_device(DBusConnection* conn, const std::string& device_path);

// Pair device, blocking up to timeout_ms
bool pair_device(DBusConnection* conn, const std::string& device_path, int timeout_ms);

// Trust device (for auto-reconnect)
bool trust_device(DBusConnection* conn, const std::string& device_path);

// Find a GATT characteristic by UUID under a device, returns its object path
std::optional<std::string> find_characteristic(DBusConnection* conn, const std::string& device_path,
                                               const char* uuid);

// Enable notifications on a characteristic
bool start_notify(DBusConnection* conn, const std::string& characteristic_path);

// Write a value to a characteristic (write without response)
bool write_value(DBusConnection* conn, const std::string& characteristic_path,
                 std::span<const uint8_t> data);

// Get BlueZ device path from adapter path and MAC address
std::string get_device_path(const std::string& adapter_path, const std::string& mac_address);

// Set up signal matching for BlueZ events (PropertiesChanged)
void setup_signal_handlers(DBusConnection* conn);

// Process a D-Bus message that might be a BlueZ signal
// Returns true if it was handled
bool handle_signal(DBusConnection* conn, DBusMessage* msg, const Callbacks* callbacks);

} // namespace bluez

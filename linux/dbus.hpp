#pragma once

#include <dbus/dbus.h>
#include <connector/connector.hpp>
#include <connector/result.hpp>
#include <functional>
#include <string>

namespace dbus_service {

// D-Bus service configuration
constexpr const char* SERVICE_NAME = "com.evenrealities.G1";
constexpr const char* OBJECT_PATH = "/com/evenrealities/G1";
constexpr const char* INTERFACE_NAME = "com.evenrealities.G1";

// Callbacks for method invocations; a failed status becomes a D-Bus error reply
struct Callbacks {
    std::function<g1::Status()> on_pair;
    std::function<g1::Status()> on_unpair;
    std::function<g1::Status()> on_verify;
    std::function<g1::Status(bool)> on_set_silent_mode;
};

// Current state exposed via D-Bus
struct State {
    bool connected = false;
    bool paired = false;
    bool silent_mode = false;
    std::string left_name;
    std::string right_name;
    int32_t battery_left = -1;
    int32_t battery_right = -1;
};

// Error name for a failed status, e.g. com.evenrealities.G1.Error.Connection
std::string error_name(g1::ErrorKind kind);

// Initialize D-Bus service, returns connection (caller owns)
// Sets up object path and method handlers
DBusConnection* init(Callbacks* callbacks, State* state);

// Request the service name on the bus
bool request_name(DBusConnection* conn);

// Emit PropertiesChanged signal for given properties
void emit_properties_changed(DBusConnection* conn, const State& state,
                              const char** property_names, int num_properties);

// Refresh state from the connector and emit signals for what changed
void update_from_connector(DBusConnection* conn, State* state, g1::Connector& connector);

// Process pending D-Bus messages (call in event loop)
void process_pending(DBusConnection* conn);

// Get file descriptor for polling
int get_fd(DBusConnection* conn);

// Cleanup
void cleanup(DBusConnection* conn);

} // namespace dbus_service

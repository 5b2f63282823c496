#include "dbus.hpp"
#include <cstring>
#include <iostream>
#include <vector>

namespace dbus_service {

// Global pointers for callbacks (set in init)
static Callbacks* g_callbacks = nullptr;
static State* g_state = nullptr;

static constexpr const char* PROPERTIES_IFACE = "org.freedesktop.DBus.Properties";
static constexpr const char* INTROSPECTABLE_IFACE = "org.freedesktop.DBus.Introspectable";

namespace {

template<int Type, typename T>
void append_variant(DBusMessageIter* iter, const char* signature, T value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, signature, &variant);
    dbus_message_iter_append_basic(&variant, Type, &value);
    dbus_message_iter_close_container(iter, &variant);
}

void append_bool(DBusMessageIter* iter, bool value) {
    append_variant<DBUS_TYPE_BOOLEAN, dbus_bool_t>(iter, "b", value);
}

void append_string(DBusMessageIter* iter, const std::string& value) {
    append_variant<DBUS_TYPE_STRING, const char*>(iter, "s", value.c_str());
}

void append_int32(DBusMessageIter* iter, int32_t value) {
    append_variant<DBUS_TYPE_INT32, dbus_int32_t>(iter, "i", value);
}

struct Property {
    const char* name;
    const char* signature;
    bool writable;
    void (*append)(DBusMessageIter*, const State&);
};

const Property PROPERTIES[] = {
    {"Connected", "b", false, [](DBusMessageIter* it, const State& s) { append_bool(it, s.connected); }},
    {"Paired", "b", false, [](DBusMessageIter* it, const State& s) { append_bool(it, s.paired); }},
    {"SilentMode", "b", true, [](DBusMessageIter* it, const State& s) { append_bool(it, s.silent_mode); }},
    {"LeftName", "s", false, [](DBusMessageIter* it, const State& s) { append_string(it, s.left_name); }},
    {"RightName", "s", false, [](DBusMessageIter* it, const State& s) { append_string(it, s.right_name); }},
    {"BatteryLeft", "i", false, [](DBusMessageIter* it, const State& s) { append_int32(it, s.battery_left); }},
    {"BatteryRight", "i", false, [](DBusMessageIter* it, const State& s) { append_int32(it, s.battery_right); }},
};

const Property* find_property(const char* name) {
    for (const auto& prop : PROPERTIES) {
        if (strcmp(prop.name, name) == 0) return &prop;
    }
    return nullptr;
}

// Introspection XML; the property list comes from PROPERTIES
const std::string& introspection_xml() {
    static const std::string xml = [] {
        std::string out =
            "<!DOCTYPE node PUBLIC \"-//freedesktop//DTD D-BUS Object Introspection 1.0//EN\"\n"
            "\"http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd\">\n"
            "<node>\n";
        out += std::string("  <interface name=\"") + INTERFACE_NAME + "\">\n";
        out += "    <method name=\"Pair\"/>\n"
               "    <method name=\"Unpair\"/>\n"
               "    <method name=\"Verify\"/>\n"
               "    <method name=\"SetSilentMode\">\n"
               "      <arg name=\"enabled\" type=\"b\" direction=\"in\"/>\n"
               "    </method>\n";
        for (const auto& prop : PROPERTIES) {
            out += std::string("    <property name=\"") + prop.name + "\" type=\"" + prop.signature +
                   "\" access=\"" + (prop.writable ? "readwrite" : "read") + "\"/>\n";
        }
        out += "  </interface>\n";
        out += std::string("  <interface name=\"") + PROPERTIES_IFACE + "\">\n";
        out += "    <method name=\"Get\">\n"
               "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
               "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
               "      <arg name=\"value\" type=\"v\" direction=\"out\"/>\n"
               "    </method>\n"
               "    <method name=\"Set\">\n"
               "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
               "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
               "      <arg name=\"value\" type=\"v\" direction=\"in\"/>\n"
               "    </method>\n"
               "    <method name=\"GetAll\">\n"
               "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
               "      <arg name=\"properties\" type=\"a{sv}\" direction=\"out\"/>\n"
               "    </method>\n"
               "    <signal name=\"PropertiesChanged\">\n"
               "      <arg name=\"interface\" type=\"s\"/>\n"
               "      <arg name=\"changed_properties\" type=\"a{sv}\"/>\n"
               "      <arg name=\"invalidated_properties\" type=\"as\"/>\n"
               "    </signal>\n"
               "  </interface>\n";
        out += std::string("  <interface name=\"") + INTROSPECTABLE_IFACE + "\">\n";
        out += "    <method name=\"Introspect\">\n"
               "      <arg name=\"xml\" type=\"s\" direction=\"out\"/>\n"
               "    </method>\n"
               "  </interface>\n"
               "</node>\n";
        return out;
    }();
    return xml;
}

// Append {name: value} entries as an a{sv} container
void append_property_dict(DBusMessageIter* iter, const State& state,
                          const std::vector<const Property*>& props) {
    DBusMessageIter dict, entry;
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &dict);

    for (const auto* prop : props) {
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &prop->name);
        prop->append(&entry, state);
        dbus_message_iter_close_container(&dict, &entry);
    }

    dbus_message_iter_close_container(iter, &dict);
}

// Checks the leading interface argument of a Properties call.
// Returns an error reply, or nullptr with iter positioned after it.
DBusMessage* expect_our_interface(DBusMessage* msg, DBusMessageIter* iter) {
    if (!dbus_message_iter_init(msg, iter) ||
        dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_STRING) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    const char* iface;
    dbus_message_iter_get_basic(iter, &iface);
    dbus_message_iter_next(iter);

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }
    return nullptr;
}

// Reads the property name argument; on failure *error holds the reply
const Property* read_property_arg(DBusMessage* msg, DBusMessageIter* iter, DBusMessage** error) {
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_STRING) {
        *error = dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
        return nullptr;
    }

    const char* name;
    dbus_message_iter_get_basic(iter, &name);
    dbus_message_iter_next(iter);

    const Property* prop = find_property(name);
    if (!prop) {
        *error = dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_PROPERTY, "Unknown property");
    }
    return prop;
}

} // namespace

std::string error_name(g1::ErrorKind kind) {
    const char* suffix = "Failed";
    switch (kind) {
        case g1::ErrorKind::None: break;
        case g1::ErrorKind::Discovery: suffix = "Discovery"; break;
        case g1::ErrorKind::Connection: suffix = "Connection"; break;
        case g1::ErrorKind::Protocol: suffix = "Protocol"; break;
        case g1::ErrorKind::ConfigIncomplete: suffix = "ConfigIncomplete"; break;
        case g1::ErrorKind::Storage: suffix = "Storage"; break;
    }
    return std::string(INTERFACE_NAME) + ".Error." + suffix;
}

static DBusMessage* reply_for_status(DBusMessage* msg, const std::function<g1::Status()>& fn) {
    if (!fn) {
        return dbus_message_new_error(msg, DBUS_ERROR_NOT_SUPPORTED, "Not available");
    }

    auto status = fn();
    if (!status) {
        std::string name = error_name(status.error);
        return dbus_message_new_error(msg, name.c_str(), status.message.c_str());
    }
    return dbus_message_new_method_return(msg);
}

static DBusMessage* set_silent_mode(DBusMessage* msg, bool enabled) {
    std::cout << "dbus: SetSilentMode(" << (enabled ? "true" : "false") << ") called" << std::endl;

    std::function<g1::Status()> fn;
    if (g_callbacks && g_callbacks->on_set_silent_mode) {
        fn = [enabled]() { return g_callbacks->on_set_silent_mode(enabled); };
    }
    return reply_for_status(msg, fn);
}

static DBusMessage* handle_get(DBusMessage* msg, const State& state) {
    DBusMessageIter args;
    if (DBusMessage* error = expect_our_interface(msg, &args)) return error;

    DBusMessage* error = nullptr;
    const Property* prop = read_property_arg(msg, &args, &error);
    if (!prop) return error;

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);
    prop->append(&iter, state);
    return reply;
}

static DBusMessage* handle_get_all(DBusMessage* msg, const State& state) {
    DBusMessageIter args;
    if (DBusMessage* error = expect_our_interface(msg, &args)) return error;

    std::vector<const Property*> all;
    for (const auto& prop : PROPERTIES) all.push_back(&prop);

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);
    append_property_dict(&iter, state, all);
    return reply;
}

// SilentMode is the only writable property
static DBusMessage* handle_set(DBusMessage* msg) {
    DBusMessageIter args;
    if (DBusMessage* error = expect_our_interface(msg, &args)) return error;

    DBusMessage* error = nullptr;
    const Property* prop = read_property_arg(msg, &args, &error);
    if (!prop) return error;

    if (!prop->writable) {
        return dbus_message_new_error(msg, DBUS_ERROR_PROPERTY_READ_ONLY, "Property is read-only");
    }

    if (dbus_message_iter_get_arg_type(&args) != DBUS_TYPE_VARIANT) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected variant");
    }
    DBusMessageIter variant;
    dbus_message_iter_recurse(&args, &variant);
    if (dbus_message_iter_get_arg_type(&variant) != DBUS_TYPE_BOOLEAN) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected boolean");
    }

    dbus_bool_t enabled;
    dbus_message_iter_get_basic(&variant, &enabled);
    return set_silent_mode(msg, enabled);
}

static DBusMessage* handle_method(DBusMessage* msg, const char* member) {
    if (strcmp(member, "SetSilentMode") == 0) {
        dbus_bool_t enabled;
        if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_BOOLEAN, &enabled, DBUS_TYPE_INVALID)) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected boolean argument");
        }
        return set_silent_mode(msg, enabled);
    }

    const std::function<g1::Status()>* fn = nullptr;
    if (strcmp(member, "Pair") == 0) fn = &g_callbacks->on_pair;
    else if (strcmp(member, "Unpair") == 0) fn = &g_callbacks->on_unpair;
    else if (strcmp(member, "Verify") == 0) fn = &g_callbacks->on_verify;

    if (!fn) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_METHOD, "Unknown method");
    }

    std::cout << "dbus: " << member << "() called" << std::endl;
    return reply_for_status(msg, *fn);
}

static DBusHandlerResult message_handler(DBusConnection* conn, DBusMessage* msg, void*) {
    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);
    const char* path = dbus_message_get_path(msg);

    if (!path || strcmp(path, OBJECT_PATH) != 0 || !iface || !member) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    DBusMessage* reply = nullptr;

    if (strcmp(iface, INTROSPECTABLE_IFACE) == 0 && strcmp(member, "Introspect") == 0) {
        const char* xml = introspection_xml().c_str();
        reply = dbus_message_new_method_return(msg);
        dbus_message_append_args(reply, DBUS_TYPE_STRING, &xml, DBUS_TYPE_INVALID);
    } else if (strcmp(iface, PROPERTIES_IFACE) == 0 && g_state) {
        if (strcmp(member, "Get") == 0) reply = handle_get(msg, *g_state);
        else if (strcmp(member, "GetAll") == 0) reply = handle_get_all(msg, *g_state);
        else if (strcmp(member, "Set") == 0) reply = handle_set(msg);
    } else if (strcmp(iface, INTERFACE_NAME) == 0 && g_callbacks) {
        reply = handle_method(msg, member);
    }

    if (!reply) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
    return DBUS_HANDLER_RESULT_HANDLED;
}

DBusConnection* init(Callbacks* callbacks, State* state) {
    g_callbacks = callbacks;
    g_state = state;

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: session bus error: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }

    DBusObjectPathVTable vtable = {};
    vtable.message_function = message_handler;

    if (!dbus_connection_register_object_path(conn, OBJECT_PATH, &vtable, nullptr)) {
        std::cerr << "dbus: could not register " << OBJECT_PATH << std::endl;
        dbus_connection_unref(conn);
        return nullptr;
    }

    return conn;
}

bool request_name(DBusConnection* conn) {
    DBusError err;
    dbus_error_init(&err);

    int ret = dbus_bus_request_name(conn, SERVICE_NAME, DBUS_NAME_FLAG_DO_NOT_QUEUE, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: name request error: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (ret != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER) {
        std::cerr << "dbus: " << SERVICE_NAME << " already owned, is another g1link daemon running?" << std::endl;
        return false;
    }

    std::cout << "dbus: registered " << SERVICE_NAME << std::endl;
    return true;
}

void emit_properties_changed(DBusConnection* conn, const State& state,
                              const char** property_names, int num_properties) {
    std::vector<const Property*> changed;
    for (int i = 0; i < num_properties; i++) {
        if (const Property* prop = find_property(property_names[i])) {
            changed.push_back(prop);
        }
    }
    if (changed.empty()) return;

    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH, PROPERTIES_IFACE, "PropertiesChanged");
    if (!signal) return;

    DBusMessageIter iter;
    dbus_message_iter_init_append(signal, &iter);

    const char* iface = INTERFACE_NAME;
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);
    append_property_dict(&iter, state, changed);

    // Nothing invalidated
    DBusMessageIter invalidated;
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &invalidated);
    dbus_message_iter_close_container(&iter, &invalidated);

    dbus_connection_send(conn, signal, nullptr);
    dbus_message_unref(signal);
}

void update_from_connector(DBusConnection* conn, State* state, g1::Connector& connector) {
    std::vector<const char*> changed;

    auto update = [&changed](auto& field, const auto& value, const char* name) {
        if (field != value) {
            field = value;
            changed.push_back(name);
        }
    };

    const auto& config = connector.config();
    auto battery = connector.device().battery_level();
    auto level = [&battery](g1::Side side) -> int32_t {
        const auto& reading = battery[side];
        return reading ? static_cast<int32_t>(*reading) : -1;
    };

    update(state->connected, connector.connected(), "Connected");
    update(state->paired, config.paired(g1::Side::Left) && config.paired(g1::Side::Right), "Paired");
    update(state->silent_mode, connector.device().silent_mode(), "SilentMode");
    update(state->left_name, config.name(g1::Side::Left).value_or(""), "LeftName");
    update(state->right_name, config.name(g1::Side::Right).value_or(""), "RightName");
    update(state->battery_left, level(g1::Side::Left), "BatteryLeft");
    update(state->battery_right, level(g1::Side::Right), "BatteryRight");

    if (conn && !changed.empty()) {
        emit_properties_changed(conn, *state, changed.data(), static_cast<int>(changed.size()));
    }
}

void process_pending(DBusConnection* conn) {
    dbus_connection_read_write(conn, 0);
    while (dbus_connection_dispatch(conn) == DBUS_DISPATCH_DATA_REMAINS) {}
}

int get_fd(DBusConnection* conn) {
    int fd = -1;
    if (!conn || !dbus_connection_get_unix_fd(conn, &fd)) {
        return -1;
    }
    return fd;
}

void cleanup(DBusConnection* conn) {
    if (conn) {
        dbus_connection_unregister_object_path(conn, OBJECT_PATH);
        dbus_connection_unref(conn);
    }
    g_callbacks = nullptr;
    g_state = nullptr;
}

} // namespace dbus_service

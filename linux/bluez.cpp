#include "bluez.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>

namespace bluez {

// Send msg and wait for the reply; takes ownership of msg.
// BlueZ "Already ..." errors count as success when tolerate_already is set.
static bool send_blocking(DBusConnection* conn, DBusMessage* msg, int timeout_ms,
                          const char* what, bool tolerate_already = false) {
    if (!msg) return false;

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, timeout_ms, &err);
    dbus_message_unref(msg);
    if (reply) dbus_message_unref(reply);

    if (!dbus_error_is_set(&err)) return true;

    bool already = tolerate_already &&
        (strstr(err.message, "Already") || strstr(err.message, "already"));
    if (!already) {
        std::cerr << "bluez: " << what << " failed: " << err.message << std::endl;
    }
    dbus_error_free(&err);
    return already;
}

// Argument-less BlueZ method call
static bool call_bluez(DBusConnection* conn, const std::string& path, const char* iface,
                       const char* method, int timeout_ms = 5000) {
    return send_blocking(conn, dbus_message_new_method_call("org.bluez", path.c_str(), iface, method),
                         timeout_ms, method, true);
}

// Append an a{sv} holding the single entry {key: <string value>}
static void append_string_dict(DBusMessageIter* iter, const char* key, const char* value) {
    DBusMessageIter dict, entry, variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(&dict, &entry);
    dbus_message_iter_close_container(iter, &dict);
}

bool get_bool_property(DBusConnection* conn, const char* path,
                       const char* iface, const char* prop) {
    DBusMessage* msg = dbus_message_new_method_call("org.bluez", path,
        "org.freedesktop.DBus.Properties", "Get");
    if (!msg) return false;

    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface,
                             DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        dbus_error_free(&err);
        return false;
    }

    bool result = false;
    if (reply) {
        DBusMessageIter iter, variant;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&iter, &variant);
            if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_BOOLEAN) {
                dbus_bool_t val;
                dbus_message_iter_get_basic(&variant, &val);
                result = val;
            }
        }
        dbus_message_unref(reply);
    }
    return result;
}

static bool iequals(const char* a, const char* b) {
    for (; *a && *b; ++a, ++b) {
        if (std::tolower(static_cast<unsigned char>(*a)) != std::tolower(static_cast<unsigned char>(*b))) {
            return false;
        }
    }
    return *a == *b;
}

// Call ObjectManager.GetManagedObjects, caller unrefs the reply
static DBusMessage* get_managed_objects(DBusConnection* conn) {
    DBusMessage* msg = dbus_message_new_method_call("org.bluez", "/",
        "org.freedesktop.DBus.ObjectManager", "GetManagedObjects");
    if (!msg) return nullptr;

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 5000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: GetManagedObjects failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

// Walk a GetManagedObjects reply, calling fn(object_path, interface_name, props_iter)
// for every interface of every object
template<typename Fn>
static void for_each_interface(DBusMessage* reply, Fn&& fn) {
    DBusMessageIter iter, dict;
    if (!dbus_message_iter_init(reply, &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
        return;
    }

    dbus_message_iter_recurse(&iter, &dict);

    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry, ifaces;
        dbus_message_iter_recurse(&dict, &entry);

        const char* obj_path;
        dbus_message_iter_get_basic(&entry, &obj_path);
        dbus_message_iter_next(&entry);

        if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_ARRAY) {
            dbus_message_iter_recurse(&entry, &ifaces);

            while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
                DBusMessageIter iface_entry, props;
                dbus_message_iter_recurse(&ifaces, &iface_entry);

                const char* iface_name;
                dbus_message_iter_get_basic(&iface_entry, &iface_name);
                dbus_message_iter_next(&iface_entry);

                if (dbus_message_iter_get_arg_type(&iface_entry) == DBUS_TYPE_ARRAY) {
                    dbus_message_iter_recurse(&iface_entry, &props);
                    fn(obj_path, iface_name, &props);
                }
                dbus_message_iter_next(&ifaces);
            }
        }
        dbus_message_iter_next(&dict);
    }
}

// Walk an a{sv} properties dict, calling fn(name, variant_iter)
template<typename Fn>
static void for_each_property(DBusMessageIter* props, Fn&& fn) {
    while (dbus_message_iter_get_arg_type(props) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter prop_entry, variant;
        dbus_message_iter_recurse(props, &prop_entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&prop_entry, &prop_name);
        dbus_message_iter_next(&prop_entry);

        if (dbus_message_iter_get_arg_type(&prop_entry) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&prop_entry, &variant);
            fn(prop_name, &variant);
        }
        dbus_message_iter_next(props);
    }
}

static std::vector<uint8_t> read_byte_array(DBusMessageIter* variant) {
    std::vector<uint8_t> result;
    if (dbus_message_iter_get_arg_type(variant) != DBUS_TYPE_ARRAY) {
        return result;
    }

    DBusMessageIter bytes;
    dbus_message_iter_recurse(variant, &bytes);
    while (dbus_message_iter_get_arg_type(&bytes) == DBUS_TYPE_BYTE) {
        uint8_t b;
        dbus_message_iter_get_basic(&bytes, &b);
        result.push_back(b);
        dbus_message_iter_next(&bytes);
    }
    return result;
}

std::optional<std::string> get_adapter_path(DBusConnection* conn) {
    DBusMessage* reply = get_managed_objects(conn);
    if (!reply) return std::nullopt;

    std::optional<std::string> result;
    for_each_interface(reply, [&](const char* obj_path, const char* iface_name, DBusMessageIter*) {
        if (!result && strcmp(iface_name, "org.bluez.Adapter1") == 0) {
            result = obj_path;
        }
    });

    dbus_message_unref(reply);
    return result;
}

std::vector<DeviceInfo> list_devices(DBusConnection* conn) {
    std::vector<DeviceInfo> result;

    DBusMessage* reply = get_managed_objects(conn);
    if (!reply) return result;

    for_each_interface(reply, [&](const char* obj_path, const char* iface_name, DBusMessageIter* props) {
        if (strcmp(iface_name, "org.bluez.Device1") != 0) return;

        DeviceInfo info;
        info.path = obj_path;
        for_each_property(props, [&](const char* prop, DBusMessageIter* variant) {
            int type = dbus_message_iter_get_arg_type(variant);
            if (type == DBUS_TYPE_STRING && strcmp(prop, "Address") == 0) {
                const char* val;
                dbus_message_iter_get_basic(variant, &val);
                info.address = val;
            } else if (type == DBUS_TYPE_STRING && strcmp(prop, "Name") == 0) {
                const char* val;
                dbus_message_iter_get_basic(variant, &val);
                info.name = val;
            } else if (type == DBUS_TYPE_INT16 && strcmp(prop, "RSSI") == 0) {
                dbus_int16_t val;
                dbus_message_iter_get_basic(variant, &val);
                info.rssi = val;
            } else if (type == DBUS_TYPE_BOOLEAN && strcmp(prop, "Connected") == 0) {
                dbus_bool_t val;
                dbus_message_iter_get_basic(variant, &val);
                info.connected = val;
            } else if (type == DBUS_TYPE_BOOLEAN && strcmp(prop, "Paired") == 0) {
                dbus_bool_t val;
                dbus_message_iter_get_basic(variant, &val);
                info.paired = val;
            }
        });
        result.push_back(std::move(info));
    });

    dbus_message_unref(reply);
    return result;
}

// SetDiscoveryFilter({"Transport": "le"})
static bool set_le_discovery_filter(DBusConnection* conn, const std::string& adapter_path) {
    DBusMessage* msg = dbus_message_new_method_call("org.bluez", adapter_path.c_str(),
        "org.bluez.Adapter1", "SetDiscoveryFilter");
    if (!msg) return false;

    DBusMessageIter iter;
    dbus_message_iter_init_append(msg, &iter);
    append_string_dict(&iter, "Transport", "le");
    return send_blocking(conn, msg, 2000, "SetDiscoveryFilter");
}

bool start_discovery(DBusConnection* conn) {
    auto adapter = get_adapter_path(conn);
    if (!adapter) {
        std::cerr << "bluez: no Bluetooth adapter" << std::endl;
        return false;
    }

    // Filter is advisory, discovery still works without it
    set_le_discovery_filter(conn, *adapter);
    return call_bluez(conn, *adapter, "org.bluez.Adapter1", "StartDiscovery");
}

void stop_discovery(DBusConnection* conn) {
    if (auto adapter = get_adapter_path(conn)) {
        call_bluez(conn, *adapter, "org.bluez.Adapter1", "StopDiscovery");
    }
}

bool connect_device(DBusConnection* conn, const std::string& device_path, int timeout_ms) {
    return call_bluez(conn, device_path, "org.bluez.Device1", "Connect", timeout_ms);
}

bool disconnect_device(DBusConnection* conn, const std::string& device_path) {
    return call_bluez(conn, device_path, "org.bluez.Device1", "Disconnect");
}

bool pair_device(DBusConnection* conn, const std::string& device_path, int timeout_ms) {
    return call_bluez(conn, device_path, "org.bluez.Device1", "Pair", timeout_ms);
}

// Device1.Trusted = true, so BlueZ accepts reconnects without prompting
bool trust_device(DBusConnection* conn, const std::string& device_path) {
    DBusMessage* msg = dbus_message_new_method_call("org.bluez", device_path.c_str(),
        "org.freedesktop.DBus.Properties", "Set");
    if (!msg) return false;

    const char* iface = "org.bluez.Device1";
    const char* prop = "Trusted";
    dbus_bool_t trusted = TRUE;

    DBusMessageIter iter, variant;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &prop);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &trusted);
    dbus_message_iter_close_container(&iter, &variant);

    return send_blocking(conn, msg, 2000, "Trusted");
}

std::optional<std::string> find_characteristic(DBusConnection* conn, const std::string& device_path,
                                               const char* uuid) {
    DBusMessage* reply = get_managed_objects(conn);
    if (!reply) return std::nullopt;

    const std::string prefix = device_path + "/";
    std::optional<std::string> result;

    for_each_interface(reply, [&](const char* obj_path, const char* iface_name, DBusMessageIter* props) {
        if (result || strcmp(iface_name, "org.bluez.GattCharacteristic1") != 0) return;
        if (strncmp(obj_path, prefix.c_str(), prefix.size()) != 0) return;

        for_each_property(props, [&](const char* prop, DBusMessageIter* variant) {
            if (strcmp(prop, "UUID") == 0 &&
                dbus_message_iter_get_arg_type(variant) == DBUS_TYPE_STRING) {
                const char* val;
                dbus_message_iter_get_basic(variant, &val);
                if (iequals(val, uuid)) {
                    result = obj_path;
                }
            }
        });
    });

    dbus_message_unref(reply);
    return result;
}

bool start_notify(DBusConnection* conn, const std::string& characteristic_path) {
    return call_bluez(conn, characteristic_path, "org.bluez.GattCharacteristic1", "StartNotify");
}

// WriteValue(ay, {"type": "command"}), i.e. write without response
bool write_value(DBusConnection* conn, const std::string& characteristic_path,
                 std::span<const uint8_t> data) {
    DBusMessage* msg = dbus_message_new_method_call("org.bluez", characteristic_path.c_str(),
        "org.bluez.GattCharacteristic1", "WriteValue");
    if (!msg) return false;

    DBusMessageIter iter, bytes;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "y", &bytes);
    const uint8_t* ptr = data.data();
    dbus_message_iter_append_fixed_array(&bytes, DBUS_TYPE_BYTE, &ptr, static_cast<int>(data.size()));
    dbus_message_iter_close_container(&iter, &bytes);
    append_string_dict(&iter, "type", "command");

    return send_blocking(conn, msg, 2000, "WriteValue");
}

std::string get_device_path(const std::string& adapter_path, const std::string& mac_address) {
    std::string result = mac_address;
    std::replace(result.begin(), result.end(), ':', '_');
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return adapter_path + "/dev_" + result;
}

void setup_signal_handlers(DBusConnection* conn) {
    DBusError err;
    dbus_error_init(&err);

    // Subscribe to PropertiesChanged (Connected state, characteristic values)
    dbus_bus_add_match(conn,
        "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.Properties',member='PropertiesChanged'",
        &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: failed to add PropertiesChanged match: " << err.message << std::endl;
        dbus_error_free(&err);
    }

    dbus_connection_flush(conn);
}

bool handle_signal(DBusConnection* conn, DBusMessage* msg, const Callbacks* callbacks) {
    (void)conn;
    if (!callbacks) return false;

    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);

    if (!iface || !member) return false;

    if (strcmp(iface, "org.freedesktop.DBus.Properties") != 0 ||
        strcmp(member, "PropertiesChanged") != 0) {
        return false;
    }

    const char* obj_path = dbus_message_get_path(msg);
    if (!obj_path || !strstr(obj_path, "/dev_")) return false;

    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter)) return false;

    // First arg: interface name
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) return false;
    const char* changed_iface;
    dbus_message_iter_get_basic(&iter, &changed_iface);

    bool is_device = strcmp(changed_iface, "org.bluez.Device1") == 0;
    bool is_characteristic = strcmp(changed_iface, "org.bluez.GattCharacteristic1") == 0;
    if (!is_device && !is_characteristic) return false;

    // Second arg: changed properties dict
    dbus_message_iter_next(&iter);
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) return false;

    DBusMessageIter props;
    dbus_message_iter_recurse(&iter, &props);

    for_each_property(&props, [&](const char* prop_name, DBusMessageIter* variant) {
        if (is_device && strcmp(prop_name, "Connected") == 0 &&
            dbus_message_iter_get_arg_type(variant) == DBUS_TYPE_BOOLEAN) {
            dbus_bool_t connected;
            dbus_message_iter_get_basic(variant, &connected);
            if (!connected) {
                std::cout << "bluez: device disconnected: " << obj_path << std::endl;
                if (callbacks->on_device_disconnected) {
                    callbacks->on_device_disconnected(obj_path);
                }
            }
        } else if (is_characteristic && strcmp(prop_name, "Value") == 0) {
            if (callbacks->on_notification) {
                callbacks->on_notification(obj_path, read_byte_array(variant));
            }
        }
    });
    return true;
}

} // namespace bluez

#include "bluez_transport.hpp"
#include "config_file.hpp"
#include "dbus.hpp"

#include <connector/clock.hpp>
#include <connector/connector.hpp>
#include <connector/logger.hpp>

#include <poll.h>
#include <signal.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// Global state (for daemon mode)
static std::atomic<bool> g_running{true};
static DBusConnection* g_session_dbus = nullptr;
static dbus_service::State g_dbus_state;
static dbus_service::Callbacks g_dbus_callbacks;

// Keep-alive period for live connections
static constexpr std::chrono::seconds HEARTBEAT_INTERVAL{8};

// Client calls block while the daemon scans and retries
static constexpr int PAIR_CALL_TIMEOUT_MS = 300000;
static constexpr int VERIFY_CALL_TIMEOUT_MS = 60000;
static constexpr int COMMAND_CALL_TIMEOUT_MS = 10000;

struct Options {
    std::string config_path;
    bool verbose = false;
    std::vector<std::string> args;
};

// Signal handler
static void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

// Main event loop
static void run_event_loop(bluez::BluezTransport& transport, g1::Connector& connector) {
    auto last_heartbeat = std::chrono::steady_clock::now();

    while (g_running) {
        // Set up poll fds
        std::vector<pollfd> fds;

        // Session D-Bus fd
        int session_fd = dbus_service::get_fd(g_session_dbus);
        if (session_fd >= 0) {
            pollfd pfd = {};
            pfd.fd = session_fd;
            pfd.events = POLLIN;
            fds.push_back(pfd);
        }

        // System D-Bus fd (BlueZ signals and UART notifications)
        int system_idx = -1;
        int system_fd = transport.get_fd();
        if (system_fd >= 0) {
            pollfd pfd = {};
            pfd.fd = system_fd;
            pfd.events = POLLIN;
            system_idx = static_cast<int>(fds.size());
            fds.push_back(pfd);
        }

        // Poll with 100ms timeout
        int ret = poll(fds.data(), fds.size(), 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "poll error: " << strerror(errno) << std::endl;
            break;
        }

        // Process session D-Bus
        if (session_fd >= 0 && (fds[0].revents & POLLIN)) {
            dbus_service::process_pending(g_session_dbus);
        }

        // Process system D-Bus
        if (system_idx >= 0 && (fds[system_idx].revents & POLLIN)) {
            transport.process_pending();
        }

        connector.poll();

        auto now = std::chrono::steady_clock::now();
        if (now - last_heartbeat >= HEARTBEAT_INTERVAL) {
            connector.heartbeat();
            last_heartbeat = now;
        }
    }
}

// ============================================================================
// Subcommand implementations
// ============================================================================

static int cmd_daemon(const Options& options) {
    // Set up signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    g1::ConsoleLogger logger(options.verbose ? g1::LogLevel::Debug : g1::LogLevel::Info);
    logger.info("daemon", "G1 daemon starting...");

    config_file::JsonConfigStore config(options.config_path);
    if (!config.load()) {
        logger.warning("daemon", "Ignoring unreadable config " + config.path());
    }

    // Connect to system D-Bus (for BlueZ)
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* system_dbus = dbus_bus_get(DBUS_BUS_SYSTEM, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to system D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return 1;
    }

    int status = 0;
    {
        bluez::BluezTransport transport(system_dbus);
        g1::SteadyClock clock;
        g1::Connector connector(transport, config, logger, clock);

        connector.set_status_listener([&connector]() {
            dbus_service::update_from_connector(g_session_dbus, &g_dbus_state, connector);
        });

        // Set up D-Bus service callbacks
        g_dbus_callbacks.on_pair = [&connector]() {
            connector.disconnect_units();
            auto result = connector.pairing().pair_units();
            if (!result) return result;
            return connector.connect_units();
        };

        g_dbus_callbacks.on_unpair = [&connector]() {
            connector.disconnect_units();
            return connector.pairing().unpair_units();
        };

        g_dbus_callbacks.on_verify = [&connector]() {
            connector.disconnect_units();
            auto result = connector.pairing().verify_pairing();
            if (!result) return result;
            return connector.connect_units();
        };

        g_dbus_callbacks.on_set_silent_mode = [&connector](bool enabled) {
            return connector.device().set_silent_mode(enabled);
        };

        // Initialize session D-Bus service
        g_session_dbus = dbus_service::init(&g_dbus_callbacks, &g_dbus_state);
        if (!g_session_dbus) {
            std::cerr << "Failed to initialize D-Bus service" << std::endl;
            status = 1;
        } else if (!dbus_service::request_name(g_session_dbus)) {
            std::cerr << "Failed to request D-Bus name" << std::endl;
            status = 1;
        } else {
            dbus_service::update_from_connector(g_session_dbus, &g_dbus_state, connector);

            // Reconnect saved glasses
            if (config.complete()) {
                auto verified = connector.pairing().verify_pairing();
                if (verified) {
                    auto connected = connector.connect_units();
                    if (!connected) {
                        logger.warning("daemon", "Could not connect: " + connected.message);
                    }
                } else {
                    logger.warning("daemon", "Saved glasses not reachable: " + verified.message);
                }
            } else {
                logger.info("daemon", "No paired glasses, run 'g1link pair'");
            }

            logger.info("daemon", std::string("Daemon ready. D-Bus service: ") + dbus_service::SERVICE_NAME);

            // Run event loop
            run_event_loop(transport, connector);

            connector.disconnect_units();
        }

        connector.set_status_listener(nullptr);
        g_dbus_callbacks = {};
    }

    // Cleanup
    dbus_service::cleanup(g_session_dbus);
    g_session_dbus = nullptr;
    dbus_connection_unref(system_dbus);

    std::cout << "Daemon stopped" << std::endl;
    return status;
}

// Send a method call to the running daemon, returns the reply or nullptr.
// Takes ownership of msg; errors are printed prefixed with what.
static DBusMessage* send_to_daemon(DBusMessage* msg, int timeout_ms, const char* what) {
    if (!msg) {
        std::cerr << what << ": could not build D-Bus message" << std::endl;
        return nullptr;
    }

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Cannot reach the session bus: " << err.message << std::endl;
        dbus_error_free(&err);
        dbus_message_unref(msg);
        return nullptr;
    }

    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, timeout_ms, &err);
    dbus_message_unref(msg);
    dbus_connection_unref(conn);

    if (dbus_error_is_set(&err)) {
        std::cerr << what << " failed: " << err.message << " (" << err.name << ")" << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

// Call a G1 interface method, with an optional boolean argument
static bool call_daemon(const char* method, std::optional<bool> argument, int timeout_ms) {
    DBusMessage* msg = dbus_message_new_method_call(dbus_service::SERVICE_NAME, dbus_service::OBJECT_PATH,
                                                    dbus_service::INTERFACE_NAME, method);
    if (msg && argument) {
        dbus_bool_t value = *argument;
        dbus_message_append_args(msg, DBUS_TYPE_BOOLEAN, &value, DBUS_TYPE_INVALID);
    }

    DBusMessage* reply = send_to_daemon(msg, timeout_ms, method);
    if (!reply) return false;
    dbus_message_unref(reply);
    return true;
}

static int cmd_pair() {
    std::cout << "Searching for G1 glasses...\n"
              << "Take both glasses out of the case and keep them close to this computer.\n"
              << std::endl;

    if (!call_daemon("Pair", std::nullopt, PAIR_CALL_TIMEOUT_MS)) {
        return 1;
    }
    std::cout << "Paired and connected!" << std::endl;
    return 0;
}

static int cmd_unpair() {
    if (!call_daemon("Unpair", std::nullopt, COMMAND_CALL_TIMEOUT_MS)) {
        return 1;
    }
    std::cout << "Forgot both glasses" << std::endl;
    return 0;
}

static int cmd_verify() {
    if (!call_daemon("Verify", std::nullopt, VERIFY_CALL_TIMEOUT_MS)) {
        return 1;
    }
    std::cout << "Both glasses reachable and paired" << std::endl;
    return 0;
}

static int cmd_silent(const std::string& mode) {
    bool enabled;
    if (mode == "on") {
        enabled = true;
    } else if (mode == "off") {
        enabled = false;
    } else {
        std::cerr << "Invalid mode: " << mode << std::endl;
        std::cerr << "Valid modes: on, off" << std::endl;
        return 1;
    }

    if (!call_daemon("SetSilentMode", enabled, COMMAND_CALL_TIMEOUT_MS)) {
        return 1;
    }
    std::cout << "Silent mode " << (enabled ? "enabled" : "disabled") << std::endl;
    return 0;
}

// Battery levels are percentages, negative when unknown; empty names mean unpaired
static void print_property(const char* name, DBusMessageIter* value) {
    std::cout << name << ": ";
    switch (dbus_message_iter_get_arg_type(value)) {
        case DBUS_TYPE_STRING: {
            const char* text;
            dbus_message_iter_get_basic(value, &text);
            std::cout << (*text ? text : "(none)");
            break;
        }
        case DBUS_TYPE_BOOLEAN: {
            dbus_bool_t flag;
            dbus_message_iter_get_basic(value, &flag);
            std::cout << (flag ? "yes" : "no");
            break;
        }
        case DBUS_TYPE_INT32: {
            dbus_int32_t level;
            dbus_message_iter_get_basic(value, &level);
            if (level < 0) std::cout << "unknown";
            else std::cout << level << "%";
            break;
        }
        default:
            std::cout << "?";
    }
    std::cout << std::endl;
}

static int cmd_status() {
    DBusMessage* msg = dbus_message_new_method_call(dbus_service::SERVICE_NAME, dbus_service::OBJECT_PATH,
                                                    "org.freedesktop.DBus.Properties", "GetAll");
    if (msg) {
        const char* iface = dbus_service::INTERFACE_NAME;
        dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface, DBUS_TYPE_INVALID);
    }

    DBusMessage* reply = send_to_daemon(msg, COMMAND_CALL_TIMEOUT_MS, "Status (is the daemon running?)");
    if (!reply) return 1;

    DBusMessageIter args, props;
    if (dbus_message_iter_init(reply, &args) && dbus_message_iter_get_arg_type(&args) == DBUS_TYPE_ARRAY) {
        for (dbus_message_iter_recurse(&args, &props);
             dbus_message_iter_get_arg_type(&props) == DBUS_TYPE_DICT_ENTRY;
             dbus_message_iter_next(&props)) {
            DBusMessageIter entry, value;
            dbus_message_iter_recurse(&props, &entry);

            const char* name;
            dbus_message_iter_get_basic(&entry, &name);
            dbus_message_iter_next(&entry);
            dbus_message_iter_recurse(&entry, &value);
            print_property(name, &value);
        }
    }

    dbus_message_unref(reply);
    return 0;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options] <command>\n"
              << "\n"
              << "Commands:\n"
              << "  daemon              Run the G1 daemon\n"
              << "  pair                Discover and pair both glasses\n"
              << "  unpair              Forget both glasses\n"
              << "  verify              Check saved glasses are reachable and paired\n"
              << "  status              Show current status\n"
              << "  silent <on|off>     Set silent mode\n"
              << "  help                Show this help\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>     Config file (default " << config_file::default_path() << ")\n"
              << "  --verbose           Debug logging (daemon)\n";
}

static bool parse_options(int argc, char* argv[], Options& options) {
    options.config_path = config_file::default_path();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a path" << std::endl;
                return false;
            }
            options.config_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else {
            options.args.push_back(std::move(arg));
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    Options options;
    if (!parse_options(argc, argv, options) || options.args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string& cmd = options.args[0];

    if (cmd == "daemon") {
        return cmd_daemon(options);
    } else if (cmd == "pair") {
        return cmd_pair();
    } else if (cmd == "unpair") {
        return cmd_unpair();
    } else if (cmd == "verify") {
        return cmd_verify();
    } else if (cmd == "status") {
        return cmd_status();
    } else if (cmd == "silent") {
        if (options.args.size() < 2) {
            std::cerr << "Usage: " << argv[0] << " silent <on|off>\n";
            return 1;
        }
        return cmd_silent(options.args[1]);
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    } else {
        std::cerr << "Unknown command: " << cmd << std::endl;
        print_usage(argv[0]);
        return 1;
    }
}

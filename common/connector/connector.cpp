#include "connector.hpp"

#include <protocol/commands.hpp>
#include <protocol/parse.hpp>

#include <string>

namespace g1 {

namespace {
constexpr const char* TAG = "connector";
}

Connector::Connector(Transport& transport, ConfigStore& config, Logger& logger, Clock& clock,
                     PairingTimings timings)
    : transport_(transport),
      config_(config),
      logger_(logger),
      dispatcher_(transport, logger),
      pairing_(transport, config, logger, clock, timings),
      device_(dispatcher_, logger) {
    pairing_.set_callbacks({
        .query_initial_state = [this](Side side) { return query_initial_state(side); },
        .on_state_changed = [this](Side, UnitState) { notify_status(); },
    });

    device_.set_callbacks({
        .connection_for = [this](Side side) { return connection(side); },
        .on_status_changed = [this]() { notify_status(); },
    });

    dispatcher_.set_unsolicited_handler([this](Connection& conn, const std::vector<uint8_t>& frame) {
        for (Side side : all_sides) {
            if (config_.address(side) && *config_.address(side) == conn.address()) {
                handle_frame(side, frame);
                return;
            }
        }
    });

    transport_.set_connection_lost_handler([this](const std::string& address) {
        handle_connection_lost(address);
    });
}

Connector::~Connector() {
    transport_.set_connection_lost_handler(nullptr);
    disconnect_units();
}

Connection* Connector::connection(Side side) {
    auto& conn = connections_[static_cast<size_t>(side)];
    if (!conn || !conn->is_connected()) return nullptr;
    return conn.get();
}

bool Connector::connected(Side side) const {
    const auto& conn = connections_[static_cast<size_t>(side)];
    return conn && conn->is_connected();
}

Status Connector::connect_units() {
    if (!config_.complete()) {
        return Status::failure(ErrorKind::ConfigIncomplete, "no saved addresses");
    }

    for (Side side : all_sides) {
        if (connected(side)) continue;

        const auto& address = *config_.address(side);
        logger_.info(TAG, "Connecting to " + std::string(display_label(side)) + " (" + address + ")...");

        auto conn = transport_.connect(address, pairing_.timings().connect_timeout);
        if (!conn) {
            logger_.error(TAG, "Connection to " + address + " failed: " + conn.status.message);
            disconnect_units();
            return conn.status;
        }
        connections_[static_cast<size_t>(side)] = std::move(*conn);
    }

    logger_.info(TAG, "Connected to both glasses");
    notify_status();
    return Status::success();
}

void Connector::disconnect_units() {
    bool changed = false;
    for (auto& conn : connections_) {
        if (conn) {
            transport_.disconnect(*conn);
            conn.reset();
            changed = true;
        }
    }
    if (changed) {
        logger_.info(TAG, "Disconnected");
        notify_status();
    }
}

bool Connector::query_initial_state(Side side) {
    const auto& address = config_.address(side);
    if (!address) return false;

    auto conn = transport_.connect(*address, pairing_.timings().verify_timeout);
    if (!conn) {
        logger_.debug(TAG, "Initial state query failed: " + conn.status.message);
        return false;
    }

    auto frame = commands::battery::request();
    auto result = dispatcher_.send_command(**conn, frame, true);
    transport_.disconnect(**conn);

    if (!result || !*result) {
        return false;
    }

    auto level = parse::parse_battery(**result);
    if (!level) {
        return false;
    }
    device_.update_battery_level(side, *level);
    return true;
}

Status Connector::request_battery(Side side) {
    Connection* conn = connection(side);
    if (!conn) {
        return Status::failure(ErrorKind::Connection, std::string(to_string(side)) + " glass not connected");
    }

    auto frame = commands::battery::request();
    auto result = dispatcher_.send_command(*conn, frame, true);
    if (!result) {
        return result.status;
    }
    if (!*result) {
        return Status::failure(ErrorKind::Protocol, "no battery response");
    }

    auto level = parse::parse_battery(**result);
    if (!level) {
        return Status::failure(ErrorKind::Protocol, "malformed battery response");
    }
    device_.update_battery_level(side, *level);
    notify_status();
    return Status::success();
}

void Connector::heartbeat() {
    for (Side side : all_sides) {
        Connection* conn = connection(side);
        if (!conn) continue;

        auto frame = commands::heartbeat::ping(heartbeat_seq_);
        auto result = dispatcher_.send_command(*conn, frame, false);
        if (!result) {
            logger_.warning(TAG, "Heartbeat to " + std::string(display_label(side)) + " failed: " +
                                 result.status.message);
        }
    }
    ++heartbeat_seq_;
}

void Connector::poll() {
    for (Side side : all_sides) {
        Connection* conn = connection(side);
        if (!conn) continue;

        while (auto frame = transport_.receive(*conn, std::chrono::milliseconds(0))) {
            handle_frame(side, *frame);
            // The frame handler may have dropped the connection
            if (!connection(side)) break;
        }
    }
}

void Connector::handle_frame(Side side, const std::vector<uint8_t>& frame) {
    switch (parse::identify_frame(frame)) {
        case parse::FrameType::Battery:
            if (auto level = parse::parse_battery(frame)) {
                device_.update_battery_level(side, *level);
                notify_status();
            }
            break;

        case parse::FrameType::Heartbeat:
        case parse::FrameType::DashboardAck:
            break;

        default:
            logger_.debug(TAG, "Ignoring frame from " + std::string(to_string(side)) +
                               " (" + std::to_string(frame.size()) + " bytes)");
            break;
    }
}

void Connector::handle_connection_lost(const std::string& address) {
    for (Side side : all_sides) {
        auto& conn = connections_[static_cast<size_t>(side)];
        if (conn && conn->address() == address) {
            logger_.warning(TAG, "Connection lost: " + std::string(display_label(side)));
            conn.reset();
            notify_status();
        }
    }
}

void Connector::notify_status() {
    if (on_status_changed_) {
        on_status_changed_();
    }
}

} // namespace g1

#include "pairing.hpp"

#include <string>

namespace g1 {

namespace {

constexpr const char* TAG = "pairing";

std::string label(Side side) {
    return std::string(display_label(side));
}

} // namespace

std::optional<Side> classify_unit_name(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find(LEFT_NAME_MARKER) != std::string::npos) return Side::Left;
    if (name.find(RIGHT_NAME_MARKER) != std::string::npos) return Side::Right;
    return std::nullopt;
}

void PairingManager::set_state(Side side, UnitState state) {
    auto& current = states_[static_cast<size_t>(side)];
    if (current == state) return;
    current = state;
    logger_.debug(TAG, label(side) + " -> " + std::string(to_string(state)));
    if (callbacks_.on_state_changed) {
        callbacks_.on_state_changed(side, state);
    }
}

bool PairingManager::discovery_stale() const {
    if (discovery_cache_.empty() || !last_scan_) return true;
    return clock_.now() - *last_scan_ > timings_.discovery_max_age;
}

Result<DiscoveryResult> PairingManager::discover_units(std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lock(pairing_mutex_);
    return discover_locked(timeout.value_or(timings_.scan_timeout));
}

Result<DiscoveryResult> PairingManager::discover_locked(std::chrono::milliseconds timeout) {
    logger_.info(TAG, "Starting glasses discovery...");

    auto scanned = transport_.scan(timeout);
    if (!scanned) {
        logger_.error(TAG, "Discovery failed: " + scanned.status.message);
        return {DiscoveryResult{}, Status::failure(ErrorKind::Discovery, scanned.status.message)};
    }

    DiscoveryResult discovered;
    for (const auto& adv : *scanned) {
        auto side = classify_unit_name(adv.name);
        if (!side) continue;

        // Later advertisements for the same side replace earlier ones
        discovered[*side] = Unit{*side, adv.address, adv.name, false, adv.rssi};
        logger_.info(TAG, "Found " + std::string(to_string(*side)) + " glass: " + adv.name +
                          " (" + adv.address + ", rssi " + std::to_string(adv.rssi) + ")");
    }

    for (const auto& [side, unit] : discovered) {
        if (state(side) == UnitState::Unknown) {
            set_state(side, UnitState::Discovered);
        }
    }

    discovery_cache_ = discovered;
    last_scan_ = clock_.now();
    return Result<DiscoveryResult>::success(std::move(discovered));
}

Status PairingManager::pair_units() {
    std::lock_guard<std::mutex> lock(pairing_mutex_);

    if (discovery_stale() && !discover_locked(timings_.scan_timeout)) {
        logger_.debug(TAG, "Falling back to previous discovery results");
    }

    if (!discovery_cache_.count(Side::Left) || !discovery_cache_.count(Side::Right)) {
        logger_.error(TAG, "Could not find both glasses");
        return Status::failure(ErrorKind::Discovery, "could not find both glasses");
    }

    for (Side side : all_sides) {
        const auto& unit = discovery_cache_.at(side);
        config_.set_address(side, unit.address);
        config_.set_name(side, unit.name);
    }

    // Left first; the right unit is only attempted once the left one paired
    for (Side side : all_sides) {
        auto status = attempt_pairing_locked(discovery_cache_.at(side).address, side,
                                             default_max_attempts);
        if (!status) {
            return status;
        }
    }

    logger_.info(TAG, "Successfully paired with both glasses");
    return Status::success();
}

Status PairingManager::attempt_pairing(const std::string& address, Side side, int max_attempts) {
    std::lock_guard<std::mutex> lock(pairing_mutex_);
    return attempt_pairing_locked(address, side, max_attempts);
}

Status PairingManager::attempt_pairing_locked(const std::string& address, Side side, int max_attempts) {
    const auto& name = label(side);
    logger_.info(TAG, "Performing first-time pairing for " + name + "...");

    Status last_error = Status::failure(ErrorKind::Connection, "no pairing attempt made");
    auto& attempt = attempts_[static_cast<size_t>(side)];

    for (attempt = 1; attempt <= max_attempts; ++attempt) {
        set_state(side, UnitState::Pairing);

        auto conn = transport_.connect(address, timings_.connect_timeout);
        if (conn && (*conn)->is_connected()) {
            logger_.debug(TAG, "Connection established with " + address);

            last_error = transport_.pair(**conn);
            if (last_error) {
                logger_.debug(TAG, "Pairing successful");

                // The paired flag only stands once it is on disk
                config_.set_paired(side, true);
                if (!config_.save()) {
                    config_.set_paired(side, false);
                    last_error = Status::failure(ErrorKind::Storage, "failed to save configuration");
                }
            }

            if (last_error) {
                transport_.disconnect(**conn);
                clock_.sleep_for(timings_.settle_delay);

                set_state(side, UnitState::Paired);
                logger_.info(TAG, name + " paired and connected!");

                if (!callbacks_.query_initial_state || !callbacks_.query_initial_state(side)) {
                    logger_.warning(TAG, "Could not get initial state for " + name);
                }
                return Status::success();
            }
            transport_.disconnect(**conn);
        } else if (conn) {
            last_error = Status::failure(ErrorKind::Connection, "link dropped after connect");
        } else {
            last_error = conn.status;
        }

        logger_.error(TAG, "Connection attempt " + std::to_string(attempt) + " failed: " +
                           last_error.message);
        if (attempt < max_attempts) {
            logger_.info(TAG, "Retrying connection...");
            clock_.sleep_for(timings_.retry_delay);
        }
    }
    attempt = max_attempts;

    set_state(side, UnitState::Unknown);
    logger_.error(TAG, "Pairing failed for " + name + " after " + std::to_string(max_attempts) +
                       " attempts");
    return last_error;
}

Status PairingManager::probe(Side side, const std::string& address, bool pair) {
    auto conn = transport_.connect(address, timings_.verify_timeout);
    if (!conn) {
        return conn.status;
    }

    Status status;
    if (pair) {
        status = transport_.pair(**conn);
    }
    transport_.disconnect(**conn);

    if (status) {
        logger_.debug(TAG, "Successfully verified " + std::string(to_string(side)) + " glass pairing");
    }
    return status;
}

Status PairingManager::verify_pairing() {
    logger_.debug(TAG, "Verifying pairing...");

    if (!config_.complete()) {
        logger_.debug(TAG, "No saved addresses found");
        return Status::failure(ErrorKind::ConfigIncomplete, "no saved addresses");
    }

    auto fail = [this](Side side, const Status& status) {
        logger_.warning(TAG, "Could not verify " + std::string(to_string(side)) +
                             " glass pairing: " + status.message);
        for (Side s : all_sides) {
            set_state(s, UnitState::Unknown);
        }
        return status;
    };

    for (Side side : all_sides) {
        set_state(side, UnitState::Verifying);
    }

    // Reachability only
    for (Side side : all_sides) {
        auto status = probe(side, *config_.address(side), false);
        if (!status) {
            return fail(side, status);
        }
    }

    if (!config_.paired(Side::Left) || !config_.paired(Side::Right)) {
        logger_.info(TAG, "First time connection detected!");
        logger_.info(TAG, "The glasses will be paired with your device. This only happens once.");

        for (Side side : all_sides) {
            auto status = probe(side, *config_.address(side), true);
            if (!status) {
                return fail(side, status);
            }

            // Persist each side as soon as it pairs
            config_.set_paired(side, true);
            if (!config_.save()) {
                config_.set_paired(side, false);
                return fail(side, Status::failure(ErrorKind::Storage, "failed to save configuration"));
            }
        }
    }

    for (Side side : all_sides) {
        set_state(side, UnitState::Paired);
    }
    logger_.info(TAG, "Pairing verification successful");
    return Status::success();
}

Status PairingManager::unpair_units() {
    config_.clear();
    for (Side side : all_sides) {
        set_state(side, UnitState::Unknown);
        attempts_[static_cast<size_t>(side)] = 0;
    }

    if (!config_.save()) {
        logger_.error(TAG, "Error unpairing: failed to save configuration");
        return Status::failure(ErrorKind::Storage, "failed to save configuration");
    }

    logger_.info(TAG, "Unpaired from glasses");
    return Status::success();
}

} // namespace g1

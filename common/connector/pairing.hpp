#pragma once

#include "clock.hpp"
#include "config_store.hpp"
#include "logger.hpp"
#include "result.hpp"
#include "transport.hpp"
#include <types/device.hpp>
#include <types/enums.hpp>

#include <array>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace g1 {

// Name markers used by the units in their advertised names
constexpr const char* LEFT_NAME_MARKER = "_L_";
constexpr const char* RIGHT_NAME_MARKER = "_R_";

// Classify an advertised name, nullopt if it carries no side marker
std::optional<Side> classify_unit_name(const std::string& name);

struct PairingTimings {
    std::chrono::milliseconds scan_timeout{15000};
    std::chrono::milliseconds connect_timeout{20000};
    std::chrono::milliseconds verify_timeout{5000};
    std::chrono::milliseconds settle_delay{1000};  // after disconnecting a freshly paired unit
    std::chrono::milliseconds retry_delay{2000};
    std::chrono::milliseconds discovery_max_age{60000};
};

struct PairingCallbacks {
    // Best-effort initial state query once a unit has paired; false is logged only
    std::function<bool(Side)> query_initial_state;
    std::function<void(Side, UnitState)> on_state_changed;
};

// Discovers the two units, pairs them, verifies saved pairing and unpairs.
// Discovery and pairing are serialized by a single lock; verify and unpair
// are expected to be called serially by the owner.
class PairingManager {
public:
    static constexpr int default_max_attempts = 3;

    PairingManager(Transport& transport, ConfigStore& config, Logger& logger, Clock& clock,
                   PairingTimings timings = {})
        : transport_(transport), config_(config), logger_(logger), clock_(clock), timings_(timings) {}

    void set_callbacks(PairingCallbacks callbacks) { callbacks_ = std::move(callbacks); }

    // Scan and classify units. On scan failure the value is an empty result
    // and status carries ErrorKind::Discovery.
    Result<DiscoveryResult> discover_units(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Pair both units from the discovery cache, rescanning when it is stale
    Status pair_units();

    // Pair one unit with up to max_attempts fixed-delay attempts
    Status attempt_pairing(const std::string& address, Side side,
                           int max_attempts = default_max_attempts);

    // Reachability probe of saved units, pairing them if not yet flagged paired
    Status verify_pairing();

    // Forget both units
    Status unpair_units();

    UnitState state(Side side) const { return states_[static_cast<size_t>(side)]; }

    // Current (or last) pairing attempt number for a side, 0 if never attempted
    int attempt(Side side) const { return attempts_[static_cast<size_t>(side)]; }

    const DiscoveryResult& cached_discovery() const { return discovery_cache_; }

    // Cache is empty or older than discovery_max_age
    bool discovery_stale() const;

    const PairingTimings& timings() const { return timings_; }

private:
    Result<DiscoveryResult> discover_locked(std::chrono::milliseconds timeout);
    Status attempt_pairing_locked(const std::string& address, Side side, int max_attempts);

    // Connect and disconnect, optionally running the pairing handshake in between
    Status probe(Side side, const std::string& address, bool pair);

    void set_state(Side side, UnitState state);

    Transport& transport_;
    ConfigStore& config_;
    Logger& logger_;
    Clock& clock_;
    PairingTimings timings_;
    PairingCallbacks callbacks_;

    std::mutex pairing_mutex_;
    DiscoveryResult discovery_cache_;
    std::optional<Clock::time_point> last_scan_;

    std::array<UnitState, 2> states_{UnitState::Unknown, UnitState::Unknown};
    std::array<int, 2> attempts_{0, 0};
};

} // namespace g1

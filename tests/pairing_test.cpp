#include <gtest/gtest.h>
#include "fakes.hpp"

#include <connector/pairing.hpp>

#include <atomic>
#include <future>
#include <thread>

using namespace g1;
using namespace g1::fakes;
using namespace std::chrono_literals;

class PairingManagerTest : public ::testing::Test {
protected:
    FakeTransport transport;
    MemoryConfigStore config;
    RecordingLogger logger;
    ManualClock clock;
    PairingManager pairing{transport, config, logger, clock};

    std::vector<std::pair<Side, UnitState>> transitions;
    std::vector<Side> queried;

    void SetUp() override {
        pairing.set_callbacks({
            .query_initial_state = [this](Side side) {
                queried.push_back(side);
                return true;
            },
            .on_state_changed = [this](Side side, UnitState state) {
                transitions.emplace_back(side, state);
            },
        });
    }

    void advertise_both() {
        transport.scan_result = Result<std::vector<Advertisement>>::success({
            advert("G1_L_42", "AA"),
            advert("Speaker", "CC"),
            advert("G1_R_42", "BB"),
        });
    }

    void save_addresses(bool left_paired, bool right_paired) {
        config.set_address(Side::Left, "AA");
        config.set_address(Side::Right, "BB");
        config.set_paired(Side::Left, left_paired);
        config.set_paired(Side::Right, right_paired);
    }
};

TEST(ClassifyUnitName, SideMarkers) {
    EXPECT_EQ(Side::Left, classify_unit_name("G1_L_42"));
    EXPECT_EQ(Side::Right, classify_unit_name("Even G1_R_7A"));
    EXPECT_FALSE(classify_unit_name("Headphones").has_value());
    EXPECT_FALSE(classify_unit_name("").has_value());
    EXPECT_FALSE(classify_unit_name("G1_LR_").has_value());
}

TEST(ClassifyUnitName, LeftMarkerCheckedFirst) {
    EXPECT_EQ(Side::Left, classify_unit_name("G1_R__L_1"));
}

TEST_F(PairingManagerTest, DiscoverClassifiesBySideMarker) {
    advertise_both();

    auto result = pairing.discover_units();

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(2u, result->size());
    EXPECT_EQ("AA", result->at(Side::Left).address);
    EXPECT_EQ("G1_L_42", result->at(Side::Left).name);
    EXPECT_EQ("BB", result->at(Side::Right).address);
    EXPECT_FALSE(result->at(Side::Right).paired);

    EXPECT_EQ(UnitState::Discovered, pairing.state(Side::Left));
    EXPECT_EQ(UnitState::Discovered, pairing.state(Side::Right));
    EXPECT_EQ(2u, pairing.cached_discovery().size());
    EXPECT_FALSE(pairing.discovery_stale());
    EXPECT_EQ(15000ms, transport.last_scan_timeout);
}

TEST_F(PairingManagerTest, DiscoverKeepsLastMatchPerSide) {
    transport.scan_result = Result<std::vector<Advertisement>>::success({
        advert("G1_L_1", "AA"),
        advert("G1_L_2", "DD"),
    });

    auto result = pairing.discover_units(3000ms);

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(1u, result->size());
    EXPECT_EQ("DD", result->at(Side::Left).address);
    EXPECT_EQ(3000ms, transport.last_scan_timeout);
}

TEST_F(PairingManagerTest, DiscoverNoMatches) {
    transport.scan_result = Result<std::vector<Advertisement>>::success({advert("Speaker", "CC")});

    auto result = pairing.discover_units();

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->empty());
    EXPECT_EQ(UnitState::Unknown, pairing.state(Side::Left));
}

TEST_F(PairingManagerTest, ScanFailureReturnsEmptyResult) {
    advertise_both();
    ASSERT_TRUE(pairing.discover_units().ok());

    transport.scan_result = Result<std::vector<Advertisement>>::failure(ErrorKind::Discovery, "adapter off");
    auto result = pairing.discover_units();

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(ErrorKind::Discovery, result.status.error);
    ASSERT_TRUE(result.value.has_value());
    EXPECT_TRUE(result->empty());

    // Previous results survive
    EXPECT_EQ(2u, pairing.cached_discovery().size());
}

TEST_F(PairingManagerTest, PairUnitsPairsBothAndPersists) {
    advertise_both();

    auto status = pairing.pair_units();

    ASSERT_TRUE(status.ok()) << status.message;
    EXPECT_EQ(1, transport.scan_calls);
    EXPECT_EQ((std::vector<std::string>{"AA", "BB"}), transport.connect_calls);
    EXPECT_EQ((std::vector<std::string>{"AA", "BB"}), transport.pair_calls);
    EXPECT_EQ((std::vector<std::string>{"AA", "BB"}), transport.disconnect_calls);
    EXPECT_EQ(20000ms, transport.connect_timeouts[0]);

    EXPECT_EQ("AA", config.saved(Side::Left).address);
    EXPECT_EQ("G1_L_42", config.saved(Side::Left).name);
    EXPECT_TRUE(config.saved(Side::Left).paired);
    EXPECT_EQ("BB", config.saved(Side::Right).address);
    EXPECT_TRUE(config.saved(Side::Right).paired);
    EXPECT_EQ(2, config.save_calls);

    EXPECT_EQ(UnitState::Paired, pairing.state(Side::Left));
    EXPECT_EQ(UnitState::Paired, pairing.state(Side::Right));
    EXPECT_EQ(1, pairing.attempt(Side::Left));
    EXPECT_EQ(1, pairing.attempt(Side::Right));

    // Settle delay after each unit, no retries
    EXPECT_EQ((std::vector<std::chrono::milliseconds>{1000ms, 1000ms}), clock.sleeps);
    EXPECT_EQ((std::vector<Side>{Side::Left, Side::Right}), queried);
}

TEST_F(PairingManagerTest, PairUnitsReusesFreshDiscovery) {
    advertise_both();
    ASSERT_TRUE(pairing.discover_units().ok());
    ASSERT_EQ(1, transport.scan_calls);

    ASSERT_TRUE(pairing.pair_units().ok());
    EXPECT_EQ(1, transport.scan_calls);
}

TEST_F(PairingManagerTest, PairUnitsRescansStaleDiscovery) {
    advertise_both();
    ASSERT_TRUE(pairing.discover_units().ok());

    clock.advance(61s);
    EXPECT_TRUE(pairing.discovery_stale());

    ASSERT_TRUE(pairing.pair_units().ok());
    EXPECT_EQ(2, transport.scan_calls);
}

TEST_F(PairingManagerTest, PairUnitsFallsBackToCacheWhenRescanFails) {
    advertise_both();
    ASSERT_TRUE(pairing.discover_units().ok());

    clock.advance(61s);
    transport.scan_result = Result<std::vector<Advertisement>>::failure(ErrorKind::Discovery, "busy");

    EXPECT_TRUE(pairing.pair_units().ok());
    EXPECT_EQ((std::vector<std::string>{"AA", "BB"}), transport.pair_calls);
}

TEST_F(PairingManagerTest, PairUnitsNeedsBothSides) {
    transport.scan_result = Result<std::vector<Advertisement>>::success({advert("G1_L_42", "AA")});

    auto status = pairing.pair_units();

    EXPECT_EQ(ErrorKind::Discovery, status.error);
    EXPECT_TRUE(transport.connect_calls.empty());
    EXPECT_EQ(0, config.save_calls);
    EXPECT_FALSE(config.address(Side::Left).has_value());
}

TEST_F(PairingManagerTest, LeftFailureSkipsRight) {
    advertise_both();
    transport.fail_connect("AA", 3);

    auto status = pairing.pair_units();

    EXPECT_FALSE(status.ok());
    EXPECT_EQ(ErrorKind::Connection, status.error);
    EXPECT_EQ(3u, transport.count(transport.connect_calls, "AA"));
    EXPECT_EQ(0u, transport.count(transport.connect_calls, "BB"));
    EXPECT_EQ(UnitState::Unknown, pairing.state(Side::Left));
    EXPECT_EQ(UnitState::Discovered, pairing.state(Side::Right));
}

TEST_F(PairingManagerTest, PairingWaitsForRunningDiscovery) {
    advertise_both();

    std::promise<void> scan_started;
    std::promise<void> release_scan;
    std::shared_future<void> released = release_scan.get_future().share();
    std::atomic<bool> scanning{false};
    std::atomic<bool> connected_during_scan{false};
    std::atomic<int> connects{0};

    transport.on_scan = [&]() {
        scanning = true;
        scan_started.set_value();
        released.wait();
        scanning = false;
    };
    transport.on_connect = [&](const std::string&) {
        if (scanning) connected_during_scan = true;
        ++connects;
    };

    std::thread discovery([&]() { pairing.discover_units(); });
    scan_started.get_future().wait();

    std::thread pairer([&]() { pairing.attempt_pairing("AA", Side::Left); });

    // The pairing thread is parked on the lock while the scan is running
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(0, connects.load());

    release_scan.set_value();
    discovery.join();
    pairer.join();

    EXPECT_FALSE(connected_during_scan);
    EXPECT_EQ(1, connects.load());
    EXPECT_EQ(UnitState::Paired, pairing.state(Side::Left));
}

TEST_F(PairingManagerTest, AttemptPairingGivesUpAfterMaxAttempts) {
    transport.fail_connect("AA", 5);

    auto status = pairing.attempt_pairing("AA", Side::Left);

    EXPECT_EQ(ErrorKind::Connection, status.error);
    EXPECT_EQ(3u, transport.connect_calls.size());
    EXPECT_EQ(3, pairing.attempt(Side::Left));
    EXPECT_EQ(UnitState::Unknown, pairing.state(Side::Left));
    EXPECT_FALSE(config.paired(Side::Left));
    EXPECT_EQ(0, config.save_calls);

    // Fixed delay between attempts, none after the last one
    EXPECT_EQ((std::vector<std::chrono::milliseconds>{2000ms, 2000ms}), clock.sleeps);
    EXPECT_TRUE(logger.contains(LogLevel::Error, "Connection attempt 3 failed"));
    EXPECT_TRUE(queried.empty());
}

TEST_F(PairingManagerTest, AttemptPairingRecoversFromTransientFailure) {
    transport.fail_connect("AA", 1);

    auto status = pairing.attempt_pairing("AA", Side::Left);

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(2u, transport.connect_calls.size());
    EXPECT_EQ(2, pairing.attempt(Side::Left));
    EXPECT_EQ((std::vector<std::chrono::milliseconds>{2000ms, 1000ms}), clock.sleeps);
    EXPECT_TRUE(config.saved(Side::Left).paired);
}

TEST_F(PairingManagerTest, AttemptPairingRetriesRejectedHandshake) {
    transport.fail_pair("AA", 3);

    auto status = pairing.attempt_pairing("AA", Side::Left);

    EXPECT_FALSE(status.ok());
    EXPECT_EQ(3u, transport.pair_calls.size());
    EXPECT_EQ(3u, transport.disconnect_calls.size());
    EXPECT_FALSE(config.paired(Side::Left));
}

TEST_F(PairingManagerTest, AttemptPairingHonoursCustomAttemptLimit) {
    transport.fail_connect("AA", 5);

    EXPECT_FALSE(pairing.attempt_pairing("AA", Side::Left, 1).ok());
    EXPECT_EQ(1u, transport.connect_calls.size());
    EXPECT_TRUE(clock.sleeps.empty());
}

TEST_F(PairingManagerTest, AttemptPairingRetriesAfterSaveFailure) {
    config.fail_next_saves = 1;

    auto status = pairing.attempt_pairing("AA", Side::Left);

    ASSERT_TRUE(status.ok());
    EXPECT_EQ(2u, transport.connect_calls.size());
    EXPECT_EQ(2u, transport.pair_calls.size());
    EXPECT_EQ(2u, transport.disconnect_calls.size());
    EXPECT_EQ(2, config.save_calls);
    EXPECT_TRUE(config.saved(Side::Left).paired);
    EXPECT_EQ(UnitState::Paired, pairing.state(Side::Left));
    EXPECT_EQ((std::vector<std::chrono::milliseconds>{2000ms, 1000ms}), clock.sleeps);
    EXPECT_TRUE(logger.contains(LogLevel::Error, "Connection attempt 1 failed: failed to save configuration"));
    EXPECT_EQ((std::vector<Side>{Side::Left}), queried);
}

TEST_F(PairingManagerTest, AttemptPairingGivesUpWhenEverySaveFails) {
    config.fail_save = true;

    auto status = pairing.attempt_pairing("AA", Side::Left);

    EXPECT_EQ(ErrorKind::Storage, status.error);
    EXPECT_EQ(3u, transport.connect_calls.size());
    EXPECT_EQ(3u, transport.disconnect_calls.size());
    EXPECT_EQ(3, config.save_calls);
    EXPECT_EQ(3, pairing.attempt(Side::Left));
    EXPECT_EQ((std::vector<std::chrono::milliseconds>{2000ms, 2000ms}), clock.sleeps);

    // Nothing claims the unit is paired
    EXPECT_FALSE(config.paired(Side::Left));
    EXPECT_FALSE(config.saved(Side::Left).paired);
    EXPECT_EQ(UnitState::Unknown, pairing.state(Side::Left));
    EXPECT_TRUE(queried.empty());
}

TEST_F(PairingManagerTest, InitialStateFailureOnlyWarns) {
    pairing.set_callbacks({
        .query_initial_state = [](Side) { return false; },
        .on_state_changed = nullptr,
    });

    auto status = pairing.attempt_pairing("BB", Side::Right);

    EXPECT_TRUE(status.ok());
    EXPECT_EQ(UnitState::Paired, pairing.state(Side::Right));
    EXPECT_TRUE(logger.contains(LogLevel::Warning, "Could not get initial state for Right glass"));
}

TEST_F(PairingManagerTest, AttemptPairingStateTransitions) {
    ASSERT_TRUE(pairing.attempt_pairing("AA", Side::Left).ok());

    std::vector<std::pair<Side, UnitState>> expected = {
        {Side::Left, UnitState::Pairing},
        {Side::Left, UnitState::Paired},
    };
    EXPECT_EQ(expected, transitions);
}

TEST_F(PairingManagerTest, VerifyWithoutAddressesDoesNotConnect) {
    auto status = pairing.verify_pairing();

    EXPECT_EQ(ErrorKind::ConfigIncomplete, status.error);
    EXPECT_TRUE(transport.connect_calls.empty());
}

TEST_F(PairingManagerTest, VerifyWithOneAddressDoesNotConnect) {
    config.set_address(Side::Left, "AA");

    EXPECT_EQ(ErrorKind::ConfigIncomplete, pairing.verify_pairing().error);
    EXPECT_TRUE(transport.connect_calls.empty());
}

TEST_F(PairingManagerTest, VerifyPairedUnitsProbesOnce) {
    save_addresses(true, true);

    auto status = pairing.verify_pairing();

    ASSERT_TRUE(status.ok());
    EXPECT_EQ((std::vector<std::string>{"AA", "BB"}), transport.connect_calls);
    EXPECT_EQ(5000ms, transport.connect_timeouts[0]);
    EXPECT_TRUE(transport.pair_calls.empty());
    EXPECT_EQ(2u, transport.disconnect_calls.size());
    EXPECT_EQ(0, config.save_calls);
    EXPECT_EQ(UnitState::Paired, pairing.state(Side::Left));
    EXPECT_EQ(UnitState::Paired, pairing.state(Side::Right));
}

TEST_F(PairingManagerTest, VerifyPairsUnflaggedUnits) {
    save_addresses(false, false);

    auto status = pairing.verify_pairing();

    ASSERT_TRUE(status.ok());
    EXPECT_EQ((std::vector<std::string>{"AA", "BB", "AA", "BB"}), transport.connect_calls);
    EXPECT_EQ((std::vector<std::string>{"AA", "BB"}), transport.pair_calls);
    EXPECT_TRUE(config.saved(Side::Left).paired);
    EXPECT_TRUE(config.saved(Side::Right).paired);
    EXPECT_EQ(2, config.save_calls);
}

TEST_F(PairingManagerTest, VerifySecondPassRunsWhenEitherFlagMissing) {
    save_addresses(true, false);

    ASSERT_TRUE(pairing.verify_pairing().ok());
    EXPECT_EQ(2u, transport.pair_calls.size());
    EXPECT_TRUE(config.saved(Side::Right).paired);
}

TEST_F(PairingManagerTest, VerifyFailsWhenUnitUnreachable) {
    save_addresses(false, false);
    transport.fail_connect("BB", 1);

    auto status = pairing.verify_pairing();

    EXPECT_EQ(ErrorKind::Connection, status.error);
    EXPECT_TRUE(transport.pair_calls.empty());
    EXPECT_EQ(0, config.save_calls);
    EXPECT_EQ(UnitState::Unknown, pairing.state(Side::Left));
    EXPECT_EQ(UnitState::Unknown, pairing.state(Side::Right));
}

TEST_F(PairingManagerTest, VerifyKeepsLeftFlagWhenRightPairingFails) {
    save_addresses(false, false);
    transport.fail_pair("BB", 1);

    auto status = pairing.verify_pairing();

    EXPECT_FALSE(status.ok());
    EXPECT_TRUE(config.saved(Side::Left).paired);
    EXPECT_FALSE(config.saved(Side::Right).paired);
    EXPECT_EQ(UnitState::Unknown, pairing.state(Side::Right));
}

TEST_F(PairingManagerTest, VerifyRollsBackFlagWhenSaveFails) {
    save_addresses(false, false);
    config.fail_save = true;

    auto status = pairing.verify_pairing();

    EXPECT_EQ(ErrorKind::Storage, status.error);
    EXPECT_FALSE(config.paired(Side::Left));
    EXPECT_FALSE(config.paired(Side::Right));
    EXPECT_EQ((std::vector<std::string>{"AA"}), transport.pair_calls);
    EXPECT_EQ(UnitState::Unknown, pairing.state(Side::Left));
}

TEST_F(PairingManagerTest, UnpairClearsAndPersists) {
    advertise_both();
    ASSERT_TRUE(pairing.pair_units().ok());

    auto status = pairing.unpair_units();

    ASSERT_TRUE(status.ok());
    EXPECT_FALSE(config.saved(Side::Left).address.has_value());
    EXPECT_FALSE(config.saved(Side::Right).address.has_value());
    EXPECT_FALSE(config.saved(Side::Left).paired);
    EXPECT_FALSE(config.complete());
    EXPECT_EQ(UnitState::Unknown, pairing.state(Side::Left));
    EXPECT_EQ(0, pairing.attempt(Side::Right));
}

TEST_F(PairingManagerTest, UnpairReportsSaveFailure) {
    save_addresses(true, true);
    config.fail_save = true;

    EXPECT_EQ(ErrorKind::Storage, pairing.unpair_units().error);
    EXPECT_FALSE(config.address(Side::Left).has_value());
}

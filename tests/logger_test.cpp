#include <gtest/gtest.h>

#include <connector/logger.hpp>

using namespace g1;

TEST(ConsoleLogger, InfoGoesToStdout) {
    ConsoleLogger logger;

    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    logger.info("pairing", "Starting glasses discovery...");
    std::string out = ::testing::internal::GetCapturedStdout();
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ("pairing: Starting glasses discovery...\n", out);
    EXPECT_TRUE(err.empty());
}

TEST(ConsoleLogger, WarningsGoToStderr) {
    ConsoleLogger logger;

    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    logger.warning("device", "Failed to set silent mode: unexpected response None");
    logger.error("pairing", "Could not find both glasses");
    std::string out = ::testing::internal::GetCapturedStdout();
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_TRUE(out.empty());
    EXPECT_EQ("device: Failed to set silent mode: unexpected response None\n"
              "pairing: Could not find both glasses\n", err);
}

TEST(ConsoleLogger, DebugFilteredByDefault) {
    ConsoleLogger logger;

    ::testing::internal::CaptureStdout();
    logger.debug("command", "-> AA [2c 01]");
    EXPECT_TRUE(::testing::internal::GetCapturedStdout().empty());

    logger.set_min_level(LogLevel::Debug);
    ::testing::internal::CaptureStdout();
    logger.debug("command", "-> AA [2c 01]");
    EXPECT_EQ("command: -> AA [2c 01]\n", ::testing::internal::GetCapturedStdout());
}

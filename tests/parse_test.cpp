#include <gtest/gtest.h>

#include <protocol/commands.hpp>
#include <protocol/packets.hpp>
#include <protocol/parse.hpp>

#include <vector>

using namespace g1;

TEST(Commands, SilentModeFrames) {
    EXPECT_EQ((std::vector<uint8_t>{0x22, 0x01}), commands::silent_mode::set(true));
    EXPECT_EQ((std::vector<uint8_t>{0x22, 0x00}), commands::silent_mode::set(false));
}

TEST(Commands, BatteryAndHeartbeat) {
    EXPECT_EQ((std::vector<uint8_t>{0x2C, 0x01}), commands::battery::request());
    EXPECT_EQ((std::vector<uint8_t>{0x25, 0x07}), commands::heartbeat::ping(7));
}

TEST(Packets, FromHex) {
    constexpr auto header = packets::from_hex("2c66");
    static_assert(header.size() == 2);
    EXPECT_EQ(0x2C, header[0]);
    EXPECT_EQ(0x66, header[1]);
}

TEST(Parse, IdentifyFrame) {
    std::vector<uint8_t> battery{0x2C, 0x66, 50};
    std::vector<uint8_t> ack{0x22, 0xC9};
    std::vector<uint8_t> heartbeat{0x25, 0x01};
    std::vector<uint8_t> rejected{0x22, 0xCA};
    std::vector<uint8_t> empty;

    EXPECT_EQ(parse::FrameType::Battery, parse::identify_frame(battery));
    EXPECT_EQ(parse::FrameType::DashboardAck, parse::identify_frame(ack));
    EXPECT_EQ(parse::FrameType::Heartbeat, parse::identify_frame(heartbeat));
    EXPECT_EQ(parse::FrameType::Unknown, parse::identify_frame(rejected));
    EXPECT_EQ(parse::FrameType::Unknown, parse::identify_frame(empty));
}

TEST(Parse, ResponseStatus) {
    std::vector<uint8_t> ack{0x22, 0xC9};
    std::vector<uint8_t> rejected{0x22, 0xCA};
    std::vector<uint8_t> short_frame{0x22};

    EXPECT_EQ(packets::status::COMMAND_RESPONSE, parse::response_status(ack));
    EXPECT_TRUE(parse::is_acknowledged(ack));
    EXPECT_EQ(packets::status::COMMAND_REJECTED, parse::response_status(rejected));
    EXPECT_FALSE(parse::is_acknowledged(rejected));
    EXPECT_FALSE(parse::response_status(short_frame).has_value());
    EXPECT_FALSE(parse::is_acknowledged(short_frame));
}

TEST(Parse, Battery) {
    std::vector<uint8_t> report{0x2C, 0x66, 87, 0x00};
    std::vector<uint8_t> full{0x2C, 0x66, 100};

    EXPECT_EQ(87, parse::parse_battery(report));
    EXPECT_EQ(100, parse::parse_battery(full));
}

TEST(Parse, BatteryRejectsMalformed) {
    std::vector<uint8_t> truncated{0x2C, 0x66};
    std::vector<uint8_t> out_of_range{0x2C, 0x66, 101};
    std::vector<uint8_t> other{0x22, 0xC9, 50};

    EXPECT_FALSE(parse::parse_battery(truncated).has_value());
    EXPECT_FALSE(parse::parse_battery(out_of_range).has_value());
    EXPECT_FALSE(parse::parse_battery(other).has_value());
}

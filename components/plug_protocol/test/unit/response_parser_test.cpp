#include <gtest/gtest.h>

#include "plug_protocol/response_parser.hpp"

using namespace plug_protocol;

TEST(ResponseParserTest, SessionIdFromLoginReply) {
    std::vector<uint8_t> reply(20, 0x00);
    reply[16] = 0x0A;
    reply[17] = 0x1B;
    reply[18] = 0x2C;
    reply[19] = 0x3D;

    const auto sessionId = ResponseParser::parseSessionId(reply);
    ASSERT_TRUE(sessionId.has_value());
    EXPECT_EQ(*sessionId, "0a1b2c3d");
}

TEST(ResponseParserTest, ShortLoginReplyRejected) {
    EXPECT_FALSE(ResponseParser::parseSessionId(std::vector<uint8_t>(19, 0xAA)).has_value());
    EXPECT_FALSE(ResponseParser::parseSessionId({}).has_value());
}

TEST(ResponseParserTest, FullStatusReply) {
    std::vector<uint8_t> reply(100, 0x00);
    reply[75] = 0x01;
    reply[77] = 0x4C;
    reply[78] = 0x04;

    const auto status = ResponseParser::parseStatus(reply);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, DeviceState::ON);
    EXPECT_EQ(status->powerConsumption, 1100);
}

TEST(ResponseParserTest, StatusStateByteMapping) {
    std::vector<uint8_t> reply(100, 0x00);

    reply[75] = 0x00;
    EXPECT_EQ(ResponseParser::parseStatus(reply)->state, DeviceState::OFF);

    reply[75] = 0x02;
    EXPECT_EQ(ResponseParser::parseStatus(reply)->state, DeviceState::UNKNOWN);
}

TEST(ResponseParserTest, ShortStatusReplyRejected) {
    EXPECT_FALSE(ResponseParser::parseStatus(std::vector<uint8_t>(49, 0x01)).has_value());
}

TEST(ResponseParserTest, StatusReplyTooShortForStateDefaultsOff) {
    const auto status = ResponseParser::parseStatus(std::vector<uint8_t>(75, 0x01));
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, DeviceState::OFF);
    EXPECT_EQ(status->powerConsumption, 0);
}

TEST(ResponseParserTest, StatusReplyTooShortForPowerReportsZero) {
    std::vector<uint8_t> reply(78, 0x00);
    reply[75] = 0x01;
    reply[77] = 0xFF;

    const auto status = ResponseParser::parseStatus(reply);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->state, DeviceState::ON);
    EXPECT_EQ(status->powerConsumption, 0);
}

TEST(ResponseParserTest, RenameAcknowledgement) {
    EXPECT_TRUE(ResponseParser::isRenameAcknowledged(std::vector<uint8_t>(20, 0x00)));
    EXPECT_FALSE(ResponseParser::isRenameAcknowledged(std::vector<uint8_t>(19, 0x00)));
}

#include <gtest/gtest.h>

#include "plug_protocol/packet_builder.hpp"
#include "plug_protocol/error.hpp"
#include "plug_protocol/hex.hpp"

using namespace plug_protocol;

class PacketBuilderTest : public ::testing::Test {
protected:
    const std::string timestamp = "5f5e1000";
    const std::string sessionId = "0a1b2c3d";
    const std::string deviceId = "a1b2c3";

    static uint16_t lengthField(const std::vector<uint8_t>& bytes) {
        return static_cast<uint16_t>(bytes[2] | (bytes[3] << 8));
    }

    PacketBuilder session(PacketType type) const {
        auto builder = PacketBuilder::create(type);
        builder.setTimestamp(timestamp).setSessionId(sessionId).setDeviceId(deviceId);
        return builder;
    }
};

TEST_F(PacketBuilderTest, LoginPacket) {
    auto builder = PacketBuilder::create(PacketType::LOGIN);
    builder.setTimestamp(timestamp);

    const std::string payload = builder.build();
    EXPECT_EQ(payload.size(), 156u);
    EXPECT_EQ(payload.substr(0, 24), "fef052000232a10000000000");
    EXPECT_EQ(payload.substr(48, 8), timestamp);

    const std::string signedHex = builder.buildSigned();
    EXPECT_EQ(signedHex.substr(payload.size()), "00d95641");

    const auto bytes = builder.toBinary();
    EXPECT_EQ(bytes.size(), 82u);
    EXPECT_EQ(lengthField(bytes), bytes.size());
}

TEST_F(PacketBuilderTest, StatusPacket) {
    const auto builder = session(PacketType::GET_STATE);

    const std::string payload = builder.build();
    EXPECT_EQ(payload,
              "fef03000023201030a1b2c3d340001000000000000000000"
              "5f5e100000000000000000000000f0fea1b2c300");
    EXPECT_EQ(builder.buildSigned().substr(payload.size()), "5f1c3335");

    const auto bytes = builder.toBinary();
    EXPECT_EQ(bytes.size(), 48u);
    EXPECT_EQ(lengthField(bytes), bytes.size());
}

TEST_F(PacketBuilderTest, ControlPacketOn) {
    auto builder = session(PacketType::CONTROL);
    builder.setCommand(PowerCommand::ON);

    const std::string payload = builder.build();
    EXPECT_EQ(payload.size(), 178u);
    EXPECT_EQ(payload.substr(payload.size() - 20), "00010600010000000000");
    EXPECT_EQ(builder.buildSigned().substr(payload.size()), "f1a3136d");

    const auto bytes = builder.toBinary();
    EXPECT_EQ(bytes.size(), 93u);
    EXPECT_EQ(lengthField(bytes), bytes.size());
}

TEST_F(PacketBuilderTest, ControlPacketOff) {
    auto builder = session(PacketType::CONTROL);
    builder.setCommand(PowerCommand::OFF);

    const std::string payload = builder.build();
    EXPECT_EQ(payload.substr(payload.size() - 20), "00010600000000000000");
    EXPECT_EQ(builder.buildSigned().substr(payload.size()), "51e68489");
}

TEST_F(PacketBuilderTest, RenamePacket) {
    auto builder = session(PacketType::RENAME);
    builder.setDeviceName("Kitchen");

    const std::string payload = builder.build();
    EXPECT_EQ(payload.size(), 224u);
    EXPECT_EQ(payload.substr(160), PacketBuilder::encodeDeviceName("Kitchen"));
    EXPECT_EQ(builder.buildSigned().substr(payload.size()), "5b2a169c");

    const auto bytes = builder.toBinary();
    EXPECT_EQ(bytes.size(), 116u);
    EXPECT_EQ(lengthField(bytes), bytes.size());
}

TEST_F(PacketBuilderTest, MissingFieldsThrow) {
    EXPECT_THROW(PacketBuilder::create(PacketType::LOGIN).build(), ValidationError);

    auto noSession = PacketBuilder::create(PacketType::GET_STATE);
    noSession.setTimestamp(timestamp).setDeviceId(deviceId);
    EXPECT_THROW(noSession.build(), ValidationError);

    EXPECT_THROW(session(PacketType::CONTROL).build(), ValidationError);
    EXPECT_THROW(session(PacketType::RENAME).build(), ValidationError);
}

TEST_F(PacketBuilderTest, DeviceIdValidation) {
    auto builder = PacketBuilder::create(PacketType::GET_STATE);
    EXPECT_THROW(builder.setDeviceId("a1b2c"), InvalidDeviceIdError);
    EXPECT_THROW(builder.setDeviceId("a1b2c3d4"), InvalidDeviceIdError);
    EXPECT_THROW(builder.setDeviceId("zzzzzz"), InvalidDeviceIdError);
    EXPECT_THROW(builder.setDeviceId(""), InvalidDeviceIdError);
    EXPECT_NO_THROW(builder.setDeviceId("A1B2C3"));
}

TEST_F(PacketBuilderTest, SessionFieldValidation) {
    auto builder = PacketBuilder::create(PacketType::GET_STATE);
    EXPECT_THROW(builder.setTimestamp("5f5e10"), ValidationError);
    EXPECT_THROW(builder.setSessionId("not-hex!"), ValidationError);
}

TEST(DeviceNameEncodingTest, ShortestAndLongestNamesAccepted) {
    const std::string twoBytes = PacketBuilder::encodeDeviceName("ab");
    EXPECT_EQ(twoBytes.size(), 64u);
    EXPECT_EQ(twoBytes.substr(0, 4), "6162");
    EXPECT_EQ(twoBytes.substr(4), std::string(60, '0'));

    const std::string longest(32, 'x');
    const std::string encoded = PacketBuilder::encodeDeviceName(longest);
    EXPECT_EQ(encoded.size(), 64u);
    EXPECT_EQ(hex::decode(encoded), std::vector<uint8_t>(32, 'x'));
}

TEST(DeviceNameEncodingTest, OutOfRangeLengthsRejected) {
    try {
        PacketBuilder::encodeDeviceName("a");
        FAIL() << "Expected InvalidNameLengthError";
    } catch (const InvalidNameLengthError& e) {
        EXPECT_EQ(e.length(), 1u);
    }

    try {
        PacketBuilder::encodeDeviceName(std::string(33, 'x'));
        FAIL() << "Expected InvalidNameLengthError";
    } catch (const InvalidNameLengthError& e) {
        EXPECT_EQ(e.length(), 33u);
    }

    EXPECT_THROW(PacketBuilder::encodeDeviceName(""), InvalidNameLengthError);
}

TEST(DeviceNameEncodingTest, LengthIsCountedInUtf8Bytes) {
    // "é" is two bytes, so a single accented character is a valid name
    EXPECT_NO_THROW(PacketBuilder::encodeDeviceName("\xC3\xA9"));

    // 11 three-byte characters = 33 bytes
    std::string tooLong;
    for (int i = 0; i < 11; ++i) {
        tooLong += "\xE2\x82\xAC";
    }
    EXPECT_THROW(PacketBuilder::encodeDeviceName(tooLong), InvalidNameLengthError);
}

TEST(TimestampFormatTest, EightLowercaseHexDigits) {
    EXPECT_EQ(PacketBuilder::formatTimestamp(0x5F5E1000u), "5f5e1000");
    EXPECT_EQ(PacketBuilder::formatTimestamp(0x1u), "00000001");
    EXPECT_EQ(PacketBuilder::formatTimestamp(0xFFFFFFFFu), "ffffffff");
}

#include "plugctl/target_resolver.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace plugctl;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

class MockPairingStore : public device_store::IPairingStore {
public:
    MOCK_METHOD(std::optional<DeviceTarget>, resolve, (const std::string& alias), (override));
    MOCK_METHOD(bool, recordSighting, (const plug_protocol::DeviceRecord& record), (override));
};

TargetOptions target(std::optional<std::string> ip,
                     std::optional<std::string> deviceId,
                     std::optional<std::string> alias) {
    return TargetOptions{std::move(ip), std::move(deviceId), std::move(alias)};
}

} // namespace

class TargetResolverTest : public ::testing::Test {
protected:
    StrictMock<MockPairingStore> store_;
};

TEST_F(TargetResolverTest, IpAndDeviceIdAreUsedDirectly) {
    auto result = resolveTarget(target("10.0.0.5", "a1b2c3", std::nullopt), store_);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value.ipAddress, "10.0.0.5");
    EXPECT_EQ(result.value.deviceId, "a1b2c3");
}

TEST_F(TargetResolverTest, AliasIsLookedUp) {
    EXPECT_CALL(store_, resolve("kitchen"))
        .WillOnce(Return(std::optional<DeviceTarget>(DeviceTarget{"10.0.0.9", "d4e5f6"})));

    auto result = resolveTarget(target(std::nullopt, std::nullopt, "kitchen"), store_);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value.ipAddress, "10.0.0.9");
    EXPECT_EQ(result.value.deviceId, "d4e5f6");
}

TEST_F(TargetResolverTest, UnknownAliasIsNotFound) {
    EXPECT_CALL(store_, resolve("garage")).WillOnce(Return(std::nullopt));

    auto result = resolveTarget(target(std::nullopt, std::nullopt, "garage"), store_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::NOT_FOUND);
    EXPECT_EQ(result.errorMessage, "No paired device found with alias 'garage'");
}

TEST_F(TargetResolverTest, InvalidCombinationsAreRejected) {
    struct Case {
        TargetOptions options;
        std::string message;
    };
    const std::vector<Case> cases = {
        {target("10.0.0.5", "a1b2c3", "kitchen"),
         "Cannot specify both IP/device-id and alias. Use either --ip and --device-id, or --alias."},
        {target("10.0.0.5", std::nullopt, std::nullopt),
         "When using IP/device-id, both --ip and --device-id are required."},
        {target(std::nullopt, "a1b2c3", std::nullopt),
         "When using IP/device-id, both --ip and --device-id are required."},
        {target(std::nullopt, std::nullopt, std::nullopt),
         "Must specify either --ip and --device-id, or --alias for a paired device."},
        {target("10.0.0.5", std::nullopt, "kitchen"),
         "Cannot mix IP/device-id with alias. Use either --ip and --device-id, or --alias."},
        {target(std::nullopt, "a1b2c3", "kitchen"),
         "Cannot mix IP/device-id with alias. Use either --ip and --device-id, or --alias."},
    };

    for (const auto& testCase : cases) {
        auto result = resolveTarget(testCase.options, store_);
        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.errorCode, ErrorCode::INVALID_ARGUMENT);
        EXPECT_EQ(result.errorMessage, testCase.message);
    }
}

#include "device_store/device_cache.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace device_store;
using device_store::test::makeRecord;

TEST(DeviceCacheTest, AddNewDeviceStartsCountAtOne) {
    DeviceCache cache;
    cache.addDevice(makeRecord("a1b2c3"), 1000);

    ASSERT_EQ(cache.size(), 1u);
    const auto& cached = cache.devices().at("a1b2c3");
    EXPECT_EQ(cached.lastSeen, 1000u);
    EXPECT_EQ(cached.discoveryCount, 1u);
    EXPECT_EQ(cache.lastUpdated(), 1000u);
}

TEST(DeviceCacheTest, AddKnownDeviceRefreshesRecord) {
    DeviceCache cache;
    cache.addDevice(makeRecord("a1b2c3", "192.168.1.50"), 1000);
    cache.addDevice(makeRecord("a1b2c3", "192.168.1.77"), 1500);

    ASSERT_EQ(cache.size(), 1u);
    const auto& cached = cache.devices().at("a1b2c3");
    EXPECT_EQ(cached.device.ipAddress, "192.168.1.77");
    EXPECT_EQ(cached.lastSeen, 1500u);
    EXPECT_EQ(cached.discoveryCount, 2u);
}

TEST(DeviceCacheTest, FreshDevicesRespectsMaxAge) {
    DeviceCache cache;
    cache.addDevice(makeRecord("000001"), 1000);
    cache.addDevice(makeRecord("000002"), 4000);

    auto fresh = cache.freshDevices(3600, 4601);
    ASSERT_EQ(fresh.size(), 1u);
    EXPECT_EQ(fresh[0].deviceId, "000002");

    // Exactly at the cutoff still counts as fresh
    EXPECT_EQ(cache.freshDevices(3600, 4600).size(), 2u);
}

TEST(DeviceCacheTest, FreshDevicesSaturatesWhenMaxAgeExceedsNow) {
    DeviceCache cache;
    cache.addDevice(makeRecord("000001"), 0);

    EXPECT_EQ(cache.freshDevices(3600, 10).size(), 1u);
}

TEST(DeviceCacheTest, RemoveOldDevicesDropsStaleEntries) {
    DeviceCache cache;
    cache.addDevice(makeRecord("000001"), 100);
    cache.addDevice(makeRecord("000002"), 5000);
    cache.addDevice(makeRecord("000003"), 7000);

    EXPECT_EQ(cache.removeOldDevices(7200, 8000), 1u);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.devices().count("000001"), 0u);
    EXPECT_EQ(cache.lastUpdated(), 8000u);

    EXPECT_EQ(cache.removeOldDevices(7200, 8000), 0u);
}

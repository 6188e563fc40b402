#include "plugctl/commands.hpp"

#include "device_store/store_file.hpp"
#include "plug_session/clock.hpp"
#include "plug_session/connection.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <random>
#include <sstream>

using namespace plugctl;
using device_store::Timestamp;
using plug_protocol::DeviceRecord;
using plug_protocol::DeviceState;

namespace {

constexpr Timestamp NOW = 1700000000;

DeviceRecord makeRecord(const std::string& deviceId, const std::string& name) {
    DeviceRecord record;
    record.deviceId = deviceId;
    record.deviceKey = "5a";
    record.ipAddress = "192.168.1.50";
    record.macAddress = "12:A4:3F:9B:0C:7E";
    record.name = name;
    record.deviceType = plug_protocol::POWER_PLUG_DEVICE_TYPE;
    record.state = DeviceState::ON;
    record.powerConsumption = 1100;
    return record;
}

// Every connection attempt is refused
class RefusingConnection : public plug_session::IConnection {
public:
    plug_protocol::VoidResult connect(const std::string& host, uint16_t, std::chrono::milliseconds) override {
        return plug_protocol::makeErrorResult(plug_protocol::ErrorCode::CONNECT_ERROR,
                                              "Connection refused by " + host);
    }
    plug_protocol::VoidResult write(const std::vector<uint8_t>&, std::chrono::milliseconds) override {
        return plug_protocol::makeErrorResult(plug_protocol::ErrorCode::TRANSPORT_ERROR, "not connected");
    }
    plug_protocol::Result<std::vector<uint8_t>> read(size_t, std::chrono::milliseconds) override {
        return plug_protocol::Result<std::vector<uint8_t>>::error(plug_protocol::ErrorCode::TRANSPORT_ERROR,
                                                                 "not connected");
    }
    void close() override {}
};

class RefusingConnectionFactory : public plug_session::IConnectionFactory {
public:
    std::unique_ptr<plug_session::IConnection> createConnection() override {
        ++created;
        return std::make_unique<RefusingConnection>();
    }
    int created = 0;
};

class NoSleepClock : public plug_session::IClock {
public:
    uint32_t nowSeconds() override { return static_cast<uint32_t>(NOW); }
    void sleepFor(std::chrono::milliseconds) override {}
};

} // namespace

class CommandRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = std::filesystem::temp_directory_path() / ("plugctl_test_" + std::to_string(rd()));
        std::filesystem::create_directories(dir_);

        device_store::StoreFile storeFile(dir_ / device_store::DEFAULT_STORE_FILE_NAME);
        cacheStore_ = std::make_shared<device_store::CacheStore>(storeFile);
        pairingStore_ = std::make_shared<device_store::PairingStore>(storeFile, [] { return NOW; });
        connectionFactory_ = std::make_shared<RefusingConnectionFactory>();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::unique_ptr<CommandRunner> makeRunner() {
        CommandRunner::Dependencies dependencies;
        dependencies.cacheStore = cacheStore_;
        dependencies.pairingStore = pairingStore_;
        dependencies.scan = [this](std::chrono::milliseconds duration) {
            ++scans_;
            lastScanDuration_ = duration;
            return plug_protocol::Result<std::vector<DeviceRecord>>::ok(network_);
        };
        auto factory = connectionFactory_;
        dependencies.sessionFactory = [factory](const DeviceTarget& target) {
            return std::make_unique<plug_session::SessionController>(
                target.ipAddress, target.deviceId, plug_session::SessionController::Config{},
                factory, std::make_shared<NoSleepClock>());
        };
        dependencies.now = [] { return NOW; };
        return std::make_unique<CommandRunner>(AppConfig{}, dependencies, out_, in_);
    }

    void cacheDevice(const DeviceRecord& record, Timestamp seenAt) {
        device_store::DeviceCache cache = cacheStore_->loadCache();
        cache.addDevice(record, seenAt);
        cacheStore_->saveCache(cache);
    }

    void pairDevice(const DeviceRecord& record, const std::string& alias, Timestamp at) {
        auto table = pairingStore_->loadTable();
        ASSERT_TRUE(table.pairDevice(record, alias, at).success);
        pairingStore_->saveTable(table);
    }

    bool outputContains(const std::string& text) const {
        return out_.str().find(text) != std::string::npos;
    }

    std::filesystem::path dir_;
    std::shared_ptr<device_store::CacheStore> cacheStore_;
    std::shared_ptr<device_store::PairingStore> pairingStore_;
    std::shared_ptr<RefusingConnectionFactory> connectionFactory_;
    std::vector<DeviceRecord> network_;
    int scans_ = 0;
    std::chrono::milliseconds lastScanDuration_{0};
    std::ostringstream out_;
    std::istringstream in_;
};

TEST_F(CommandRunnerTest, DiscoverListsDevicesWithPairingStatus) {
    network_ = {makeRecord("a1b2c3", "Kitchen"), makeRecord("d4e5f6", "Heater")};
    pairDevice(makeRecord("a1b2c3", "Kitchen"), "kitchen", NOW - 10);

    DiscoverOptions options;
    options.timeout = std::chrono::seconds(2);
    EXPECT_EQ(makeRunner()->discover(options), 0);

    EXPECT_EQ(scans_, 1);
    EXPECT_EQ(lastScanDuration_, std::chrono::milliseconds(2000));
    EXPECT_TRUE(outputContains("Discovered 2 device(s)"));
    EXPECT_TRUE(outputContains("Kitchen (192.168.1.50) [PAIRED as 'kitchen']"));
    EXPECT_TRUE(outputContains("Heater (192.168.1.50) [NOT PAIRED]"));
    EXPECT_TRUE(outputContains("plugctl pair --device-id d4e5f6 --alias \"Heater\""));
    EXPECT_EQ(cacheStore_->loadCache().size(), 2u);
}

TEST_F(CommandRunnerTest, DiscoverCacheOnlyDoesNotScan) {
    cacheDevice(makeRecord("a1b2c3", "Kitchen"), NOW - 60);

    DiscoverOptions options;
    options.cacheOnly = true;
    EXPECT_EQ(makeRunner()->discover(options), 0);

    EXPECT_EQ(scans_, 0);
    EXPECT_TRUE(outputContains("Discovered 1 device(s)"));
}

TEST_F(CommandRunnerTest, DiscoverWithNothingFound) {
    EXPECT_EQ(makeRunner()->discover(DiscoverOptions{}), 0);
    EXPECT_TRUE(outputContains("No devices found"));
}

TEST_F(CommandRunnerTest, PairUsesCachedDevice) {
    cacheDevice(makeRecord("a1b2c3", "Kitchen"), NOW - 60);

    EXPECT_EQ(makeRunner()->pair("a1b2c3", "kitchen"), 0);

    EXPECT_EQ(scans_, 0);
    EXPECT_TRUE(outputContains("Device paired successfully!"));
    auto paired = pairingStore_->loadTable().deviceByAlias("kitchen");
    ASSERT_TRUE(paired.has_value());
    EXPECT_EQ(paired->pairedAt, NOW);
}

TEST_F(CommandRunnerTest, PairDiscoversUnknownDevice) {
    network_ = {makeRecord("d4e5f6", "Heater")};

    EXPECT_EQ(makeRunner()->pair("d4e5f6", "heater"), 0);

    EXPECT_EQ(scans_, 1);
    EXPECT_EQ(lastScanDuration_, std::chrono::milliseconds(10000));
    EXPECT_TRUE(pairingStore_->loadTable().deviceByAlias("heater").has_value());
}

TEST_F(CommandRunnerTest, PairFailsWhenDeviceIsNowhere) {
    EXPECT_EQ(makeRunner()->pair("d4e5f6", "heater"), 1);

    EXPECT_TRUE(outputContains("Device with ID 'd4e5f6' not found on network"));
    EXPECT_TRUE(pairingStore_->loadTable().empty());
}

TEST_F(CommandRunnerTest, PairRejectsAliasInUse) {
    cacheDevice(makeRecord("d4e5f6", "Heater"), NOW - 60);
    pairDevice(makeRecord("a1b2c3", "Kitchen"), "kitchen", NOW - 100);

    EXPECT_EQ(makeRunner()->pair("d4e5f6", "kitchen"), 1);
    EXPECT_TRUE(outputContains("Alias 'kitchen' is already in use"));
}

TEST_F(CommandRunnerTest, UnpairAsksForConfirmation) {
    pairDevice(makeRecord("a1b2c3", "Kitchen"), "kitchen", NOW - 100);

    in_.str("n\n");
    EXPECT_EQ(makeRunner()->unpair("kitchen", false), 0);
    EXPECT_TRUE(outputContains("Are you sure? (y/N)"));
    EXPECT_TRUE(outputContains("Unpair cancelled"));
    EXPECT_FALSE(pairingStore_->loadTable().empty());

    in_.clear();
    in_.str("  Yes\n");
    EXPECT_EQ(makeRunner()->unpair("kitchen", false), 0);
    EXPECT_TRUE(outputContains("Device 'kitchen' unpaired successfully"));
    EXPECT_TRUE(pairingStore_->loadTable().empty());
}

TEST_F(CommandRunnerTest, UnpairForcedSkipsPrompt) {
    pairDevice(makeRecord("a1b2c3", "Kitchen"), "kitchen", NOW - 100);

    EXPECT_EQ(makeRunner()->unpair("kitchen", true), 0);
    EXPECT_FALSE(outputContains("Are you sure?"));
    EXPECT_TRUE(pairingStore_->loadTable().empty());
}

TEST_F(CommandRunnerTest, UnpairUnknownAliasFails) {
    EXPECT_EQ(makeRunner()->unpair("garage", true), 1);
    EXPECT_TRUE(outputContains("No paired device found with alias 'garage'"));
}

TEST_F(CommandRunnerTest, ListPairedShowsOnlineMarkerAndDetails) {
    pairDevice(makeRecord("a1b2c3", "Kitchen"), "kitchen", NOW - 120);
    pairDevice(makeRecord("d4e5f6", "Heater"), "heater", NOW - 2 * 86400);

    EXPECT_EQ(makeRunner()->listPaired(true), 0);

    EXPECT_TRUE(outputContains("Paired devices (2):"));
    EXPECT_TRUE(outputContains("[online] kitchen (192.168.1.50)"));
    EXPECT_TRUE(outputContains("[offline] heater (192.168.1.50)"));
    EXPECT_TRUE(outputContains("Paired: 2 minutes ago"));
    EXPECT_TRUE(outputContains("Last seen: 2 days ago"));
}

TEST_F(CommandRunnerTest, ListPairedWhenEmpty) {
    EXPECT_EQ(makeRunner()->listPaired(false), 0);
    EXPECT_TRUE(outputContains("No paired devices found"));
}

TEST_F(CommandRunnerTest, ClearCacheDeletesStoreFile) {
    cacheDevice(makeRecord("a1b2c3", "Kitchen"), NOW - 60);
    ASSERT_TRUE(cacheStore_->file().exists());

    EXPECT_EQ(makeRunner()->clearCache(true), 0);
    EXPECT_FALSE(cacheStore_->file().exists());
    EXPECT_TRUE(outputContains("Cache cleared successfully"));
}

TEST_F(CommandRunnerTest, ClearCacheWithoutFile) {
    EXPECT_EQ(makeRunner()->clearCache(false), 0);
    EXPECT_TRUE(outputContains("No cache file found"));
}

TEST_F(CommandRunnerTest, PowerCommandWithBadTargetDoesNotConnect) {
    TargetOptions target;
    target.ipAddress = "192.168.1.50";

    EXPECT_EQ(makeRunner()->turnOn(target), 1);
    EXPECT_EQ(connectionFactory_->created, 0);
    EXPECT_TRUE(outputContains("both --ip and --device-id are required"));
}

TEST_F(CommandRunnerTest, StatusReportsConnectionFailure) {
    pairDevice(makeRecord("a1b2c3", "Kitchen"), "kitchen", NOW - 100);

    TargetOptions target;
    target.alias = "kitchen";
    EXPECT_EQ(makeRunner()->status(target), 1);

    EXPECT_EQ(connectionFactory_->created, 1);
    EXPECT_TRUE(outputContains("Failed to get status: Connection refused by 192.168.1.50"));
}

#include "plugctl/commands.hpp"

#include "device_store/error.hpp"
#include "plug_discovery/discovery_listener.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

#include <spdlog/spdlog.h>

namespace plugctl {

using device_store::PairingTable;
using device_store::StoreError;
using plug_protocol::DeviceRecord;
using plug_protocol::PowerCommand;

CommandRunner::Dependencies CommandRunner::defaultDependencies(const AppConfig& config) {
    device_store::StoreFile storeFile(config.store.path.empty()
        ? device_store::StoreFile::defaultPath()
        : std::filesystem::path(config.store.path));

    Dependencies dependencies;
    dependencies.cacheStore = std::make_shared<device_store::CacheStore>(storeFile);
    dependencies.pairingStore = std::make_shared<device_store::PairingStore>(storeFile);

    const auto listenerConfig = config.discovery;
    dependencies.scan = [listenerConfig](std::chrono::milliseconds duration) {
        plug_discovery::DiscoveryListener listener(listenerConfig);
        listener.setSightingHandler([](const DeviceRecord& record) {
            spdlog::debug("Device {} seen again at {}", record.deviceId, record.ipAddress);
        });
        return listener.listen(duration);
    };

    const auto sessionConfig = config.session;
    dependencies.sessionFactory = [sessionConfig](const DeviceTarget& target) {
        return std::make_unique<plug_session::SessionController>(target.ipAddress, target.deviceId, sessionConfig);
    };

    dependencies.now = device_store::currentTimestamp;
    return dependencies;
}

CommandRunner::CommandRunner(const AppConfig& config, Dependencies dependencies, std::ostream& out, std::istream& in)
    : config_(config)
    , dependencies_(std::move(dependencies))
    , out_(out)
    , in_(in)
{
}

int CommandRunner::discover(const DiscoverOptions& options) {
    spdlog::info("Starting device discovery - timeout: {}s, no_cache: {}, cache_timeout: {}s, cache_only: {}",
                 options.timeout.count(), options.noCache, options.cacheTimeout.count(), options.cacheOnly);

    auto service = makeDiscoveryService(!options.noCache, options.cacheTimeout);
    auto result = options.cacheOnly
        ? service.discoverFromCacheOnly()
        : service.discover(std::chrono::duration_cast<std::chrono::milliseconds>(options.timeout));

    if (!result) {
        return fail("Discovery failed: " + result.errorMessage);
    }

    const auto& devices = result.value;
    if (devices.empty()) {
        out_ << "No devices found. Make sure your plugs are on the same network." << std::endl;
        return 0;
    }

    const PairingTable pairing = loadPairingOrEmpty();
    std::vector<DeviceRecord> unpaired;

    out_ << "\nDiscovered " << devices.size() << " device(s):" << std::endl;
    for (const auto& device : devices) {
        const auto alias = pairing.aliasFor(device.deviceId);
        out_ << "  * " << device.name << " (" << device.ipAddress << ") ";
        if (alias) {
            out_ << "[PAIRED as '" << *alias << "']";
        } else {
            out_ << "[NOT PAIRED]";
            unpaired.push_back(device);
        }
        out_ << "\n    ID: " << device.deviceId << ", Key: " << device.deviceKey << ", MAC: " << device.macAddress
             << "\n    State: " << plug_protocol::toString(device.state)
             << ", Power: " << device.powerConsumption << "W\n" << std::endl;
    }

    if (!unpaired.empty()) {
        out_ << "To pair unpaired devices:" << std::endl;
        for (const auto& device : unpaired) {
            out_ << "   plugctl pair --device-id " << device.deviceId << " --alias \"" << device.name << "\"" << std::endl;
        }
        out_ << std::endl;
    }
    return 0;
}

int CommandRunner::turnOn(const TargetOptions& target) {
    return setPower(target, PowerCommand::ON);
}

int CommandRunner::turnOff(const TargetOptions& target) {
    return setPower(target, PowerCommand::OFF);
}

int CommandRunner::setPower(const TargetOptions& target, PowerCommand command) {
    auto session = openSession(target);
    if (!session) {
        return 1;
    }

    const std::string label = command == PowerCommand::ON ? "ON" : "OFF";
    auto result = session->setPowerState(command);
    if (!result) {
        spdlog::error("Failed to turn device {}: {}", label, result.errorMessage);
        return fail("Failed to turn device " + label + ": " + result.errorMessage);
    }

    spdlog::info("Successfully turned device {}", label);
    out_ << "Device turned " << label << std::endl;
    return 0;
}

int CommandRunner::status(const TargetOptions& target) {
    auto session = openSession(target);
    if (!session) {
        return 1;
    }

    auto result = session->getStatus();
    if (!result) {
        spdlog::error("Failed to get device status: {}", result.errorMessage);
        return fail("Failed to get status: " + result.errorMessage);
    }

    out_ << "Device Status:\n"
         << "  State: " << plug_protocol::toString(result.value.state) << "\n"
         << "  Power: " << result.value.powerConsumption << "W" << std::endl;
    return 0;
}

int CommandRunner::rename(const TargetOptions& target, const std::string& newName) {
    auto session = openSession(target);
    if (!session) {
        return 1;
    }

    auto result = session->setDeviceName(newName);
    if (!result) {
        return fail("Failed to change device name: " + result.errorMessage);
    }

    out_ << "Device name changed to '" << newName << "'\n"
         << "   Note: It may take a few moments for the change to appear in discovery" << std::endl;
    return 0;
}

int CommandRunner::pair(const std::string& deviceId, const std::string& alias) {
    spdlog::info("Pairing device - device_id: {}, alias: {}", deviceId, alias);

    try {
        std::optional<DeviceRecord> device;

        const auto cache = dependencies_.cacheStore->loadCache();
        auto cached = cache.devices().find(deviceId);
        if (cached != cache.devices().end()) {
            device = cached->second.device;
        } else {
            spdlog::info("Device {} not found in cache, starting discovery", deviceId);
            out_ << "Device " << deviceId << " is not cached, searching the network..." << std::endl;

            auto service = makeDiscoveryService(true, config_.store.cacheMaxAge);
            auto result = service.discover(std::chrono::duration_cast<std::chrono::milliseconds>(PAIR_DISCOVERY_TIMEOUT));
            if (!result) {
                return fail("Discovery failed: " + result.errorMessage);
            }

            auto found = std::find_if(result.value.begin(), result.value.end(),
                                      [&deviceId](const DeviceRecord& record) { return record.deviceId == deviceId; });
            if (found == result.value.end()) {
                return fail("Device with ID '" + deviceId + "' not found on network\n"
                            "   Make sure the device is powered on and connected");
            }
            device = *found;
        }

        PairingTable pairing = dependencies_.pairingStore->loadTable();
        auto pairResult = pairing.pairDevice(*device, alias, dependencies_.now());
        if (!pairResult) {
            spdlog::error("Failed to pair device {}: {}", deviceId, pairResult.errorMessage);
            return fail(pairResult.errorMessage);
        }
        dependencies_.pairingStore->saveTable(pairing);

        out_ << "Device paired successfully!\n"
             << "   Device: " << device->name << " (" << deviceId << ")\n"
             << "   Alias: " << alias << "\n"
             << "   IP: " << device->ipAddress << std::endl;
        return 0;
    } catch (const StoreError& e) {
        return fail(e.what());
    }
}

int CommandRunner::unpair(const std::string& alias, bool force) {
    try {
        PairingTable pairing = dependencies_.pairingStore->loadTable();

        const auto device = pairing.deviceByAlias(alias);
        if (!device) {
            return fail("No paired device found with alias '" + alias + "'");
        }

        if (!force && !confirm("This will unpair device: " + alias + " (" + device->device.deviceId + ")")) {
            out_ << "Unpair cancelled" << std::endl;
            return 0;
        }

        auto result = pairing.unpairDevice(alias, dependencies_.now());
        if (!result) {
            return fail("Failed to unpair device: " + result.errorMessage);
        }
        dependencies_.pairingStore->saveTable(pairing);

        out_ << "Device '" << alias << "' unpaired successfully" << std::endl;
        return 0;
    } catch (const StoreError& e) {
        return fail(e.what());
    }
}

int CommandRunner::listPaired(bool verbose) {
    PairingTable pairing;
    try {
        pairing = dependencies_.pairingStore->loadTable();
    } catch (const StoreError& e) {
        return fail(e.what());
    }

    const auto devices = pairing.pairedDevices();
    if (devices.empty()) {
        out_ << "No paired devices found\n"
             << "   Use 'pair --device-id <id> --alias <alias>' to pair a device" << std::endl;
        return 0;
    }

    const auto now = dependencies_.now();
    out_ << "Paired devices (" << devices.size() << "):" << std::endl;
    for (const auto& paired : devices) {
        const bool recentlySeen = paired.lastSeen + RECENTLY_SEEN_SECONDS > now;
        out_ << "  " << (recentlySeen ? "[online] " : "[offline] ")
             << paired.alias << " (" << paired.device.ipAddress << ")" << std::endl;

        if (verbose) {
            out_ << "     Device ID: " << paired.device.deviceId << "\n"
                 << "     MAC: " << paired.device.macAddress << "\n"
                 << "     Type: " << paired.device.deviceType << "\n"
                 << "     Paired: " << device_store::formatRelativeTime(paired.pairedAt, now) << "\n"
                 << "     Last seen: " << device_store::formatRelativeTime(paired.lastSeen, now) << "\n"
                 << std::endl;
        }
    }

    if (!verbose) {
        out_ << "   Use --verbose for detailed information" << std::endl;
    }
    return 0;
}

int CommandRunner::clearCache(bool force) {
    const auto& file = dependencies_.cacheStore->file();
    if (!file.exists()) {
        out_ << "No cache file found" << std::endl;
        return 0;
    }

    if (!force && !confirm("This will delete the cache file at: " + file.path().string())) {
        out_ << "Cache clear cancelled" << std::endl;
        return 0;
    }

    try {
        file.clear();
    } catch (const StoreError& e) {
        return fail(std::string("Failed to clear cache: ") + e.what());
    }

    out_ << "Cache cleared successfully" << std::endl;
    return 0;
}

std::unique_ptr<plug_session::SessionController> CommandRunner::openSession(const TargetOptions& target) {
    auto resolved = resolveTarget(target, *dependencies_.pairingStore);
    if (!resolved) {
        spdlog::error("Failed to resolve device info: {}", resolved.errorMessage);
        out_ << "Error: " << resolved.errorMessage << std::endl;
        return nullptr;
    }

    spdlog::debug("Resolved device info - ip: {}, device_id: {}", resolved.value.ipAddress, resolved.value.deviceId);
    return dependencies_.sessionFactory(resolved.value);
}

plug_discovery::DiscoveryService CommandRunner::makeDiscoveryService(bool useCache, std::chrono::seconds cacheMaxAge) const {
    plug_discovery::DiscoveryService::Config serviceConfig;
    serviceConfig.useCache = useCache;
    serviceConfig.cacheMaxAge = cacheMaxAge;

    return plug_discovery::DiscoveryService(serviceConfig,
                                            dependencies_.scan,
                                            dependencies_.cacheStore,
                                            dependencies_.pairingStore,
                                            dependencies_.now);
}

PairingTable CommandRunner::loadPairingOrEmpty() const {
    try {
        return dependencies_.pairingStore->loadTable();
    } catch (const StoreError& e) {
        spdlog::warn("Could not load pairing data: {}", e.what());
        return PairingTable{};
    }
}

bool CommandRunner::confirm(const std::string& warning) {
    out_ << "Warning: " << warning << "\n"
         << "Are you sure? (y/N): " << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
        return false;
    }

    const auto first = std::find_if(answer.begin(), answer.end(),
                                    [](unsigned char c) { return !std::isspace(c); });
    return first != answer.end() && std::tolower(static_cast<unsigned char>(*first)) == 'y';
}

int CommandRunner::fail(const std::string& message) {
    out_ << "Error: " << message << std::endl;
    return 1;
}

} // namespace plugctl

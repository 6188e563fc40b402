#pragma once

#include "plug_discovery/types.hpp"

#include "device_store/interfaces.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace plug_discovery {

/**
 * @class DiscoveryService
 * @brief Network discovery combined with the persistent device cache
 *
 * Every successful scan is merged with the fresh cached devices, written
 * back to the cache and used to refresh paired devices.
 */
class DiscoveryService {
public:
    struct Config {
        bool useCache = true;
        std::chrono::seconds cacheMaxAge{3600};
    };

    // Scans the network for the given duration
    using NetworkScan = std::function<Result<std::vector<DeviceRecord>>(std::chrono::milliseconds)>;
    using NowFunction = std::function<device_store::Timestamp()>;

    DiscoveryService(const Config& config,
                     NetworkScan scan,
                     std::shared_ptr<device_store::ICacheStore> cacheStore,
                     std::shared_ptr<device_store::IPairingStore> pairingStore,
                     NowFunction now = device_store::currentTimestamp);

    /**
     * @brief Scan the network and merge the result with the cache
     *
     * Network records win over cached ones with the same id. Cache read and
     * write failures only produce warnings; a failed scan is returned
     * before anything is written.
     */
    Result<std::vector<DeviceRecord>> discover(std::chrono::milliseconds duration);

    /**
     * @brief Fresh cached devices, without touching the network
     */
    Result<std::vector<DeviceRecord>> discoverFromCacheOnly();

    const Config& getConfig() const { return config_; }

private:
    std::vector<DeviceRecord> loadFreshCached(device_store::Timestamp now);
    void updateCache(const std::vector<DeviceRecord>& records, device_store::Timestamp now);
    void refreshPairedDevices(const std::vector<DeviceRecord>& records);

    Config config_;
    NetworkScan scan_;
    std::shared_ptr<device_store::ICacheStore> cacheStore_;
    std::shared_ptr<device_store::IPairingStore> pairingStore_;
    NowFunction now_;
};

} // namespace plug_discovery

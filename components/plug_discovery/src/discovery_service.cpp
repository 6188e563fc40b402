#include "plug_discovery/discovery_service.hpp"

#include "device_store/device_cache.hpp"

#include <unordered_set>

#include <spdlog/spdlog.h>

namespace plug_discovery {

using device_store::DeviceCache;
using device_store::Timestamp;

DiscoveryService::DiscoveryService(const Config& config,
                                   NetworkScan scan,
                                   std::shared_ptr<device_store::ICacheStore> cacheStore,
                                   std::shared_ptr<device_store::IPairingStore> pairingStore,
                                   NowFunction now)
    : config_(config)
    , scan_(std::move(scan))
    , cacheStore_(std::move(cacheStore))
    , pairingStore_(std::move(pairingStore))
    , now_(std::move(now))
{
}

Result<std::vector<DeviceRecord>> DiscoveryService::discover(std::chrono::milliseconds duration) {
    const bool cacheEnabled = config_.useCache && cacheStore_;

    std::vector<DeviceRecord> cached;
    if (cacheEnabled) {
        cached = loadFreshCached(now_());
        spdlog::debug("Found {} fresh devices in cache", cached.size());
    }

    auto scanResult = scan_(duration);
    if (!scanResult) {
        return scanResult;
    }

    // Network records first, then cached devices that did not answer this time
    std::vector<DeviceRecord> merged = scanResult.value;
    std::unordered_set<DeviceId> seen;
    for (const auto& record : merged) {
        seen.insert(record.deviceId);
    }
    for (const auto& record : cached) {
        if (seen.insert(record.deviceId).second) {
            merged.push_back(record);
        }
    }

    if (cacheEnabled) {
        updateCache(merged, now_());
    }

    refreshPairedDevices(merged);

    return Result<std::vector<DeviceRecord>>::ok(merged);
}

Result<std::vector<DeviceRecord>> DiscoveryService::discoverFromCacheOnly() {
    if (!cacheStore_) {
        return Result<std::vector<DeviceRecord>>::error(ErrorCode::STORE_ERROR, "No device cache configured");
    }

    auto loadResult = cacheStore_->load();
    if (!loadResult) {
        return Result<std::vector<DeviceRecord>>::propagate(loadResult);
    }

    DeviceCache cache(std::move(loadResult.value), 0);
    auto fresh = cache.freshDevices(static_cast<Timestamp>(config_.cacheMaxAge.count()), now_());
    spdlog::info("Found {} devices in cache", fresh.size());
    return Result<std::vector<DeviceRecord>>::ok(fresh);
}

std::vector<DeviceRecord> DiscoveryService::loadFreshCached(Timestamp now) {
    auto loadResult = cacheStore_->load();
    if (!loadResult) {
        spdlog::warn("Could not load device cache: {}", loadResult.errorMessage);
        return {};
    }

    DeviceCache cache(std::move(loadResult.value), 0);
    return cache.freshDevices(static_cast<Timestamp>(config_.cacheMaxAge.count()), now);
}

void DiscoveryService::updateCache(const std::vector<DeviceRecord>& records, Timestamp now) {
    auto loadResult = cacheStore_->load();
    if (!loadResult) {
        spdlog::warn("Could not load device cache, rebuilding it: {}", loadResult.errorMessage);
    }

    DeviceCache cache(loadResult ? std::move(loadResult.value) : device_store::CachedDeviceMap{}, 0);
    for (const auto& record : records) {
        cache.addDevice(record, now);
    }
    cache.removeOldDevices(static_cast<Timestamp>(config_.cacheMaxAge.count()) * 2, now);

    auto saveResult = cacheStore_->save(cache.devices());
    if (!saveResult) {
        spdlog::warn("Could not save device cache: {}", saveResult.errorMessage);
    } else {
        spdlog::debug("Updated cache with {} devices", records.size());
    }
}

void DiscoveryService::refreshPairedDevices(const std::vector<DeviceRecord>& records) {
    if (!pairingStore_) {
        return;
    }

    size_t updated = 0;
    for (const auto& record : records) {
        if (pairingStore_->recordSighting(record)) {
            ++updated;
        }
    }
    if (updated > 0) {
        spdlog::debug("Refreshed {} paired devices", updated);
    }
}

} // namespace plug_discovery

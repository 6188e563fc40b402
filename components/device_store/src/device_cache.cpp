// components/device_store/src/device_cache.cpp
#include "device_store/device_cache.hpp"

#include <spdlog/spdlog.h>

namespace device_store {

DeviceCache::DeviceCache(CachedDeviceMap devices, Timestamp lastUpdated)
    : devices_(std::move(devices))
    , lastUpdated_(lastUpdated)
{
}

void DeviceCache::addDevice(const DeviceRecord& record, Timestamp now) {
    auto it = devices_.find(record.deviceId);
    if (it != devices_.end()) {
        it->second.device = record;
        it->second.lastSeen = now;
        ++it->second.discoveryCount;
    } else {
        CachedDevice cached;
        cached.device = record;
        cached.lastSeen = now;
        cached.discoveryCount = 1;
        devices_.emplace(record.deviceId, std::move(cached));
    }
    lastUpdated_ = now;
}

std::vector<DeviceRecord> DeviceCache::freshDevices(Timestamp maxAgeSeconds, Timestamp now) const {
    const Timestamp oldest = cutoff(maxAgeSeconds, now);

    std::vector<DeviceRecord> fresh;
    for (const auto& entry : devices_) {
        if (entry.second.lastSeen >= oldest) {
            fresh.push_back(entry.second.device);
        }
    }
    return fresh;
}

size_t DeviceCache::removeOldDevices(Timestamp maxAgeSeconds, Timestamp now) {
    const Timestamp oldest = cutoff(maxAgeSeconds, now);

    size_t removedCount = 0;
    for (auto it = devices_.begin(); it != devices_.end();) {
        if (it->second.lastSeen < oldest) {
            it = devices_.erase(it);
            ++removedCount;
        } else {
            ++it;
        }
    }
    lastUpdated_ = now;

    if (removedCount > 0) {
        spdlog::debug("Removed {} stale devices from cache", removedCount);
    }
    return removedCount;
}

} // namespace device_store

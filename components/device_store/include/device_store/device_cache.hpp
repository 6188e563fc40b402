// components/device_store/include/device_store/device_cache.hpp
#pragma once

#include "device_store/types.hpp"

#include <vector>

namespace device_store {

/**
 * @class DeviceCache
 * @brief Devices seen by discovery, with when they were last seen
 *
 * Every method takes the current time explicitly so freshness rules can be
 * tested without waiting.
 */
class DeviceCache {
public:
    DeviceCache() = default;
    DeviceCache(CachedDeviceMap devices, Timestamp lastUpdated);

    /**
     * @brief Insert a device or refresh an existing entry
     *
     * A new entry starts with a discovery count of 1; a known device gets
     * the new record, lastSeen = now and an incremented count.
     */
    void addDevice(const DeviceRecord& record, Timestamp now);

    /**
     * @brief Records seen within the last maxAgeSeconds
     */
    std::vector<DeviceRecord> freshDevices(Timestamp maxAgeSeconds, Timestamp now) const;

    /**
     * @brief Drop entries not seen within the last maxAgeSeconds
     * @return Number of entries removed
     */
    size_t removeOldDevices(Timestamp maxAgeSeconds, Timestamp now);

    const CachedDeviceMap& devices() const { return devices_; }
    Timestamp lastUpdated() const { return lastUpdated_; }
    size_t size() const { return devices_.size(); }
    bool empty() const { return devices_.empty(); }

private:
    static Timestamp cutoff(Timestamp maxAgeSeconds, Timestamp now) {
        return now > maxAgeSeconds ? now - maxAgeSeconds : 0;
    }

    CachedDeviceMap devices_;
    Timestamp lastUpdated_ = 0;
};

} // namespace device_store

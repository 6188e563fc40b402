// components/device_store/include/device_store/interfaces.hpp
#pragma once

#include "device_store/types.hpp"

#include <optional>
#include <string>

namespace device_store {

/**
 * @class ICacheStore
 * @brief Persistence for devices seen by earlier discovery runs
 */
class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    /**
     * @brief Load every cached device
     * @return Map keyed by device id, empty if nothing was cached yet
     */
    virtual Result<CachedDeviceMap> load() = 0;

    /**
     * @brief Replace the cached devices
     */
    virtual VoidResult save(const CachedDeviceMap& devices) = 0;
};

/**
 * @class IPairingStore
 * @brief Lookup and refresh of alias-paired devices
 */
class IPairingStore {
public:
    virtual ~IPairingStore() = default;

    /**
     * @brief Find the device paired under an alias
     * @return Address and id, or std::nullopt if the alias is unknown
     */
    virtual std::optional<DeviceTarget> resolve(const std::string& alias) = 0;

    /**
     * @brief Refresh a paired device from a new sighting
     * @return true if the device is paired and its record was updated
     */
    virtual bool recordSighting(const DeviceRecord& record) = 0;
};

} // namespace device_store

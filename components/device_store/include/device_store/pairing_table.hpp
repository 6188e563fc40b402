// components/device_store/include/device_store/pairing_table.hpp
#pragma once

#include "device_store/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace device_store {

/**
 * @class PairingTable
 * @brief Alias to device mapping chosen by the user
 *
 * A device has at most one alias and an alias names at most one device.
 */
class PairingTable {
public:
    using DeviceMap = std::map<DeviceId, PairedDevice>;
    using AliasMap = std::map<std::string, DeviceId>;

    PairingTable() = default;
    PairingTable(DeviceMap devices, AliasMap aliases, Timestamp lastUpdated);

    /**
     * @brief Pair a device under an alias
     *
     * Re-pairing an already paired device drops its previous alias.
     *
     * @return INVALID_ARGUMENT if the alias is empty or already in use
     */
    VoidResult pairDevice(const DeviceRecord& record, const std::string& alias, Timestamp now);

    /**
     * @brief Remove the device paired under an alias
     * @return NOT_FOUND if no device has that alias
     */
    VoidResult unpairDevice(const std::string& alias, Timestamp now);

    std::optional<PairedDevice> deviceByAlias(const std::string& alias) const;

    /**
     * @brief Alias of a paired device, if it has one
     */
    std::optional<std::string> aliasFor(const DeviceId& deviceId) const;

    /**
     * @brief All paired devices, ordered by alias
     */
    std::vector<PairedDevice> pairedDevices() const;

    /**
     * @brief Replace the stored record of a paired device and mark it seen
     * @return true if the device is paired
     */
    bool updateDeviceInfo(const DeviceRecord& record, Timestamp now);

    const DeviceMap& devices() const { return devices_; }
    const AliasMap& aliases() const { return aliases_; }
    Timestamp lastUpdated() const { return lastUpdated_; }
    size_t size() const { return devices_.size(); }
    bool empty() const { return devices_.empty(); }

private:
    DeviceMap devices_;
    AliasMap aliases_;
    Timestamp lastUpdated_ = 0;
};

} // namespace device_store

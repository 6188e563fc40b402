#pragma once

#include "plug_discovery/types.hpp"

#include <mutex>
#include <unordered_set>
#include <vector>

namespace plug_discovery {

/**
 * @class DeviceRegistry
 * @brief Thread-safe set of discovered devices keyed by device id
 *
 * The first record seen for an id is kept; later ones are refused.
 * Records are returned in the order they were first seen.
 */
class DeviceRegistry {
public:
    /**
     * @brief Store the record unless its id is already known
     * @return true if the record was inserted
     */
    bool insertIfAbsent(const DeviceRecord& record);

    bool contains(const DeviceId& deviceId) const;
    size_t size() const;
    std::vector<DeviceRecord> snapshot() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<DeviceRecord> records_;
    std::unordered_set<DeviceId> ids_;
};

} // namespace plug_discovery

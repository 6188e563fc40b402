#include "plug_discovery/device_registry.hpp"

namespace plug_discovery {

bool DeviceRegistry::insertIfAbsent(const DeviceRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ids_.insert(record.deviceId).second) {
        return false;
    }
    records_.push_back(record);
    return true;
}

bool DeviceRegistry::contains(const DeviceId& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.count(deviceId) > 0;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::vector<DeviceRecord> DeviceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

void DeviceRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    ids_.clear();
}

} // namespace plug_discovery

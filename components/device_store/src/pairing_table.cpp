// components/device_store/src/pairing_table.cpp
#include "device_store/pairing_table.hpp"

#include <spdlog/spdlog.h>

namespace device_store {

PairingTable::PairingTable(DeviceMap devices, AliasMap aliases, Timestamp lastUpdated)
    : devices_(std::move(devices))
    , aliases_(std::move(aliases))
    , lastUpdated_(lastUpdated)
{
}

VoidResult PairingTable::pairDevice(const DeviceRecord& record, const std::string& alias, Timestamp now) {
    spdlog::debug("Attempting to pair device {} with alias '{}'", record.deviceId, alias);

    if (alias.empty()) {
        return makeErrorResult(ErrorCode::INVALID_ARGUMENT, "Alias must not be empty");
    }

    if (aliases_.count(alias) > 0) {
        spdlog::warn("Pairing failed: alias '{}' is already in use", alias);
        return makeErrorResult(ErrorCode::INVALID_ARGUMENT, "Alias '" + alias + "' is already in use");
    }

    auto existing = devices_.find(record.deviceId);
    if (existing != devices_.end()) {
        spdlog::info("Removing old pairing for device {}: alias '{}'", record.deviceId, existing->second.alias);
        aliases_.erase(existing->second.alias);
    }

    PairedDevice paired;
    paired.device = record;
    paired.alias = alias;
    paired.pairedAt = now;
    paired.lastSeen = now;

    devices_[record.deviceId] = std::move(paired);
    aliases_[alias] = record.deviceId;
    lastUpdated_ = now;

    spdlog::info("Successfully paired device {} with alias '{}'", record.deviceId, alias);
    return makeSuccessResult();
}

VoidResult PairingTable::unpairDevice(const std::string& alias, Timestamp now) {
    auto it = aliases_.find(alias);
    if (it == aliases_.end()) {
        spdlog::warn("Unpair failed: no device found with alias '{}'", alias);
        return makeErrorResult(ErrorCode::NOT_FOUND, "No device found with alias '" + alias + "'");
    }

    const DeviceId deviceId = it->second;
    devices_.erase(deviceId);
    aliases_.erase(it);
    lastUpdated_ = now;

    spdlog::info("Successfully unpaired device {} (alias: '{}')", deviceId, alias);
    return makeSuccessResult();
}

std::optional<PairedDevice> PairingTable::deviceByAlias(const std::string& alias) const {
    auto alias_it = aliases_.find(alias);
    if (alias_it == aliases_.end()) {
        return std::nullopt;
    }

    auto device_it = devices_.find(alias_it->second);
    if (device_it == devices_.end()) {
        return std::nullopt;
    }
    return device_it->second;
}

std::optional<std::string> PairingTable::aliasFor(const DeviceId& deviceId) const {
    auto it = devices_.find(deviceId);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second.alias;
}

std::vector<PairedDevice> PairingTable::pairedDevices() const {
    std::vector<PairedDevice> result;
    result.reserve(aliases_.size());
    for (const auto& entry : aliases_) {
        auto it = devices_.find(entry.second);
        if (it != devices_.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

bool PairingTable::updateDeviceInfo(const DeviceRecord& record, Timestamp now) {
    auto it = devices_.find(record.deviceId);
    if (it == devices_.end()) {
        return false;
    }

    it->second.device = record;
    it->second.lastSeen = now;
    lastUpdated_ = now;
    return true;
}

} // namespace device_store

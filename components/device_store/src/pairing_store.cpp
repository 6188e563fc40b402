// components/device_store/src/pairing_store.cpp
#include "device_store/pairing_store.hpp"
#include "device_store/error.hpp"

#include <spdlog/spdlog.h>

namespace device_store {

PairingStore::PairingStore(StoreFile file, NowFunction now)
    : file_(std::move(file))
    , now_(std::move(now))
{
}

std::optional<DeviceTarget> PairingStore::resolve(const std::string& alias) {
    try {
        const auto paired = loadTable().deviceByAlias(alias);
        if (!paired) {
            spdlog::debug("No paired device with alias '{}'", alias);
            return std::nullopt;
        }
        return DeviceTarget{paired->device.ipAddress, paired->device.deviceId};
    } catch (const StoreError& e) {
        spdlog::warn("Failed to resolve alias '{}': {}", alias, e.what());
        return std::nullopt;
    }
}

bool PairingStore::recordSighting(const DeviceRecord& record) {
    try {
        PairingTable table = loadTable();
        if (!table.updateDeviceInfo(record, now_())) {
            return false;
        }
        saveTable(table);
        spdlog::debug("Updated paired device {} at {}", record.deviceId, record.ipAddress);
        return true;
    } catch (const StoreError& e) {
        spdlog::warn("Failed to update paired device {}: {}", record.deviceId, e.what());
        return false;
    }
}

PairingTable PairingStore::loadTable() const {
    StoreDocument document = file_.load();
    if (!document.pairing) {
        return PairingTable{};
    }
    return std::move(*document.pairing);
}

void PairingStore::saveTable(const PairingTable& table) const {
    StoreDocument document = file_.load();
    document.pairing = table;
    file_.save(document);
}

} // namespace device_store

// components/device_store/src/json_codec.cpp
#include "device_store/json_codec.hpp"

namespace device_store {

nlohmann::json JsonCodec::toJson(const DeviceRecord& record) {
    nlohmann::json json;
    json["device_id"] = record.deviceId;
    json["device_key"] = record.deviceKey;
    json["ip_address"] = record.ipAddress;
    json["mac_address"] = record.macAddress;
    json["name"] = record.name;
    json["device_type"] = record.deviceType;
    json["state"] = plug_protocol::toString(record.state);
    json["power_consumption"] = record.powerConsumption;
    return json;
}

DeviceRecord JsonCodec::deviceRecordFromJson(const nlohmann::json& json) {
    DeviceRecord record;
    record.deviceId = json.at("device_id").get<std::string>();
    record.deviceKey = json.at("device_key").get<std::string>();
    record.ipAddress = json.at("ip_address").get<std::string>();
    record.macAddress = json.at("mac_address").get<std::string>();
    record.name = json.at("name").get<std::string>();
    record.deviceType = json.at("device_type").get<std::string>();
    record.state = plug_protocol::deviceStateFromString(json.at("state").get<std::string>());
    record.powerConsumption = json.at("power_consumption").get<uint16_t>();
    return record;
}

nlohmann::json JsonCodec::toJson(const DeviceCache& cache) {
    nlohmann::json devicesJson = nlohmann::json::object();
    for (const auto& [deviceId, cached] : cache.devices()) {
        devicesJson[deviceId] = {
            {"device", toJson(cached.device)},
            {"last_seen", cached.lastSeen},
            {"discovery_count", cached.discoveryCount}
        };
    }

    nlohmann::json json;
    json["devices"] = devicesJson;
    json["last_updated"] = cache.lastUpdated();
    return json;
}

DeviceCache JsonCodec::deviceCacheFromJson(const nlohmann::json& json) {
    CachedDeviceMap devices;
    for (const auto& [deviceId, entryJson] : json.at("devices").items()) {
        CachedDevice cached;
        cached.device = deviceRecordFromJson(entryJson.at("device"));
        cached.lastSeen = entryJson.at("last_seen").get<Timestamp>();
        cached.discoveryCount = entryJson.at("discovery_count").get<uint32_t>();
        devices.emplace(deviceId, std::move(cached));
    }
    return DeviceCache(std::move(devices), json.at("last_updated").get<Timestamp>());
}

nlohmann::json JsonCodec::toJson(const PairingTable& table) {
    nlohmann::json devicesJson = nlohmann::json::object();
    for (const auto& [deviceId, paired] : table.devices()) {
        devicesJson[deviceId] = {
            {"device", toJson(paired.device)},
            {"alias", paired.alias},
            {"paired_at", paired.pairedAt},
            {"last_seen", paired.lastSeen}
        };
    }

    nlohmann::json aliasesJson = nlohmann::json::object();
    for (const auto& [alias, deviceId] : table.aliases()) {
        aliasesJson[alias] = deviceId;
    }

    nlohmann::json json;
    json["devices"] = devicesJson;
    json["aliases"] = aliasesJson;
    json["last_updated"] = table.lastUpdated();
    return json;
}

PairingTable JsonCodec::pairingTableFromJson(const nlohmann::json& json) {
    PairingTable::DeviceMap devices;
    for (const auto& [deviceId, entryJson] : json.at("devices").items()) {
        PairedDevice paired;
        paired.device = deviceRecordFromJson(entryJson.at("device"));
        paired.alias = entryJson.at("alias").get<std::string>();
        paired.pairedAt = entryJson.at("paired_at").get<Timestamp>();
        paired.lastSeen = entryJson.at("last_seen").get<Timestamp>();
        devices.emplace(deviceId, std::move(paired));
    }

    PairingTable::AliasMap aliases;
    for (const auto& [alias, deviceIdJson] : json.at("aliases").items()) {
        aliases.emplace(alias, deviceIdJson.get<std::string>());
    }

    return PairingTable(std::move(devices), std::move(aliases), json.at("last_updated").get<Timestamp>());
}

} // namespace device_store

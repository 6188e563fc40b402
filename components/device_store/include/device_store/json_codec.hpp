// components/device_store/include/device_store/json_codec.hpp
#pragma once

#include "device_store/device_cache.hpp"
#include "device_store/pairing_table.hpp"

#include <nlohmann/json.hpp>

namespace device_store {

/**
 * @brief JSON mapping of the store file sections
 *
 * Keys are snake_case so files written by earlier releases keep loading.
 * The from* functions throw nlohmann::json::exception on missing or
 * mistyped fields; StoreFile turns those into StoreError.
 */
class JsonCodec {
public:
    static nlohmann::json toJson(const DeviceRecord& record);
    static DeviceRecord deviceRecordFromJson(const nlohmann::json& json);

    static nlohmann::json toJson(const DeviceCache& cache);
    static DeviceCache deviceCacheFromJson(const nlohmann::json& json);

    static nlohmann::json toJson(const PairingTable& table);
    static PairingTable pairingTableFromJson(const nlohmann::json& json);
};

} // namespace device_store

// components/device_store/src/cache_store.cpp
#include "device_store/cache_store.hpp"
#include "device_store/error.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace device_store {

CacheStore::CacheStore(StoreFile file)
    : file_(std::move(file))
{
}

Result<CachedDeviceMap> CacheStore::load() {
    try {
        return Result<CachedDeviceMap>::ok(loadCache().devices());
    } catch (const StoreError& e) {
        return Result<CachedDeviceMap>::error(ErrorCode::STORE_ERROR, e.what());
    }
}

VoidResult CacheStore::save(const CachedDeviceMap& devices) {
    try {
        Timestamp lastUpdated = 0;
        for (const auto& entry : devices) {
            lastUpdated = std::max(lastUpdated, entry.second.lastSeen);
        }
        saveCache(DeviceCache(devices, lastUpdated));
        return makeSuccessResult();
    } catch (const StoreError& e) {
        return makeErrorResult(ErrorCode::STORE_ERROR, e.what());
    }
}

DeviceCache CacheStore::loadCache() const {
    StoreDocument document = file_.load();
    if (!document.cache) {
        return DeviceCache{};
    }
    spdlog::debug("Loaded {} cached devices", document.cache->size());
    return std::move(*document.cache);
}

void CacheStore::saveCache(const DeviceCache& cache) const {
    StoreDocument document = file_.load();
    document.cache = cache;
    file_.save(document);
    spdlog::debug("Saved {} devices to cache", cache.size());
}

} // namespace device_store

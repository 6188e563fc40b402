// components/device_store/include/device_store/cache_store.hpp
#pragma once

#include "device_store/interfaces.hpp"
#include "device_store/store_file.hpp"

namespace device_store {

/**
 * @class CacheStore
 * @brief Cache section of the store file
 */
class CacheStore : public ICacheStore {
public:
    explicit CacheStore(StoreFile file);

    Result<CachedDeviceMap> load() override;
    VoidResult save(const CachedDeviceMap& devices) override;

    /**
     * @brief Load the cache section, empty if the file has none
     * @throws StoreError
     */
    DeviceCache loadCache() const;

    /**
     * @brief Replace the cache section, leaving the pairing section as it is
     * @throws StoreError
     */
    void saveCache(const DeviceCache& cache) const;

    const StoreFile& file() const { return file_; }

private:
    StoreFile file_;
};

} // namespace device_store

// components/device_store/include/device_store/pairing_store.hpp
#pragma once

#include "device_store/interfaces.hpp"
#include "device_store/store_file.hpp"

#include <functional>

namespace device_store {

/**
 * @class PairingStore
 * @brief Pairing section of the store file
 */
class PairingStore : public IPairingStore {
public:
    using NowFunction = std::function<Timestamp()>;

    explicit PairingStore(StoreFile file, NowFunction now = currentTimestamp);

    std::optional<DeviceTarget> resolve(const std::string& alias) override;

    /**
     * @brief Refresh a paired device and persist the change
     *
     * Failures to read or write the store are logged and reported as false.
     */
    bool recordSighting(const DeviceRecord& record) override;

    /**
     * @brief Load the pairing section, empty if the file has none
     * @throws StoreError
     */
    PairingTable loadTable() const;

    /**
     * @brief Replace the pairing section, leaving the cache section as it is
     * @throws StoreError
     */
    void saveTable(const PairingTable& table) const;

    const StoreFile& file() const { return file_; }

private:
    StoreFile file_;
    NowFunction now_;
};

} // namespace device_store

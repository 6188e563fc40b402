// components/device_store/include/device_store/store_file.hpp
#pragma once

#include "device_store/device_cache.hpp"
#include "device_store/pairing_table.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace device_store {

// Whole content of the store file
struct StoreDocument {
    std::string version = STORE_VERSION;
    std::optional<DeviceCache> cache;
    std::optional<PairingTable> pairing;
};

/**
 * @class StoreFile
 * @brief JSON file holding the device cache and the pairing table
 *
 * load() and save() throw StoreError on I/O or parse failures.
 */
class StoreFile {
public:
    explicit StoreFile(std::filesystem::path path);

    /**
     * @brief Read the whole document
     *
     * A missing file, or one written by a different version, yields an
     * empty document.
     */
    StoreDocument load() const;

    /**
     * @brief Rewrite the whole file, creating parent directories as needed
     */
    void save(const StoreDocument& document) const;

    /**
     * @brief Delete the file if it exists
     */
    void clear() const;

    bool exists() const;
    const std::filesystem::path& path() const { return path_; }

    /**
     * @brief switcher_config.json in the directory of the running executable
     */
    static std::filesystem::path defaultPath();

private:
    std::filesystem::path path_;
};

} // namespace device_store

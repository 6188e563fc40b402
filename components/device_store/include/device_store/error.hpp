#pragma once

#include <stdexcept>
#include <string>

namespace device_store {

/**
 * @brief Thrown when the store file cannot be read, parsed or written
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error("Store error: " + message) {}
};

} // namespace device_store

#pragma once

#include "device_store/interfaces.hpp"

#include <optional>
#include <string>

namespace plugctl {

using device_store::DeviceTarget;
using plug_protocol::ErrorCode;
using plug_protocol::Result;

/**
 * @brief Device selection as given on the command line
 */
struct TargetOptions {
    std::optional<std::string> ipAddress;
    std::optional<std::string> deviceId;
    std::optional<std::string> alias;
};

/**
 * @brief Turn --ip/--device-id or --alias into a device address and id
 *
 * Exactly one of the two forms must be given. An alias is looked up in the
 * pairing store.
 *
 * @return INVALID_ARGUMENT for a bad combination, NOT_FOUND for an
 *         unknown alias
 */
Result<DeviceTarget> resolveTarget(const TargetOptions& options, device_store::IPairingStore& pairingStore);

} // namespace plugctl
